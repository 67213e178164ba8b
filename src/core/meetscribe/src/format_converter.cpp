#include "meetscribe/format_converter.hpp"

#include "meetscribe/wav_utils.hpp"

#include <meetscribe_common/shell_utils.hpp>
#include <meetscribe_common/string_utils.hpp>

#include "rclcpp/rclcpp.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

using namespace std;


namespace meetscribe
{
namespace
{

rclcpp::Logger converter_logger()
{
  return rclcpp::get_logger("meetscribe.format_converter");
}

}  // namespace

FfmpegFormatConverter::FfmpegFormatConverter(const FfmpegConverterConfig & config)
: config_(config)
{
}

ConversionResult FfmpegFormatConverter::ensure_compatible_format(
  const string & input_path, TempFileRegistry & registry)
{
  ConversionResult out;
  error_code ec;
  if (!filesystem::is_regular_file(input_path, ec) || filesystem::file_size(input_path, ec) == 0) {
    out.status = make_error(ErrorCode::AUDIO_FORMAT_ERROR, "audio file is missing or empty");
    return out;
  }

  const string ext = meetscribe_common::file_extension(input_path);
  if (ext == ".wav") {
    const WavInfo info = probe_wav(input_path);
    if (info.valid && info.audio_format == 1 && info.bits_per_sample == 16 &&
      info.channels == config_.channels && info.sample_rate == config_.sample_rate)
    {
      out.path = input_path;
      return out;
    }
  }

  if (ext == ".pcm" || ext == ".raw") {
    vector<uint8_t> pcm;
    if (!read_file_bytes(input_path, pcm) || pcm.size() % 2 != 0) {
      out.status = make_error(ErrorCode::AUDIO_FORMAT_ERROR, "raw pcm upload is not 16-bit aligned");
      return out;
    }
    if (config_.raw_pcm_sample_rate == config_.sample_rate && config_.channels == 1) {
      const string wrapped = registry.allocate("wrapped", ".wav");
      if (!write_pcm16_wav(wrapped, pcm, config_.sample_rate, 1)) {
        out.status = make_error(ErrorCode::INTERNAL_ERROR, "failed to write " + wrapped);
        return out;
      }
      out.path = wrapped;
      return out;
    }
  }

  const string output = registry.allocate("converted", ".wav");
  ostringstream cmd;
  cmd << config_.ffmpeg_path << " -hide_banner -loglevel error -nostdin -y";
  if (ext == ".pcm" || ext == ".raw") {
    cmd << " -f s16le -ar " << config_.raw_pcm_sample_rate << " -ac 1";
  }
  cmd << " -i " << meetscribe_common::shell_escape_single_quote(input_path)
      << " -ar " << config_.sample_rate
      << " -ac " << config_.channels
      << " -c:a pcm_s16le -f wav"
      << " " << meetscribe_common::shell_escape_single_quote(output) << " 2>&1";

  RCLCPP_INFO(converter_logger(), "converting %s to %u Hz wav", input_path.c_str(), config_.sample_rate);
  const meetscribe_common::ShellResult result = meetscribe_common::run_shell_command(cmd.str());
  if (!result.ok) {
    ostringstream msg;
    msg << "ffmpeg conversion failed";
    if (result.exit_code >= 0) {
      msg << " with code " << result.exit_code;
    }
    out.status = make_error(
      ErrorCode::AUDIO_FORMAT_ERROR, msg.str(), meetscribe_common::trim(result.output));
    return out;
  }

  const WavInfo converted = probe_wav(output);
  if (!converted.valid) {
    out.status = make_error(
      ErrorCode::AUDIO_FORMAT_ERROR, "ffmpeg produced an unreadable wav: " + converted.error);
    return out;
  }
  out.path = output;
  return out;
}

}  // namespace meetscribe
