#pragma once

#include "meetscribe/errors.hpp"
#include "meetscribe/temp_files.hpp"

#include <cstdint>
#include <string>

namespace meetscribe
{

struct ConversionResult
{
  Status status;
  std::string path;    ///< input path when already compatible, else a registry-owned file
};

/// Brings an upload to 16 kHz mono PCM16 WAV. Files it creates belong to
/// the caller's registry.
class FormatConverter
{
public:
  virtual ~FormatConverter() = default;

  virtual ConversionResult ensure_compatible_format(
    const std::string & input_path, TempFileRegistry & registry) = 0;
};

struct FfmpegConverterConfig
{
  std::string ffmpeg_path = "ffmpeg";
  uint32_t sample_rate = 16000;
  uint16_t channels = 1;
  /// Sample rate assumed for headerless .pcm/.raw uploads
  uint32_t raw_pcm_sample_rate = 16000;
};

class FfmpegFormatConverter : public FormatConverter
{
public:
  explicit FfmpegFormatConverter(const FfmpegConverterConfig & config = FfmpegConverterConfig());

  ConversionResult ensure_compatible_format(
    const std::string & input_path, TempFileRegistry & registry) override;

private:
  FfmpegConverterConfig config_;
};

}  // namespace meetscribe
