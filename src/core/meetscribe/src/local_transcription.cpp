#include "meetscribe/local_transcription.hpp"

#include "meetscribe/temp_files.hpp"

#include <meetscribe_common/string_utils.hpp>

#include <algorithm>
#include <chrono>

using namespace std;


namespace meetscribe
{
namespace
{

constexpr double kBytesPerSample = 2.0;

TranscriptResult run_file_transcription(
  const SubprocessCommand & command,
  const string & operation,
  const vector<uint8_t> & audio,
  const TranscriptionOptions & options,
  const string & temp_directory,
  const string & language,
  const vector<string> & trailing_args,
  long timeout_ms)
{
  TranscriptResult out;
  if (audio.empty()) {
    out.status = make_error(ErrorCode::INVALID_INPUT, "audio is empty");
    return out;
  }

  const string ext = meetscribe_common::file_extension(options.filename);
  ScopedTempFile audio_file(temp_directory, "asr", ext.empty() ? ".wav" : ext);
  if (!audio_file.write(audio)) {
    out.status = make_error(ErrorCode::INTERNAL_ERROR, "failed to write " + audio_file.path());
    return out;
  }

  vector<string> args = {audio_file.path(), language};
  args.insert(args.end(), trailing_args.begin(), trailing_args.end());
  const OneShotResult run = run_one_shot(
    command, operation, args, chrono::milliseconds(timeout_ms));
  if (!run.status.ok) {
    out.status = run.status;
    return out;
  }

  out.language = language;
  Status parsed = parse_transcript_document(run.document, ErrorCode::SUBPROCESS_ERROR, out);
  if (!parsed.ok) {
    parsed.details = run.stderr_text;
    out.status = parsed;
  }
  return out;
}

}  // namespace

LocalStreamingTranscription::LocalStreamingTranscription(const LocalStreamingConfig & config)
: config_(config)
{
  command_.executable = config_.executable;
  command_.base_args = config_.base_args;
}

LocalStreamingTranscription::~LocalStreamingTranscription()
{
  stop_realtime();
}

CapabilitySet LocalStreamingTranscription::capabilities() const
{
  return {Capability::STREAMING, Capability::BATCH_TRANSCRIPTION};
}

Status LocalStreamingTranscription::start_realtime(const RealtimeConfig & config)
{
  lock_guard<mutex> lock(stream_mutex_);
  if (bridge_) {
    return make_error(ErrorCode::INVALID_STATE_TRANSITION, "stream already running");
  }

  realtime_ = config;
  bytes_sent_ = 0;
  last_final_end_ = 0.0;

  auto bridge = make_shared<StreamingBridge>(
    command_, chrono::milliseconds(config_.close_grace_ms));

  StreamCallbacks callbacks;
  callbacks.on_message = [this](const StreamMessage & message) {
      on_stream_message(message);
    };
  callbacks.on_recoverable_error = [this](const Status & error) {
      if (realtime_.on_error) {
        realtime_.on_error(error, false);
      }
    };
  callbacks.on_terminal_error = [this](const Status & error) {
      if (realtime_.on_error) {
        realtime_.on_error(error, true);
      }
    };
  callbacks.on_complete = [this]() {
      if (realtime_.on_complete) {
        realtime_.on_complete();
      }
    };

  const string language = config.language.empty() ? config_.language : config.language;
  if (!bridge->start("stream", {language, to_string(config.sample_rate)}, callbacks)) {
    return make_error(
      ErrorCode::SUBPROCESS_ERROR, "failed to start " + name() + ": " + bridge->last_error());
  }
  bridge_ = bridge;
  return Status{};
}

Status LocalStreamingTranscription::send_audio(const vector<uint8_t> & chunk)
{
  shared_ptr<StreamingBridge> bridge;
  {
    lock_guard<mutex> lock(stream_mutex_);
    bridge = bridge_;
  }
  if (!bridge) {
    return make_error(ErrorCode::INVALID_STATE_TRANSITION, "stream is not running");
  }
  if (chunk.empty()) {
    return Status{};
  }
  if (!bridge->write(chunk.data(), chunk.size())) {
    return make_error(
      ErrorCode::SUBPROCESS_ERROR, "audio write failed: " + bridge->last_error(),
      bridge->stderr_tail());
  }
  bytes_sent_ += chunk.size();
  return Status{};
}

Status LocalStreamingTranscription::stop_realtime()
{
  shared_ptr<StreamingBridge> bridge;
  {
    lock_guard<mutex> lock(stream_mutex_);
    bridge.swap(bridge_);
  }
  if (bridge) {
    bridge->close();
  }
  return Status{};
}

TranscriptResult LocalStreamingTranscription::transcribe_file(
  const vector<uint8_t> & audio,
  const TranscriptionOptions & options)
{
  const string language = options.language.empty() ? config_.language : options.language;
  return run_file_transcription(
    command_, "file", audio, options, config_.temp_directory, language,
    {config_.mode, config_.device}, config_.file_timeout_ms);
}

bool LocalStreamingTranscription::health_check()
{
  return run_one_shot(command_, "test", {}, chrono::seconds(30)).status.ok;
}

void LocalStreamingTranscription::on_stream_message(const StreamMessage & message)
{
  if (!realtime_.on_transcript) {
    return;
  }

  TranscriptSegment segment;
  segment.text = meetscribe_common::trim(message.text);
  if (message.has_times) {
    segment.start_time = message.start;
    segment.end_time = message.end;
  } else {
    // Engines without timestamps: attribute the audio fed since the last final.
    segment.start_time = last_final_end_;
    segment.end_time = max(last_final_end_, audio_seconds());
  }

  const bool is_final = message.type == StreamMessage::Type::FINAL;
  if (is_final) {
    last_final_end_ = segment.end_time;
  } else if (segment.text.empty()) {
    return;
  }
  realtime_.on_transcript(segment, is_final);
}

double LocalStreamingTranscription::audio_seconds() const
{
  const int rate = realtime_.sample_rate > 0 ? realtime_.sample_rate : 16000;
  return static_cast<double>(bytes_sent_.load()) / (rate * kBytesPerSample);
}

LocalBatchTranscription::LocalBatchTranscription(const LocalBatchConfig & config)
: config_(config)
{
  command_.executable = config_.executable;
  command_.base_args = config_.base_args;
}

CapabilitySet LocalBatchTranscription::capabilities() const
{
  return {Capability::BATCH_TRANSCRIPTION};
}

Status LocalBatchTranscription::start_realtime(const RealtimeConfig &)
{
  return unsupported_operation(name(), "start_realtime");
}

Status LocalBatchTranscription::send_audio(const vector<uint8_t> &)
{
  return unsupported_operation(name(), "send_audio");
}

Status LocalBatchTranscription::stop_realtime()
{
  return unsupported_operation(name(), "stop_realtime");
}

TranscriptResult LocalBatchTranscription::transcribe_file(
  const vector<uint8_t> & audio,
  const TranscriptionOptions & options)
{
  const string language = options.language.empty() ? config_.language : options.language;
  return run_file_transcription(
    command_, "transcribe", audio, options, config_.temp_directory, language,
    {config_.model_size, config_.device}, config_.timeout_ms);
}

bool LocalBatchTranscription::health_check()
{
  return run_one_shot(command_, "test", {}, chrono::seconds(30)).status.ok;
}

}  // namespace meetscribe
