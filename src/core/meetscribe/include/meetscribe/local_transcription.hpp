#pragma once

#include "meetscribe/subprocess_bridge.hpp"
#include "meetscribe/transcription_provider.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace meetscribe
{

struct LocalStreamingConfig
{
  std::string engine_name = "funasr";
  std::string executable = "python3";
  std::vector<std::string> base_args = {"engines/funasr_service.py"};
  std::string language = "zh";
  std::string mode = "offline";      ///< file recognition mode passed to the engine
  std::string device = "cpu";
  long file_timeout_ms = 300000;
  long close_grace_ms = 3000;
  std::string temp_directory;
};

/// Long-lived local engine (FunASR style). Engine contract:
///   stream <language> <sample_rate>              raw PCM16 on stdin, NDJSON on stdout
///   file <wav> <language> <mode> <device>        -> {success, text, segments?}
///   test
class LocalStreamingTranscription : public TranscriptionProvider
{
public:
  explicit LocalStreamingTranscription(const LocalStreamingConfig & config);
  ~LocalStreamingTranscription() override;

  std::string name() const override { return config_.engine_name; }
  TranscriptionBackend kind() const override { return TranscriptionBackend::LOCAL_STREAMING; }
  CapabilitySet capabilities() const override;

  Status start_realtime(const RealtimeConfig & config) override;
  Status send_audio(const std::vector<uint8_t> & chunk) override;
  Status stop_realtime() override;

  TranscriptResult transcribe_file(
    const std::vector<uint8_t> & audio,
    const TranscriptionOptions & options) override;

  bool health_check() override;

private:
  void on_stream_message(const StreamMessage & message);
  double audio_seconds() const;

  LocalStreamingConfig config_;
  SubprocessCommand command_;
  RealtimeConfig realtime_;

  std::mutex stream_mutex_;
  std::shared_ptr<StreamingBridge> bridge_;
  std::atomic<uint64_t> bytes_sent_{0};
  double last_final_end_ = 0.0;   ///< touched only from the reader thread
};

struct LocalBatchConfig
{
  std::string engine_name = "whisper";
  std::string executable = "python3";
  std::vector<std::string> base_args = {"engines/whisper_service.py"};
  std::string language = "zh";
  std::string model_size = "base";
  std::string device = "cpu";
  long timeout_ms = 600000;
  std::string temp_directory;
};

/// Batch-only local engine (Whisper style). Engine contract:
///   transcribe <wav> <language> <model_size> <device>
///     -> {success, text, language?, duration?, segments: [{text, start, end}]}
///   test
class LocalBatchTranscription : public TranscriptionProvider
{
public:
  explicit LocalBatchTranscription(const LocalBatchConfig & config);

  std::string name() const override { return config_.engine_name; }
  TranscriptionBackend kind() const override { return TranscriptionBackend::LOCAL_BATCH; }
  CapabilitySet capabilities() const override;

  Status start_realtime(const RealtimeConfig & config) override;
  Status send_audio(const std::vector<uint8_t> & chunk) override;
  Status stop_realtime() override;

  TranscriptResult transcribe_file(
    const std::vector<uint8_t> & audio,
    const TranscriptionOptions & options) override;

  bool health_check() override;

private:
  LocalBatchConfig config_;
  SubprocessCommand command_;
};

}  // namespace meetscribe
