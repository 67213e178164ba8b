#pragma once

#include "meetscribe/subprocess_bridge.hpp"
#include "meetscribe/transcription_provider.hpp"

#include <curl/curl.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace meetscribe
{

struct HostedStreamingConfig
{
  std::string engine_name = "hosted-streaming";
  std::string url;                 ///< wss:// endpoint
  std::string api_key;
  std::string model;
  std::string language = "zh";
  long connect_timeout_sec = 10;
  long send_timeout_ms = 5000;
  long close_grace_ms = 3000;
  size_t max_frame_bytes = 16 * 1024;
};

/// WebSocket ASR over libcurl. A JSON start frame opens the stream, audio
/// goes out as binary frames and {"type":"end"} asks the server to flush.
/// Server frames use the same {type, text?, start?, end?, error?} shape as
/// local engines; {"type":"end"} from the server completes the stream.
class HostedStreamingTranscription : public TranscriptionProvider
{
public:
  explicit HostedStreamingTranscription(const HostedStreamingConfig & config);
  ~HostedStreamingTranscription() override;

  std::string name() const override { return config_.engine_name; }
  TranscriptionBackend kind() const override { return TranscriptionBackend::HOSTED_STREAMING; }
  CapabilitySet capabilities() const override;

  Status start_realtime(const RealtimeConfig & config) override;
  Status send_audio(const std::vector<uint8_t> & chunk) override;
  Status stop_realtime() override;

  TranscriptResult transcribe_file(
    const std::vector<uint8_t> & audio,
    const TranscriptionOptions & options) override;

  bool health_check() override;

private:
  CURL * open_connection(std::string & error) const;
  Status send_frame(const char * data, size_t size, unsigned int flags, bool cancellable);
  void reader_loop();
  void handle_frame(const std::string & text);
  void mark_finished();
  bool wait_socket(short events, int timeout_ms) const;
  void teardown();

  HostedStreamingConfig config_;
  RealtimeConfig realtime_;
  SegmentOrderGuard order_guard_;

  std::mutex lifecycle_mutex_;
  std::mutex curl_mutex_;
  CURL * curl_ = nullptr;
  curl_socket_t socket_ = CURL_SOCKET_BAD;

  std::thread reader_thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> stop_reader_{false};

  std::mutex finished_mutex_;
  std::condition_variable finished_cv_;
  bool finished_ = false;
};

struct HostedBatchConfig
{
  std::string engine_name = "groq-whisper";
  std::string base_url = "https://api.groq.com/openai/v1";
  std::string api_key;
  std::string model = "whisper-large-v3";
  std::string language = "zh";
  long timeout_sec = 120;
};

/// OpenAI-compatible /audio/transcriptions with verbose_json segments.
class HostedBatchTranscription : public TranscriptionProvider
{
public:
  explicit HostedBatchTranscription(const HostedBatchConfig & config);

  std::string name() const override { return config_.engine_name; }
  TranscriptionBackend kind() const override { return TranscriptionBackend::HOSTED_BATCH; }
  CapabilitySet capabilities() const override;

  Status start_realtime(const RealtimeConfig & config) override;
  Status send_audio(const std::vector<uint8_t> & chunk) override;
  Status stop_realtime() override;

  TranscriptResult transcribe_file(
    const std::vector<uint8_t> & audio,
    const TranscriptionOptions & options) override;

  bool health_check() override;

private:
  HostedBatchConfig config_;
};

}  // namespace meetscribe
