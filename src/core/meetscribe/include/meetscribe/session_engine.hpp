#pragma once

#include "meetscribe/errors.hpp"
#include "meetscribe/transcription_provider.hpp"
#include "meetscribe/types.hpp"
#include "meetscribe/voiceprint_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meetscribe
{

enum class SessionState
{
  CREATED,
  RUNNING,
  PAUSED,
  STOPPED,
  ERROR
};

std::string session_state_string(SessionState state);
bool is_terminal(SessionState state);

struct EngineConfig
{
  TranscriptionBackend backend = TranscriptionBackend::LOCAL_STREAMING;
  std::string language = "zh";
  int sample_rate = 16000;
  int bytes_per_sample = 2;     ///< PCM16 mono
};

/// Copy of a session taken under its state lock
struct SessionSnapshot
{
  std::string session_id;
  std::string meeting_id;
  std::vector<std::string> candidate_speaker_ids;
  EngineConfig engine_config;
  std::string provider_name;
  SessionState state = SessionState::CREATED;
  int64_t created_at_ms = 0;
  int64_t last_activity_at_ms = 0;
  std::string end_reason;       ///< "destroyed", "timed-out", "provider-error", "shutdown"
  std::string last_error;
  size_t held_bytes = 0;
  size_t final_segments = 0;
  uint64_t audio_bytes = 0;
};

struct SessionStats
{
  size_t active = 0;     ///< non-terminal sessions
  size_t paused = 0;
  size_t total = 0;      ///< every retained record
  size_t capacity = 0;
};

/// One diarized turn of live audio and who it was matched to
struct SpeakerObservation
{
  std::string speaker_tag;
  std::optional<std::string> profile_id;   ///< set when identified
  double confidence = 0.0;
  double start_time = 0.0;                 ///< seconds since the session's first audio
  double end_time = 0.0;
};

struct SessionEvent
{
  std::string session_id;
  std::string meeting_id;
  /// created, running, paused, resumed, stopped, error, warning, speaker
  std::string event;
  std::string reason;    ///< for speaker events: identified or unknown
  std::string message;
  std::optional<SpeakerObservation> speaker;
};

struct TranscriptEvent
{
  std::string session_id;
  std::string meeting_id;
  TranscriptSegment segment;
  bool is_final = false;
};

struct SessionEngineConfig
{
  size_t max_sessions = 10;
  std::chrono::milliseconds session_timeout{3600000};
  std::chrono::milliseconds terminal_retention{600000};
  size_t max_held_bytes = 32 * 1024 * 1024;   ///< audio held while paused
};

struct SpeakerIdentificationConfig
{
  double buffer_seconds = 3.0;         ///< live audio collected before a pass
  double min_segment_seconds = 1.0;    ///< shorter diarized turns are skipped
  double max_buffer_seconds = 30.0;    ///< oldest audio is dropped beyond this
};

struct CreateSessionResult
{
  Status status;
  std::string session_id;
};

using StreamingProviderFactory =
  std::function<std::unique_ptr<TranscriptionProvider>(const EngineConfig & config)>;

/// Owns every realtime session and its provider. The table mutex is never
/// held across provider calls; per-session transitions are serialized by the
/// session's op mutex and published under its state mutex.
class SessionEngine
{
public:
  SessionEngine(const SessionEngineConfig & config, StreamingProviderFactory factory);
  ~SessionEngine();

  SessionEngine(const SessionEngine &) = delete;
  SessionEngine & operator=(const SessionEngine &) = delete;

  CreateSessionResult create_session(
    const std::string & meeting_id,
    const std::vector<std::string> & candidate_speaker_ids,
    const EngineConfig & engine_config);

  Status start_session(const std::string & session_id);
  Status send_audio(const std::string & session_id, const std::vector<uint8_t> & chunk);
  Status pause_session(const std::string & session_id);
  Status resume_session(const std::string & session_id);

  /// Idempotent: unknown and already terminal sessions are not an error.
  Status destroy_session(const std::string & session_id);

  std::optional<SessionSnapshot> get_session(const std::string & session_id) const;
  SessionStats get_stats() const;
  Status get_transcript(
    const std::string & session_id, std::vector<TranscriptSegment> & segments) const;

  /// Times out idle sessions, releases providers of failed sessions and
  /// forgets terminal records past retention. Returns the number timed out.
  size_t sweep_idle();

  /// Enables live speaker identification for sessions created afterwards.
  /// A null provider disables it.
  void set_speaker_identifier(
    std::shared_ptr<VoiceprintProvider> identifier, const SpeakerIdentificationConfig & config);

  /// One identification pass over every running session holding at least
  /// buffer_seconds of new audio. Emits a "speaker" event per diarized turn
  /// and returns the number of sessions processed.
  size_t identify_speakers();

  void shutdown();

  void update_limits(size_t max_sessions, std::chrono::milliseconds session_timeout);
  SessionEngineConfig config() const;

  void set_event_callback(std::function<void(const SessionEvent &)> callback);
  void set_transcript_callback(std::function<void(const TranscriptEvent &)> callback);

private:
  using Clock = std::chrono::steady_clock;

  struct Session
  {
    std::string id;
    std::string meeting_id;
    std::vector<std::string> candidate_speaker_ids;
    EngineConfig engine_config;
    int64_t created_at_ms = 0;
    size_t max_held_bytes = 0;

    std::mutex op_mutex;
    mutable std::mutex state_mutex;
    SessionState state = SessionState::CREATED;
    std::shared_ptr<TranscriptionProvider> provider;
    std::string provider_name;
    Clock::time_point last_activity;
    int64_t last_activity_at_ms = 0;
    Clock::time_point terminal_at;
    std::string end_reason;
    std::string last_error;
    std::deque<std::vector<uint8_t>> held;
    size_t held_bytes = 0;
    std::vector<TranscriptSegment> finals;
    uint64_t audio_bytes = 0;
    std::atomic<bool> stopping{false};

    // Live identification; speech_cap_bytes == 0 disables buffering.
    size_t speech_cap_bytes = 0;
    std::vector<uint8_t> speech;
    double speech_offset = 0.0;        ///< stream time of speech.front()
    std::atomic<bool> identifying{false};
  };

  std::shared_ptr<Session> find(const std::string & session_id) const;
  Status stop_session(const std::shared_ptr<Session> & session, const std::string & reason);
  void reap_provider(const std::shared_ptr<Session> & session);
  void mark_error(const std::shared_ptr<Session> & session, const Status & error);
  void touch(Session & session);
  void record_sent(Session & session, const std::vector<uint8_t> & chunk);
  void identify_window(
    const Session & session, VoiceprintProvider & identifier,
    const SpeakerIdentificationConfig & config, const std::vector<uint8_t> & pcm,
    double offset, const std::vector<std::string> & candidates);
  SessionSnapshot snapshot(const Session & session) const;

  void on_transcript(
    const std::weak_ptr<Session> & weak, const TranscriptSegment & segment, bool is_final);
  void on_provider_error(const std::weak_ptr<Session> & weak, const Status & error, bool terminal);

  void emit(const Session & session, const std::string & event,
    const std::string & reason, const std::string & message = "");
  void publish(const SessionEvent & event);
  std::string next_session_id();

  StreamingProviderFactory factory_;

  mutable std::mutex table_mutex_;
  SessionEngineConfig config_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  size_t pending_creates_ = 0;
  std::atomic<uint64_t> id_sequence_{0};

  mutable std::mutex identify_mutex_;
  std::shared_ptr<VoiceprintProvider> identifier_;
  SpeakerIdentificationConfig identify_config_;

  std::mutex callback_mutex_;
  std::function<void(const SessionEvent &)> event_callback_;
  std::function<void(const TranscriptEvent &)> transcript_callback_;
};

}  // namespace meetscribe
