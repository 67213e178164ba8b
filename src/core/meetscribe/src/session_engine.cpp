#include "meetscribe/session_engine.hpp"

#include "meetscribe/wav_utils.hpp"

#include <meetscribe_common/string_utils.hpp>

#include "rclcpp/rclcpp.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

using namespace std;


namespace meetscribe
{
namespace
{

rclcpp::Logger engine_logger()
{
  return rclcpp::get_logger("meetscribe.session_engine");
}

int64_t epoch_ms()
{
  return chrono::duration_cast<chrono::milliseconds>(
    chrono::system_clock::now().time_since_epoch()).count();
}

double bytes_per_second(const EngineConfig & config)
{
  return static_cast<double>(max(1, config.sample_rate) * max(1, config.bytes_per_sample));
}

Status session_not_found(const string & session_id)
{
  return make_error(ErrorCode::SESSION_NOT_FOUND, "session " + session_id + " not found");
}

Status session_terminated(const string & session_id, SessionState state)
{
  return make_error(
    ErrorCode::SESSION_TERMINATED,
    "session " + session_id + " is " + session_state_string(state));
}

Status invalid_transition(const string & operation, SessionState state)
{
  return make_error(
    ErrorCode::INVALID_STATE_TRANSITION,
    "cannot " + operation + " a session in state " + session_state_string(state));
}

}  // namespace

string session_state_string(SessionState state)
{
  switch (state) {
    case SessionState::CREATED: return "CREATED";
    case SessionState::RUNNING: return "RUNNING";
    case SessionState::PAUSED: return "PAUSED";
    case SessionState::STOPPED: return "STOPPED";
    case SessionState::ERROR: return "ERROR";
  }
  return "UNKNOWN";
}

bool is_terminal(SessionState state)
{
  return state == SessionState::STOPPED || state == SessionState::ERROR;
}

SessionEngine::SessionEngine(const SessionEngineConfig & config, StreamingProviderFactory factory)
: factory_(std::move(factory)),
  config_(config)
{
}

SessionEngine::~SessionEngine()
{
  shutdown();
}

CreateSessionResult SessionEngine::create_session(
  const string & meeting_id,
  const vector<string> & candidate_speaker_ids,
  const EngineConfig & engine_config)
{
  CreateSessionResult out;
  if (meetscribe_common::trim(meeting_id).empty()) {
    out.status = make_error(ErrorCode::INVALID_INPUT, "meetingId is required");
    return out;
  }
  if (engine_config.sample_rate <= 0 || engine_config.bytes_per_sample <= 0) {
    out.status = make_error(ErrorCode::INVALID_INPUT, "sample rate and sample width must be positive");
    return out;
  }

  size_t max_held_bytes = 0;
  {
    lock_guard<mutex> lock(table_mutex_);
    size_t active = 0;
    for (const auto & entry : sessions_) {
      lock_guard<mutex> state_lock(entry.second->state_mutex);
      if (!is_terminal(entry.second->state)) {
        ++active;
      }
    }
    if (active + pending_creates_ >= config_.max_sessions) {
      ostringstream oss;
      oss << "session capacity reached (" << config_.max_sessions << ")";
      out.status = make_error(ErrorCode::CAPACITY_EXCEEDED, oss.str());
      return out;
    }
    ++pending_creates_;
    max_held_bytes = config_.max_held_bytes;
  }

  auto release_slot = [this]() {
      lock_guard<mutex> lock(table_mutex_);
      --pending_creates_;
    };

  unique_ptr<TranscriptionProvider> created = factory_ ? factory_(engine_config) : nullptr;
  if (!created) {
    release_slot();
    out.status = make_error(
      ErrorCode::INTERNAL_ERROR,
      "no provider for backend " + transcription_backend_string(engine_config.backend));
    return out;
  }
  if (!created->supports(Capability::STREAMING)) {
    release_slot();
    out.status = unsupported_operation(created->name(), "streaming");
    return out;
  }

  auto session = make_shared<Session>();
  session->id = next_session_id();
  session->meeting_id = meeting_id;
  session->candidate_speaker_ids = candidate_speaker_ids;
  session->engine_config = engine_config;
  session->created_at_ms = epoch_ms();
  session->max_held_bytes = max_held_bytes;
  session->provider_name = created->name();
  session->provider = std::move(created);
  touch(*session);
  {
    lock_guard<mutex> lock(identify_mutex_);
    if (identifier_) {
      session->speech_cap_bytes = static_cast<size_t>(
        identify_config_.max_buffer_seconds * bytes_per_second(engine_config));
    }
  }

  weak_ptr<Session> weak = session;
  RealtimeConfig realtime;
  realtime.language = engine_config.language;
  realtime.sample_rate = engine_config.sample_rate;
  realtime.on_transcript = [this, weak](const TranscriptSegment & segment, bool is_final) {
      on_transcript(weak, segment, is_final);
    };
  realtime.on_error = [this, weak](const Status & error, bool terminal) {
      on_provider_error(weak, error, terminal);
    };
  realtime.on_complete = [weak]() {
      if (auto s = weak.lock()) {
        RCLCPP_INFO(engine_logger(), "session %s stream completed", s->id.c_str());
      }
    };

  const Status started = session->provider->start_realtime(realtime);
  if (!started.ok) {
    release_slot();
    RCLCPP_ERROR(
      engine_logger(), "session for meeting %s failed to start %s: %s",
      meeting_id.c_str(), session->provider_name.c_str(), started.error.c_str());
    out.status = started;
    return out;
  }

  {
    lock_guard<mutex> lock(table_mutex_);
    sessions_[session->id] = session;
    --pending_creates_;
  }

  RCLCPP_INFO(
    engine_logger(), "session %s created for meeting %s (%s, %s, %d Hz)",
    session->id.c_str(), meeting_id.c_str(), session->provider_name.c_str(),
    engine_config.language.c_str(), engine_config.sample_rate);
  emit(*session, "created", "");
  out.session_id = session->id;
  return out;
}

Status SessionEngine::start_session(const string & session_id)
{
  auto session = find(session_id);
  if (!session) {
    return session_not_found(session_id);
  }

  lock_guard<mutex> op_lock(session->op_mutex);
  {
    lock_guard<mutex> lock(session->state_mutex);
    if (is_terminal(session->state) || session->stopping.load()) {
      return session_terminated(session_id, session->state);
    }
    if (session->state != SessionState::CREATED) {
      return invalid_transition("start", session->state);
    }
    session->state = SessionState::RUNNING;
    touch(*session);
  }
  emit(*session, "running", "started");
  return Status{};
}

Status SessionEngine::send_audio(const string & session_id, const vector<uint8_t> & chunk)
{
  auto session = find(session_id);
  if (!session) {
    return session_not_found(session_id);
  }
  if (chunk.empty()) {
    return make_error(ErrorCode::INVALID_INPUT, "audio chunk is empty");
  }

  lock_guard<mutex> op_lock(session->op_mutex);
  shared_ptr<TranscriptionProvider> provider;
  bool started = false;
  {
    lock_guard<mutex> lock(session->state_mutex);
    if (is_terminal(session->state) || session->stopping.load()) {
      return session_terminated(session_id, session->state);
    }
    if (session->state == SessionState::PAUSED) {
      if (session->held_bytes + chunk.size() > session->max_held_bytes) {
        return make_error(
          ErrorCode::CAPACITY_EXCEEDED, "paused session " + session_id + " hold buffer is full");
      }
      session->held.push_back(chunk);
      session->held_bytes += chunk.size();
      touch(*session);
      return Status{};
    }
    touch(*session);
    if (session->state == SessionState::CREATED) {
      session->state = SessionState::RUNNING;
      started = true;
    }
    provider = session->provider;
  }
  if (started) {
    emit(*session, "running", "first-audio");
  }
  if (!provider) {
    return session_terminated(session_id, SessionState::STOPPED);
  }

  const Status sent = provider->send_audio(chunk);
  if (!sent.ok) {
    if (session->stopping.load()) {
      return session_terminated(session_id, SessionState::STOPPED);
    }
    if (sent.code == ErrorCode::SUBPROCESS_ERROR || sent.code == ErrorCode::NETWORK_ERROR) {
      mark_error(session, sent);
    }
    return sent;
  }

  lock_guard<mutex> lock(session->state_mutex);
  record_sent(*session, chunk);
  return Status{};
}

Status SessionEngine::pause_session(const string & session_id)
{
  auto session = find(session_id);
  if (!session) {
    return session_not_found(session_id);
  }

  lock_guard<mutex> op_lock(session->op_mutex);
  {
    lock_guard<mutex> lock(session->state_mutex);
    if (is_terminal(session->state) || session->stopping.load()) {
      return session_terminated(session_id, session->state);
    }
    if (session->state != SessionState::RUNNING) {
      return invalid_transition("pause", session->state);
    }
    session->state = SessionState::PAUSED;
    touch(*session);
  }
  RCLCPP_INFO(engine_logger(), "session %s paused", session_id.c_str());
  emit(*session, "paused", "");
  return Status{};
}

Status SessionEngine::resume_session(const string & session_id)
{
  auto session = find(session_id);
  if (!session) {
    return session_not_found(session_id);
  }

  lock_guard<mutex> op_lock(session->op_mutex);
  deque<vector<uint8_t>> held;
  shared_ptr<TranscriptionProvider> provider;
  {
    lock_guard<mutex> lock(session->state_mutex);
    if (is_terminal(session->state) || session->stopping.load()) {
      return session_terminated(session_id, session->state);
    }
    if (session->state != SessionState::PAUSED) {
      return invalid_transition("resume", session->state);
    }
    session->state = SessionState::RUNNING;
    held.swap(session->held);
    session->held_bytes = 0;
    provider = session->provider;
    touch(*session);
  }
  RCLCPP_INFO(
    engine_logger(), "session %s resumed, flushing %zu held chunks",
    session_id.c_str(), held.size());
  emit(*session, "resumed", "");

  // Arrival order is kept: new audio waits on op_mutex until the flush ends.
  while (!held.empty() && provider) {
    const Status sent = provider->send_audio(held.front());
    if (!sent.ok) {
      if (session->stopping.load()) {
        return session_terminated(session_id, SessionState::STOPPED);
      }
      mark_error(session, sent);
      return sent;
    }
    {
      lock_guard<mutex> lock(session->state_mutex);
      record_sent(*session, held.front());
    }
    held.pop_front();
  }
  return Status{};
}

Status SessionEngine::destroy_session(const string & session_id)
{
  auto session = find(session_id);
  if (!session) {
    return Status{};
  }
  return stop_session(session, "destroyed");
}

Status SessionEngine::stop_session(const shared_ptr<Session> & session, const string & reason)
{
  session->stopping = true;

  shared_ptr<TranscriptionProvider> provider;
  {
    lock_guard<mutex> lock(session->state_mutex);
    if (session->state == SessionState::STOPPED) {
      return Status{};
    }
    provider = session->provider;
  }

  // Stopping outside op_mutex wakes a send_audio blocked on the provider.
  if (provider) {
    const Status stopped = provider->stop_realtime();
    if (!stopped.ok) {
      RCLCPP_WARN(
        engine_logger(), "session %s provider stop failed: %s",
        session->id.c_str(), stopped.error.c_str());
    }
  }

  bool transitioned = false;
  {
    lock_guard<mutex> op_lock(session->op_mutex);
    lock_guard<mutex> lock(session->state_mutex);
    if (session->state == SessionState::STOPPED) {
      return Status{};
    }
    if (session->state != SessionState::ERROR) {
      session->state = SessionState::STOPPED;
      session->end_reason = reason;
      session->terminal_at = Clock::now();
      transitioned = true;
    }
    session->provider.reset();
    session->held.clear();
    session->held_bytes = 0;
  }

  if (transitioned) {
    RCLCPP_INFO(engine_logger(), "session %s stopped (%s)", session->id.c_str(), reason.c_str());
    emit(*session, "stopped", reason);
  }
  return Status{};
}

void SessionEngine::reap_provider(const shared_ptr<Session> & session)
{
  shared_ptr<TranscriptionProvider> provider;
  {
    lock_guard<mutex> lock(session->state_mutex);
    provider = session->provider;
  }
  if (!provider) {
    return;
  }
  session->stopping = true;
  const Status stopped = provider->stop_realtime();
  if (!stopped.ok) {
    RCLCPP_WARN(
      engine_logger(), "session %s provider release failed: %s",
      session->id.c_str(), stopped.error.c_str());
  }
  lock_guard<mutex> lock(session->state_mutex);
  if (session->provider == provider) {
    session->provider.reset();
  }
}

void SessionEngine::mark_error(const shared_ptr<Session> & session, const Status & error)
{
  {
    lock_guard<mutex> lock(session->state_mutex);
    if (is_terminal(session->state)) {
      return;
    }
    session->state = SessionState::ERROR;
    session->end_reason = "provider-error";
    session->last_error = error.error;
    session->terminal_at = Clock::now();
  }
  RCLCPP_ERROR(
    engine_logger(), "session %s failed: %s", session->id.c_str(), error.error.c_str());
  emit(*session, "error", "provider-error", error.error);
}

void SessionEngine::touch(Session & session)
{
  session.last_activity = Clock::now();
  session.last_activity_at_ms = epoch_ms();
}

// Caller holds the state mutex.
void SessionEngine::record_sent(Session & session, const vector<uint8_t> & chunk)
{
  session.audio_bytes += chunk.size();
  if (session.speech_cap_bytes == 0) {
    return;
  }
  session.speech.insert(session.speech.end(), chunk.begin(), chunk.end());
  if (session.speech.size() <= session.speech_cap_bytes) {
    return;
  }
  const size_t frame = static_cast<size_t>(max(1, session.engine_config.bytes_per_sample));
  size_t drop = session.speech.size() - session.speech_cap_bytes;
  drop = min(session.speech.size(), (drop + frame - 1) / frame * frame);
  session.speech.erase(session.speech.begin(), session.speech.begin() + drop);
  session.speech_offset += static_cast<double>(drop) / bytes_per_second(session.engine_config);
}

SessionSnapshot SessionEngine::snapshot(const Session & session) const
{
  SessionSnapshot out;
  out.session_id = session.id;
  out.meeting_id = session.meeting_id;
  out.candidate_speaker_ids = session.candidate_speaker_ids;
  out.engine_config = session.engine_config;
  out.provider_name = session.provider_name;
  out.state = session.state;
  out.created_at_ms = session.created_at_ms;
  out.last_activity_at_ms = session.last_activity_at_ms;
  out.end_reason = session.end_reason;
  out.last_error = session.last_error;
  out.held_bytes = session.held_bytes;
  out.final_segments = session.finals.size();
  out.audio_bytes = session.audio_bytes;
  return out;
}

optional<SessionSnapshot> SessionEngine::get_session(const string & session_id) const
{
  auto session = find(session_id);
  if (!session) {
    return nullopt;
  }
  lock_guard<mutex> lock(session->state_mutex);
  return snapshot(*session);
}

SessionStats SessionEngine::get_stats() const
{
  SessionStats stats;
  lock_guard<mutex> lock(table_mutex_);
  stats.capacity = config_.max_sessions;
  for (const auto & entry : sessions_) {
    lock_guard<mutex> state_lock(entry.second->state_mutex);
    ++stats.total;
    if (!is_terminal(entry.second->state)) {
      ++stats.active;
    }
    if (entry.second->state == SessionState::PAUSED) {
      ++stats.paused;
    }
  }
  return stats;
}

Status SessionEngine::get_transcript(
  const string & session_id, vector<TranscriptSegment> & segments) const
{
  auto session = find(session_id);
  if (!session) {
    return session_not_found(session_id);
  }
  lock_guard<mutex> lock(session->state_mutex);
  segments = session->finals;
  return Status{};
}

size_t SessionEngine::sweep_idle()
{
  vector<shared_ptr<Session>> idle;
  vector<shared_ptr<Session>> failed;
  size_t forgotten = 0;
  {
    lock_guard<mutex> lock(table_mutex_);
    const auto now = Clock::now();
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
      const auto & session = it->second;
      bool forget = false;
      {
        lock_guard<mutex> state_lock(session->state_mutex);
        if (!is_terminal(session->state)) {
          if (!session->stopping.load() &&
            now - session->last_activity > config_.session_timeout)
          {
            idle.push_back(session);
          }
        } else if (session->provider) {
          failed.push_back(session);
        } else if (now - session->terminal_at > config_.terminal_retention) {
          forget = true;
        }
      }
      if (forget) {
        it = sessions_.erase(it);
        ++forgotten;
      } else {
        ++it;
      }
    }
  }

  for (const auto & session : idle) {
    RCLCPP_WARN(engine_logger(), "session %s idle too long, stopping", session->id.c_str());
    stop_session(session, "timed-out");
  }
  for (const auto & session : failed) {
    reap_provider(session);
  }
  if (forgotten > 0) {
    RCLCPP_DEBUG(engine_logger(), "forgot %zu terminal sessions", forgotten);
  }
  return idle.size();
}

void SessionEngine::set_speaker_identifier(
  shared_ptr<VoiceprintProvider> identifier, const SpeakerIdentificationConfig & config)
{
  lock_guard<mutex> lock(identify_mutex_);
  identifier_ = std::move(identifier);
  identify_config_ = config;
  if (identifier_) {
    RCLCPP_INFO(
      engine_logger(), "live speaker identification through %s every %.1f s of audio",
      identifier_->name().c_str(), identify_config_.buffer_seconds);
  }
}

size_t SessionEngine::identify_speakers()
{
  shared_ptr<VoiceprintProvider> identifier;
  SpeakerIdentificationConfig config;
  {
    lock_guard<mutex> lock(identify_mutex_);
    identifier = identifier_;
    config = identify_config_;
  }
  if (!identifier) {
    return 0;
  }

  vector<shared_ptr<Session>> sessions;
  {
    lock_guard<mutex> lock(table_mutex_);
    for (const auto & entry : sessions_) {
      sessions.push_back(entry.second);
    }
  }

  size_t processed = 0;
  for (const auto & session : sessions) {
    if (session->identifying.exchange(true)) {
      continue;
    }
    vector<uint8_t> pcm;
    double offset = 0.0;
    vector<string> candidates;
    {
      lock_guard<mutex> lock(session->state_mutex);
      const double rate = bytes_per_second(session->engine_config);
      if (session->state == SessionState::RUNNING && !session->stopping.load() &&
        !session->speech.empty() &&
        static_cast<double>(session->speech.size()) >= config.buffer_seconds * rate)
      {
        pcm.swap(session->speech);
        offset = session->speech_offset;
        session->speech_offset += static_cast<double>(pcm.size()) / rate;
        candidates = session->candidate_speaker_ids;
      }
    }
    if (!pcm.empty()) {
      identify_window(*session, *identifier, config, pcm, offset, candidates);
      ++processed;
    }
    session->identifying = false;
  }
  return processed;
}

void SessionEngine::identify_window(
  const Session & session, VoiceprintProvider & identifier,
  const SpeakerIdentificationConfig & config, const vector<uint8_t> & pcm,
  double offset, const vector<string> & candidates)
{
  const EngineConfig & audio = session.engine_config;
  const auto sample_rate = static_cast<uint32_t>(max(1, audio.sample_rate));
  const double rate = bytes_per_second(audio);
  const size_t frame = static_cast<size_t>(max(1, audio.bytes_per_sample));
  const double duration = static_cast<double>(pcm.size()) / rate;

  vector<DiarizationSegment> turns;
  if (identifier.supports(Capability::DIARIZATION)) {
    const DiarizationResult diarized = identifier.diarization(encode_pcm16_wav(pcm, sample_rate));
    if (!diarized.status.ok) {
      RCLCPP_WARN(
        engine_logger(), "session %s live diarization failed: %s",
        session.id.c_str(), diarized.status.error.c_str());
      emit(session, "warning", error_code_string(diarized.status.code), diarized.status.error);
      return;
    }
    turns = diarized.segments;
  } else if (!candidates.empty()) {
    // Without diarization the whole window counts as one turn.
    DiarizationSegment whole;
    whole.speaker_tag = "SPEAKER_00";
    whole.end_time = duration;
    turns.push_back(whole);
  }

  for (const auto & turn : turns) {
    const double start = max(0.0, turn.start_time);
    const double end = min(duration, turn.end_time);
    if (end - start < config.min_segment_seconds) {
      continue;
    }

    SpeakerObservation observed;
    observed.speaker_tag = turn.speaker_tag;
    observed.start_time = offset + start;
    observed.end_time = offset + end;

    if (!candidates.empty()) {
      const size_t from = min(pcm.size(), static_cast<size_t>(start * rate) / frame * frame);
      const size_t to = min(pcm.size(), static_cast<size_t>(end * rate) / frame * frame);
      const vector<uint8_t> slice(pcm.begin() + from, pcm.begin() + to);
      const IdentificationResult result =
        identifier.identify_speaker(encode_pcm16_wav(slice, sample_rate), candidates);
      if (!result.status.ok) {
        RCLCPP_WARN(
          engine_logger(), "session %s speaker identification failed: %s",
          session.id.c_str(), result.status.error.c_str());
        emit(session, "warning", error_code_string(result.status.code), result.status.error);
        return;
      }
      observed.confidence = result.confidence;
      if (result.identified) {
        observed.profile_id = result.profile_id;
      }
    }

    SessionEvent event;
    event.session_id = session.id;
    event.meeting_id = session.meeting_id;
    event.event = "speaker";
    event.reason = observed.profile_id ? "identified" : "unknown";
    event.speaker = observed;
    RCLCPP_DEBUG(
      engine_logger(), "session %s %s %s at %.2f s (%.2f)",
      session.id.c_str(), event.reason.c_str(),
      observed.profile_id ? observed.profile_id->c_str() : observed.speaker_tag.c_str(),
      observed.start_time, observed.confidence);
    publish(event);
  }
}

void SessionEngine::shutdown()
{
  vector<shared_ptr<Session>> sessions;
  {
    lock_guard<mutex> lock(table_mutex_);
    for (const auto & entry : sessions_) {
      sessions.push_back(entry.second);
    }
  }
  for (const auto & session : sessions) {
    stop_session(session, "shutdown");
  }
}

void SessionEngine::update_limits(size_t max_sessions, chrono::milliseconds session_timeout)
{
  lock_guard<mutex> lock(table_mutex_);
  config_.max_sessions = max_sessions;
  config_.session_timeout = session_timeout;
  RCLCPP_INFO(
    engine_logger(), "limits updated: max_sessions=%zu session_timeout_ms=%ld",
    max_sessions, static_cast<long>(session_timeout.count()));
}

SessionEngineConfig SessionEngine::config() const
{
  lock_guard<mutex> lock(table_mutex_);
  return config_;
}

void SessionEngine::set_event_callback(function<void(const SessionEvent &)> callback)
{
  lock_guard<mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

void SessionEngine::set_transcript_callback(function<void(const TranscriptEvent &)> callback)
{
  lock_guard<mutex> lock(callback_mutex_);
  transcript_callback_ = std::move(callback);
}

shared_ptr<SessionEngine::Session> SessionEngine::find(const string & session_id) const
{
  lock_guard<mutex> lock(table_mutex_);
  const auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

void SessionEngine::on_transcript(
  const weak_ptr<Session> & weak, const TranscriptSegment & segment, bool is_final)
{
  auto session = weak.lock();
  if (!session) {
    return;
  }
  if (is_final) {
    lock_guard<mutex> lock(session->state_mutex);
    session->finals.push_back(segment);
  }

  function<void(const TranscriptEvent &)> callback;
  {
    lock_guard<mutex> lock(callback_mutex_);
    callback = transcript_callback_;
  }
  if (callback) {
    TranscriptEvent event;
    event.session_id = session->id;
    event.meeting_id = session->meeting_id;
    event.segment = segment;
    event.is_final = is_final;
    callback(event);
  }
}

void SessionEngine::on_provider_error(
  const weak_ptr<Session> & weak, const Status & error, bool terminal)
{
  auto session = weak.lock();
  if (!session) {
    return;
  }
  if (terminal) {
    if (!session->stopping.load()) {
      mark_error(session, error);
    }
    return;
  }

  {
    lock_guard<mutex> lock(session->state_mutex);
    session->last_error = error.error;
  }
  RCLCPP_WARN(
    engine_logger(), "session %s stream error: %s", session->id.c_str(), error.error.c_str());
  emit(*session, "warning", error_code_string(error.code), error.error);
}

void SessionEngine::emit(
  const Session & session, const string & event,
  const string & reason, const string & message)
{
  SessionEvent out;
  out.session_id = session.id;
  out.meeting_id = session.meeting_id;
  out.event = event;
  out.reason = reason;
  out.message = message;
  publish(out);
}

void SessionEngine::publish(const SessionEvent & event)
{
  function<void(const SessionEvent &)> callback;
  {
    lock_guard<mutex> lock(callback_mutex_);
    callback = event_callback_;
  }
  if (callback) {
    callback(event);
  }
}

string SessionEngine::next_session_id()
{
  ostringstream oss;
  oss << "session_" << epoch_ms() << "_" << ++id_sequence_;
  return oss.str();
}

}  // namespace meetscribe
