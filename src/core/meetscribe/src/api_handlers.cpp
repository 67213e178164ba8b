#include "meetscribe/api_handlers.hpp"

#include "meetscribe/json_serialization.hpp"

#include <meetscribe_common/json_utils.hpp>

#include "rclcpp/rclcpp.hpp"

#include <utility>
#include <vector>

using namespace std;


namespace meetscribe
{
namespace
{

rclcpp::Logger api_logger()
{
  return rclcpp::get_logger("meetscribe.api");
}

vector<uint8_t> to_bytes(const string & body)
{
  return vector<uint8_t>(body.begin(), body.end());
}

ApiResponse ok_response(int status, const Json::Value & body)
{
  ApiResponse out;
  out.status = status;
  out.body = body;
  return out;
}

}  // namespace

int http_status_for(ErrorCode code)
{
  switch (code) {
    case ErrorCode::NONE:
      return 200;
    case ErrorCode::CAPABILITY_UNSUPPORTED:
    case ErrorCode::INVALID_INPUT:
      return 400;
    case ErrorCode::SESSION_NOT_FOUND:
    case ErrorCode::PROFILE_NOT_FOUND:
      return 404;
    case ErrorCode::INVALID_STATE_TRANSITION:
    case ErrorCode::SESSION_TERMINATED:
    case ErrorCode::INSUFFICIENT_ENROLLMENT:
      return 409;
    case ErrorCode::CAPACITY_EXCEEDED:
      return 503;
    default:
      return 500;
  }
}

ApiHandlers::ApiHandlers(
  const ApiConfig & config,
  SessionEngine & engine,
  shared_ptr<BatchPipeline> pipeline,
  shared_ptr<VoiceprintProvider> voiceprint)
: config_(config),
  engine_(engine),
  pipeline_(std::move(pipeline)),
  voiceprint_(std::move(voiceprint))
{
}

ApiResponse ApiHandlers::error_response(const Status & status) const
{
  return error_response(http_status_for(status.code), status);
}

ApiResponse ApiHandlers::error_response(int http_status, const Status & status) const
{
  ApiResponse out;
  out.status = http_status;
  out.body = error_body(status, config_.diagnostics_enabled);
  return out;
}

ApiResponse ApiHandlers::create_session(const string & body)
{
  Json::Value request;
  string error;
  if (!meetscribe_common::parse_json(body.empty() ? "{}" : body, request, error) ||
    !request.isObject())
  {
    return error_response(make_error(ErrorCode::INVALID_INPUT, "request body is not a JSON object"));
  }

  const string meeting_id = meetscribe_common::string_member(request, "meetingId");

  vector<string> candidate_ids;
  if (request.isMember("candidateSpeakerIds")) {
    const Json::Value & ids = request["candidateSpeakerIds"];
    if (!ids.isArray()) {
      return error_response(
        make_error(ErrorCode::INVALID_INPUT, "candidateSpeakerIds must be an array"));
    }
    for (const auto & id : ids) {
      if (!id.isString()) {
        return error_response(
          make_error(ErrorCode::INVALID_INPUT, "candidateSpeakerIds must hold strings"));
      }
      candidate_ids.push_back(id.asString());
    }
  }

  EngineConfig engine_config = config_.default_engine;
  if (!parse_engine_config(request.get("engineConfig", Json::Value()), engine_config, error)) {
    return error_response(make_error(ErrorCode::INVALID_INPUT, error));
  }

  const CreateSessionResult created = engine_.create_session(
    meeting_id, candidate_ids, engine_config);
  if (!created.status.ok) {
    return error_response(created.status);
  }

  Json::Value out(Json::objectValue);
  out["sessionId"] = created.session_id;
  return ok_response(201, out);
}

ApiResponse ApiHandlers::destroy_session(const string & session_id)
{
  const Status status = engine_.destroy_session(session_id);
  if (!status.ok) {
    RCLCPP_WARN(api_logger(), "destroy %s: %s", session_id.c_str(), status.error.c_str());
  }
  Json::Value out(Json::objectValue);
  out["sessionId"] = session_id;
  out["destroyed"] = true;
  return ok_response(200, out);
}

ApiResponse ApiHandlers::session_status(const string & session_id)
{
  const auto session = engine_.get_session(session_id);
  if (!session) {
    return error_response(
      make_error(ErrorCode::SESSION_NOT_FOUND, "session " + session_id + " not found"));
  }
  Json::Value out(Json::objectValue);
  out["session"] = to_json(*session);
  return ok_response(200, out);
}

ApiResponse ApiHandlers::session_stats()
{
  return ok_response(200, to_json(engine_.get_stats()));
}

ApiResponse ApiHandlers::transition_response(const string & session_id, const Status & status)
{
  if (!status.ok) {
    return error_response(status);
  }
  return session_status(session_id);
}

ApiResponse ApiHandlers::start_session(const string & session_id)
{
  return transition_response(session_id, engine_.start_session(session_id));
}

ApiResponse ApiHandlers::pause_session(const string & session_id)
{
  return transition_response(session_id, engine_.pause_session(session_id));
}

ApiResponse ApiHandlers::resume_session(const string & session_id)
{
  return transition_response(session_id, engine_.resume_session(session_id));
}

ApiResponse ApiHandlers::send_audio(const string & session_id, const string & pcm)
{
  const Status status = engine_.send_audio(session_id, to_bytes(pcm));
  if (!status.ok) {
    return error_response(status);
  }
  Json::Value out(Json::objectValue);
  out["sessionId"] = session_id;
  out["accepted"] = static_cast<Json::UInt64>(pcm.size());
  return ok_response(200, out);
}

ApiResponse ApiHandlers::session_transcript(const string & session_id)
{
  vector<TranscriptSegment> segments;
  const Status status = engine_.get_transcript(session_id, segments);
  if (!status.ok) {
    return error_response(status);
  }
  Json::Value list(Json::arrayValue);
  for (const auto & segment : segments) {
    list.append(to_json(segment));
  }
  Json::Value out(Json::objectValue);
  out["sessionId"] = session_id;
  out["segments"] = list;
  return ok_response(200, out);
}

ApiResponse ApiHandlers::transcribe_file(
  bool has_audio,
  const string & audio,
  const string & filename,
  const string & speakers_json)
{
  if (!has_audio || audio.empty()) {
    return error_response(400, make_error(ErrorCode::INVALID_INPUT, "audio file is required"));
  }

  BatchRequest request;
  string error;
  if (!speakers_json.empty()) {
    Json::Value speakers;
    if (!meetscribe_common::parse_json(speakers_json, speakers, error) ||
      !parse_candidates(speakers, request.candidates, error))
    {
      return error_response(
        400, make_error(ErrorCode::INVALID_INPUT, "invalid speakers field: " + error));
    }
  }
  attach_voiceprints(request.candidates);
  request.audio = to_bytes(audio);
  if (!filename.empty()) {
    request.filename = filename;
  }
  request.language = config_.default_engine.language;

  const BatchResult result = pipeline_->run(request);

  Json::Value stages(Json::arrayValue);
  for (const auto & stage : result.stages) {
    stages.append(to_json(stage));
  }

  if (!result.status.ok) {
    const int status = result.status.code == ErrorCode::INVALID_INPUT ? 400 : 500;
    ApiResponse out = error_response(status, result.status);
    out.body["stages"] = stages;
    return out;
  }

  Json::Value segments(Json::arrayValue);
  for (const auto & entry : result.entries) {
    segments.append(to_json(entry));
  }
  Json::Value out(Json::objectValue);
  out["segments"] = segments;
  out["fullText"] = result.transcript.full_text;
  out["language"] = result.transcript.language;
  out["duration"] = result.transcript.duration;
  out["numSpeakers"] = result.num_speakers;
  out["degraded"] = result.degraded;
  out["stages"] = stages;
  return ok_response(200, out);
}

ApiResponse ApiHandlers::health()
{
  Json::Value providers(Json::objectValue);
  providers["realtime"] = transcription_backend_string(config_.default_engine.backend);
  providers["batch"] = transcription_backend_string(config_.batch_backend);
  if (voiceprint_) {
    providers["voiceprint"] = voiceprint_->name();
  } else {
    providers["voiceprint"] = Json::Value();
  }

  Json::Value out(Json::objectValue);
  out["status"] = "ok";
  out["providers"] = providers;
  out["sessions"] = to_json(engine_.get_stats());
  return ok_response(200, out);
}

bool ApiHandlers::voiceprint_available(ApiResponse & response) const
{
  if (voiceprint_) {
    return true;
  }
  response = error_response(
    make_error(ErrorCode::CAPABILITY_UNSUPPORTED, "voiceprint support is disabled"));
  return false;
}

void ApiHandlers::attach_voiceprints(vector<CandidateIdentity> & candidates) const
{
  if (!voiceprint_ || candidates.empty()) {
    return;
  }
  const vector<VoiceprintProfile> profiles = voiceprint_->list_profiles();
  for (auto & candidate : candidates) {
    if (!candidate.embedding.empty()) {
      continue;
    }
    for (const auto & profile : profiles) {
      if (profile.status == ProfileStatus::ENROLLED &&
        (profile.profile_id == candidate.id || profile.owner_id == candidate.id))
      {
        candidate.embedding = profile.embedding;
        break;
      }
    }
  }
}

ApiResponse ApiHandlers::create_profile(const string & body)
{
  ApiResponse response;
  if (!voiceprint_available(response)) {
    return response;
  }
  Json::Value request;
  string error;
  if (!meetscribe_common::parse_json(body.empty() ? "{}" : body, request, error) ||
    !request.isObject())
  {
    return error_response(make_error(ErrorCode::INVALID_INPUT, "request body is not a JSON object"));
  }

  const ProfileResult created = voiceprint_->create_profile(
    meetscribe_common::string_member(request, "ownerId"));
  if (!created.status.ok) {
    return error_response(created.status);
  }
  Json::Value out(Json::objectValue);
  out["profile"] = to_json(created.profile);
  return ok_response(201, out);
}

ApiResponse ApiHandlers::list_profiles()
{
  ApiResponse response;
  if (!voiceprint_available(response)) {
    return response;
  }
  Json::Value list(Json::arrayValue);
  for (const auto & profile : voiceprint_->list_profiles()) {
    list.append(to_json(profile));
  }
  Json::Value out(Json::objectValue);
  out["profiles"] = list;
  return ok_response(200, out);
}

ApiResponse ApiHandlers::enroll_profile(const string & profile_id, const string & audio)
{
  ApiResponse response;
  if (!voiceprint_available(response)) {
    return response;
  }
  const EnrollmentResult enrollment = voiceprint_->enroll_profile(profile_id, to_bytes(audio));
  if (!enrollment.status.ok) {
    return error_response(enrollment.status);
  }
  Json::Value out(Json::objectValue);
  out["enrollment"] = to_json(enrollment);
  return ok_response(200, out);
}

ApiResponse ApiHandlers::verify_profile(const string & profile_id, const string & audio)
{
  ApiResponse response;
  if (!voiceprint_available(response)) {
    return response;
  }
  if (audio.empty()) {
    return error_response(make_error(ErrorCode::INVALID_INPUT, "audio is empty"));
  }
  const VerificationResult verification = voiceprint_->verify_speaker(profile_id, to_bytes(audio));
  if (!verification.status.ok) {
    return error_response(verification.status);
  }
  Json::Value out(Json::objectValue);
  out["profileId"] = profile_id;
  out["verification"] = to_json(verification);
  return ok_response(200, out);
}

ApiResponse ApiHandlers::identify_speaker(const string & audio, const string & candidates_json)
{
  ApiResponse response;
  if (!voiceprint_available(response)) {
    return response;
  }
  if (audio.empty()) {
    return error_response(make_error(ErrorCode::INVALID_INPUT, "audioFile is required"));
  }

  vector<string> candidate_ids;
  if (!candidates_json.empty()) {
    Json::Value parsed;
    vector<CandidateIdentity> candidates;
    string error;
    if (!meetscribe_common::parse_json(candidates_json, parsed, error) ||
      !parse_candidates(parsed, candidates, error))
    {
      return error_response(make_error(ErrorCode::INVALID_INPUT, "candidates: " + error));
    }
    for (const auto & candidate : candidates) {
      candidate_ids.push_back(candidate.id);
    }
  }

  const IdentificationResult identification =
    voiceprint_->identify_speaker(to_bytes(audio), candidate_ids);
  if (!identification.status.ok) {
    // Nobody enrolled yet is a plain "no match" for an open search.
    if (candidate_ids.empty() &&
      identification.status.code == ErrorCode::INSUFFICIENT_ENROLLMENT)
    {
      RCLCPP_INFO(api_logger(), "identify: no enrolled profiles");
      return ok_response(200, to_json(IdentificationResult()));
    }
    return error_response(identification.status);
  }
  RCLCPP_INFO(
    api_logger(), "identify: %s (%.3f)",
    identification.profile_id ? identification.profile_id->c_str() : "no match",
    identification.confidence);
  return ok_response(200, to_json(identification));
}

ApiResponse ApiHandlers::delete_profile(const string & profile_id)
{
  ApiResponse response;
  if (!voiceprint_available(response)) {
    return response;
  }
  const Status status = voiceprint_->delete_profile(profile_id);
  if (!status.ok) {
    return error_response(status);
  }
  Json::Value out(Json::objectValue);
  out["profileId"] = profile_id;
  out["deleted"] = true;
  return ok_response(200, out);
}

}  // namespace meetscribe
