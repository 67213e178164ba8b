#include "meetscribe/json_serialization.hpp"

#include <meetscribe_common/json_utils.hpp>

using namespace std;


namespace meetscribe
{

Json::Value to_json(const TranscriptSegment & segment)
{
  Json::Value out(Json::objectValue);
  out["text"] = segment.text;
  out["startTime"] = segment.start_time;
  out["endTime"] = segment.end_time;
  if (segment.confidence) {
    out["confidence"] = *segment.confidence;
  }
  if (segment.speaker_label) {
    out["speakerLabel"] = *segment.speaker_label;
  }
  return out;
}

Json::Value to_json(const FusedTranscriptEntry & entry)
{
  Json::Value speaker(Json::objectValue);
  if (entry.speaker.provenance == SpeakerProvenance::DIARIZATION) {
    speaker["label"] = entry.speaker.id;
  } else if (!entry.speaker.id.empty()) {
    speaker["id"] = entry.speaker.id;
  }
  speaker["name"] = entry.speaker.name;
  speaker["confidence"] = entry.speaker.confidence;
  speaker["provenance"] = speaker_provenance_string(entry.speaker.provenance);

  Json::Value out(Json::objectValue);
  out["text"] = entry.text;
  out["speaker"] = speaker;
  out["startTime"] = entry.start_time;
  out["endTime"] = entry.end_time;
  return out;
}

Json::Value to_json(const StageReport & report)
{
  Json::Value out(Json::objectValue);
  out["stage"] = report.stage;
  out["status"] = stage_status_string(report.status);
  out["durationMs"] = static_cast<Json::Int64>(report.duration_ms);
  if (!report.message.empty()) {
    out["message"] = report.message;
  }
  return out;
}

Json::Value to_json(const SessionSnapshot & session)
{
  Json::Value candidates(Json::arrayValue);
  for (const auto & id : session.candidate_speaker_ids) {
    candidates.append(id);
  }

  Json::Value engine(Json::objectValue);
  engine["backend"] = transcription_backend_string(session.engine_config.backend);
  engine["language"] = session.engine_config.language;
  engine["sampleRate"] = session.engine_config.sample_rate;

  Json::Value out(Json::objectValue);
  out["sessionId"] = session.session_id;
  out["meetingId"] = session.meeting_id;
  out["candidateSpeakerIds"] = candidates;
  out["engineConfig"] = engine;
  out["provider"] = session.provider_name;
  out["state"] = session_state_string(session.state);
  out["createdAt"] = static_cast<Json::Int64>(session.created_at_ms);
  out["lastActivityAt"] = static_cast<Json::Int64>(session.last_activity_at_ms);
  if (!session.end_reason.empty()) {
    out["endReason"] = session.end_reason;
  }
  if (!session.last_error.empty()) {
    out["lastError"] = session.last_error;
  }
  out["heldBytes"] = static_cast<Json::UInt64>(session.held_bytes);
  out["finalSegments"] = static_cast<Json::UInt64>(session.final_segments);
  out["audioBytes"] = static_cast<Json::UInt64>(session.audio_bytes);
  return out;
}

Json::Value to_json(const SessionStats & stats)
{
  Json::Value out(Json::objectValue);
  out["active"] = static_cast<Json::UInt64>(stats.active);
  out["paused"] = static_cast<Json::UInt64>(stats.paused);
  out["total"] = static_cast<Json::UInt64>(stats.total);
  out["capacity"] = static_cast<Json::UInt64>(stats.capacity);
  return out;
}

Json::Value to_json(const SessionEvent & event)
{
  Json::Value out(Json::objectValue);
  out["sessionId"] = event.session_id;
  out["meetingId"] = event.meeting_id;
  out["event"] = event.event;
  if (!event.reason.empty()) {
    out["reason"] = event.reason;
  }
  if (!event.message.empty()) {
    out["message"] = event.message;
  }
  if (event.speaker) {
    const SpeakerObservation & observed = *event.speaker;
    Json::Value speaker(Json::objectValue);
    speaker["label"] = observed.speaker_tag;
    if (observed.profile_id) {
      speaker["profileId"] = *observed.profile_id;
    }
    speaker["confidence"] = observed.confidence;
    speaker["startTime"] = observed.start_time;
    speaker["endTime"] = observed.end_time;
    out["speaker"] = speaker;
  }
  return out;
}

Json::Value to_json(const TranscriptEvent & event)
{
  Json::Value out = to_json(event.segment);
  out["sessionId"] = event.session_id;
  out["meetingId"] = event.meeting_id;
  out["isFinal"] = event.is_final;
  return out;
}

Json::Value to_json(const VoiceprintProfile & profile)
{
  Json::Value out(Json::objectValue);
  out["profileId"] = profile.profile_id;
  out["ownerId"] = profile.owner_id;
  out["status"] = profile_status_string(profile.status);
  out["enrollmentCount"] = profile.enrollment_count;
  out["dimension"] = static_cast<Json::UInt64>(profile.embedding.size());
  return out;
}

Json::Value to_json(const EnrollmentResult & enrollment)
{
  Json::Value out(Json::objectValue);
  out["profileId"] = enrollment.profile_id;
  out["enrollmentProgress"] = enrollment.enrollment_progress;
  out["remainingEnrollments"] = enrollment.remaining_enrollments;
  out["status"] = profile_status_string(enrollment.profile_status);
  return out;
}

Json::Value to_json(const VerificationResult & verification)
{
  Json::Value out(Json::objectValue);
  out["verified"] = verification.verified;
  out["confidence"] = verification.confidence;
  out["threshold"] = verification.threshold;
  return out;
}

Json::Value to_json(const IdentificationResult & identification)
{
  Json::Value out(Json::objectValue);
  out["identified"] = identification.identified;
  if (identification.profile_id) {
    out["profileId"] = *identification.profile_id;
  }
  out["confidence"] = identification.confidence;
  Json::Value candidates(Json::arrayValue);
  for (const auto & candidate : identification.candidates) {
    Json::Value entry(Json::objectValue);
    entry["profileId"] = candidate.first;
    entry["confidence"] = candidate.second;
    candidates.append(entry);
  }
  out["candidates"] = candidates;
  return out;
}

Json::Value error_body(const Status & status, bool include_details)
{
  Json::Value error(Json::objectValue);
  error["code"] = error_code_string(status.code);
  error["message"] = status.error;
  if (include_details && !status.details.empty()) {
    error["details"] = status.details;
  }
  Json::Value out(Json::objectValue);
  out["error"] = error;
  return out;
}

bool parse_engine_config(const Json::Value & value, EngineConfig & out, string & error)
{
  if (value.isNull()) {
    return true;
  }
  if (!value.isObject()) {
    error = "engineConfig must be an object";
    return false;
  }

  if (value.isMember("backend")) {
    if (!value["backend"].isString() ||
      !parse_transcription_backend(value["backend"].asString(), out.backend))
    {
      error = "unknown engineConfig.backend";
      return false;
    }
  }
  if (value.isMember("language")) {
    if (!value["language"].isString()) {
      error = "engineConfig.language must be a string";
      return false;
    }
    out.language = value["language"].asString();
  }
  if (value.isMember("sampleRate")) {
    if (!value["sampleRate"].isInt() || value["sampleRate"].asInt() <= 0) {
      error = "engineConfig.sampleRate must be a positive integer";
      return false;
    }
    out.sample_rate = value["sampleRate"].asInt();
  }
  return true;
}

bool parse_candidates(const Json::Value & value, vector<CandidateIdentity> & out, string & error)
{
  out.clear();
  if (value.isNull()) {
    return true;
  }
  if (!value.isArray()) {
    error = "speakers must be an array";
    return false;
  }
  for (const auto & item : value) {
    CandidateIdentity candidate;
    if (item.isString()) {
      candidate.id = item.asString();
      candidate.name = candidate.id;
    } else {
      candidate.id = meetscribe_common::string_member(item, "id");
      candidate.name = meetscribe_common::string_member(item, "name", candidate.id);
      // null marks a speaker with no enrolled print
      if (item.isObject() && item.isMember("voiceprint") && !item["voiceprint"].isNull() &&
        !meetscribe_common::read_float_array(item["voiceprint"], candidate.embedding))
      {
        error = "speaker voiceprint must be an array of numbers";
        return false;
      }
    }
    if (candidate.id.empty()) {
      error = "every speaker needs an id";
      return false;
    }
    out.push_back(candidate);
  }
  return true;
}

}  // namespace meetscribe
