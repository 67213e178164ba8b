#pragma once

#include "meetscribe/batch_pipeline.hpp"
#include "meetscribe/errors.hpp"
#include "meetscribe/segment_fusion.hpp"
#include "meetscribe/session_engine.hpp"
#include "meetscribe/types.hpp"

#include <json/json.h>

#include <string>
#include <vector>

namespace meetscribe
{

// Wire format of the HTTP API and the ROS topics. Keys are camelCase.

Json::Value to_json(const TranscriptSegment & segment);
Json::Value to_json(const FusedTranscriptEntry & entry);
Json::Value to_json(const StageReport & report);
Json::Value to_json(const SessionSnapshot & session);
Json::Value to_json(const SessionStats & stats);
Json::Value to_json(const SessionEvent & event);
Json::Value to_json(const TranscriptEvent & event);
/// The embedding itself is not serialized, only its dimension
Json::Value to_json(const VoiceprintProfile & profile);
Json::Value to_json(const EnrollmentResult & enrollment);
Json::Value to_json(const VerificationResult & verification);
Json::Value to_json(const IdentificationResult & identification);

/// {"error": {"code", "message", "details"?}}
Json::Value error_body(const Status & status, bool include_details);

/// Reads {backend?, language?, sampleRate?} over the defaults already in `out`
bool parse_engine_config(const Json::Value & value, EngineConfig & out, std::string & error);

/// Reads [{id, name?, voiceprint?: [floats] | null}]
bool parse_candidates(
  const Json::Value & value, std::vector<CandidateIdentity> & out, std::string & error);

}  // namespace meetscribe
