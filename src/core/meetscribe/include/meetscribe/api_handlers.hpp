#pragma once

#include "meetscribe/batch_pipeline.hpp"
#include "meetscribe/errors.hpp"
#include "meetscribe/session_engine.hpp"
#include "meetscribe/voiceprint_provider.hpp"

#include <json/json.h>

#include <memory>
#include <string>

namespace meetscribe
{

struct ApiResponse
{
  int status = 200;
  Json::Value body;
};

struct ApiConfig
{
  bool diagnostics_enabled = false;   ///< expose Status::details in error bodies
  EngineConfig default_engine;
  TranscriptionBackend batch_backend = TranscriptionBackend::LOCAL_BATCH;
};

int http_status_for(ErrorCode code);

/// Request -> response mapping for the HTTP surface, independent of the
/// server library so it can be driven directly from tests.
class ApiHandlers
{
public:
  /// `voiceprint` may be null when voiceprint support is disabled.
  ApiHandlers(
    const ApiConfig & config,
    SessionEngine & engine,
    std::shared_ptr<BatchPipeline> pipeline,
    std::shared_ptr<VoiceprintProvider> voiceprint);

  ApiResponse create_session(const std::string & body);
  ApiResponse destroy_session(const std::string & session_id);
  ApiResponse session_status(const std::string & session_id);
  ApiResponse session_stats();
  ApiResponse start_session(const std::string & session_id);
  ApiResponse pause_session(const std::string & session_id);
  ApiResponse resume_session(const std::string & session_id);
  ApiResponse send_audio(const std::string & session_id, const std::string & pcm);
  ApiResponse session_transcript(const std::string & session_id);

  /// `speakers_json` is the optional multipart field, empty when absent
  ApiResponse transcribe_file(
    bool has_audio,
    const std::string & audio,
    const std::string & filename,
    const std::string & speakers_json);

  ApiResponse health();

  ApiResponse create_profile(const std::string & body);
  ApiResponse list_profiles();
  ApiResponse enroll_profile(const std::string & profile_id, const std::string & audio);
  ApiResponse verify_profile(const std::string & profile_id, const std::string & audio);
  ApiResponse delete_profile(const std::string & profile_id);
  /// 1:N match of `audio`; `candidates_json` narrows the search, empty means
  /// every enrolled profile
  ApiResponse identify_speaker(const std::string & audio, const std::string & candidates_json);

private:
  ApiResponse error_response(const Status & status) const;
  ApiResponse error_response(int http_status, const Status & status) const;
  ApiResponse transition_response(const std::string & session_id, const Status & status);
  bool voiceprint_available(ApiResponse & response) const;
  void attach_voiceprints(std::vector<CandidateIdentity> & candidates) const;

  ApiConfig config_;
  SessionEngine & engine_;
  std::shared_ptr<BatchPipeline> pipeline_;
  std::shared_ptr<VoiceprintProvider> voiceprint_;
};

}  // namespace meetscribe
