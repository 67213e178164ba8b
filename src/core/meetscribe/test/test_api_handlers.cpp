#include <gtest/gtest.h>

#include "meetscribe/api_handlers.hpp"
#include "meetscribe/embedding_voiceprint.hpp"
#include "meetscribe/json_serialization.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace meetscribe;

namespace
{

struct CapturedStream
{
  std::mutex mutex;
  RealtimeConfig realtime;
  size_t chunks = 0;
};

class EchoStreamingProvider : public TranscriptionProvider
{
public:
  explicit EchoStreamingProvider(std::shared_ptr<CapturedStream> stream)
  : stream_(std::move(stream))
  {
  }

  std::string name() const override { return "echo"; }
  TranscriptionBackend kind() const override { return TranscriptionBackend::LOCAL_STREAMING; }
  CapabilitySet capabilities() const override { return {Capability::STREAMING}; }

  Status start_realtime(const RealtimeConfig & config) override
  {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    stream_->realtime = config;
    return Status{};
  }
  Status send_audio(const std::vector<uint8_t> &) override
  {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    ++stream_->chunks;
    return Status{};
  }
  Status stop_realtime() override { return Status{}; }

  TranscriptResult transcribe_file(
    const std::vector<uint8_t> &, const TranscriptionOptions &) override
  {
    TranscriptResult out;
    out.status = unsupported_operation(name(), "transcribe_file");
    return out;
  }

  bool health_check() override { return true; }

private:
  std::shared_ptr<CapturedStream> stream_;
};

class CannedBatchProvider : public TranscriptionProvider
{
public:
  explicit CannedBatchProvider(Status result)
  : result_(std::move(result))
  {
  }

  std::string name() const override { return "canned"; }
  TranscriptionBackend kind() const override { return TranscriptionBackend::LOCAL_BATCH; }
  CapabilitySet capabilities() const override { return {Capability::BATCH_TRANSCRIPTION}; }

  Status start_realtime(const RealtimeConfig &) override
  {
    return unsupported_operation(name(), "start_realtime");
  }
  Status send_audio(const std::vector<uint8_t> &) override
  {
    return unsupported_operation(name(), "send_audio");
  }
  Status stop_realtime() override { return Status{}; }

  TranscriptResult transcribe_file(
    const std::vector<uint8_t> &, const TranscriptionOptions & options) override
  {
    TranscriptResult out;
    out.status = result_;
    if (out.status.ok) {
      TranscriptSegment s;
      s.text = "Quarterly numbers look good.";
      s.start_time = 0.0;
      s.end_time = 2.5;
      out.segments = {s};
      out.full_text = s.text;
      out.language = options.language;
      out.duration = 2.5;
    }
    return out;
  }

  bool health_check() override { return true; }

private:
  Status result_;
};

std::shared_ptr<VoiceprintProvider> scripted_voiceprint()
{
  EmbeddingVoiceprintConfig config;
  config.engine_name = "speechbrain";
  config.executable = "/bin/sh";
  config.base_args = {"-c", "echo '{\"success\": true, \"embedding\": [1, 0, 0]}'", "fake"};
  config.dimension = 3;
  config.timeout_ms = 5000;
  return std::make_shared<EmbeddingVoiceprint>(config);
}

class ApiHandlersTest : public ::testing::Test
{
protected:
  ApiHandlersTest()
  : stream_(std::make_shared<CapturedStream>())
  {
    SessionEngineConfig config;
    config.max_sessions = 1;
    auto stream = stream_;
    engine_ = std::make_unique<SessionEngine>(
      config, [stream](const EngineConfig &) -> std::unique_ptr<TranscriptionProvider> {
        return std::make_unique<EchoStreamingProvider>(stream);
      });
  }

  ApiHandlers make_handlers(
    std::shared_ptr<VoiceprintProvider> voiceprint,
    Status batch_result = Status{},
    bool diagnostics = false)
  {
    ApiConfig config;
    config.diagnostics_enabled = diagnostics;
    config.default_engine.language = "en";
    auto pipeline = std::make_shared<BatchPipeline>(
      BatchPipelineConfig(),
      [batch_result](TranscriptionBackend, const std::string &) {
        return std::unique_ptr<TranscriptionProvider>(new CannedBatchProvider(batch_result));
      },
      nullptr, voiceprint);
    return ApiHandlers(config, *engine_, pipeline, voiceprint);
  }

  static std::string error_code(const ApiResponse & response)
  {
    return response.body["error"]["code"].asString();
  }

  std::shared_ptr<CapturedStream> stream_;
  std::unique_ptr<SessionEngine> engine_;
};

}  // namespace

TEST(HttpStatus, ErrorCodesMapToStatusCodes)
{
  EXPECT_EQ(http_status_for(ErrorCode::INVALID_INPUT), 400);
  EXPECT_EQ(http_status_for(ErrorCode::CAPABILITY_UNSUPPORTED), 400);
  EXPECT_EQ(http_status_for(ErrorCode::SESSION_NOT_FOUND), 404);
  EXPECT_EQ(http_status_for(ErrorCode::PROFILE_NOT_FOUND), 404);
  EXPECT_EQ(http_status_for(ErrorCode::INVALID_STATE_TRANSITION), 409);
  EXPECT_EQ(http_status_for(ErrorCode::SESSION_TERMINATED), 409);
  EXPECT_EQ(http_status_for(ErrorCode::INSUFFICIENT_ENROLLMENT), 409);
  EXPECT_EQ(http_status_for(ErrorCode::CAPACITY_EXCEEDED), 503);
  EXPECT_EQ(http_status_for(ErrorCode::SUBPROCESS_ERROR), 500);
  EXPECT_EQ(http_status_for(ErrorCode::NETWORK_ERROR), 500);
  EXPECT_EQ(http_status_for(ErrorCode::INTERNAL_ERROR), 500);
}

// ---------------------------------------------------------------- sessions

TEST_F(ApiHandlersTest, SessionLifecycleOverHandlers)
{
  ApiHandlers api = make_handlers(nullptr);

  const ApiResponse created = api.create_session(
    "{\"meetingId\": \"weekly-sync\", \"candidateSpeakerIds\": [\"u_alice\"],"
    " \"engineConfig\": {\"sampleRate\": 16000}}");
  ASSERT_EQ(created.status, 201) << created.body.toStyledString();
  const std::string id = created.body["sessionId"].asString();
  ASSERT_FALSE(id.empty());

  const ApiResponse started = api.start_session(id);
  ASSERT_EQ(started.status, 200);
  EXPECT_EQ(started.body["session"]["state"].asString(), "RUNNING");
  EXPECT_EQ(started.body["session"]["engineConfig"]["language"].asString(), "en");

  const ApiResponse sent = api.send_audio(id, std::string(640, '\0'));
  ASSERT_EQ(sent.status, 200);
  EXPECT_EQ(sent.body["accepted"].asUInt64(), 640U);

  RealtimeConfig realtime;
  {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    realtime = stream_->realtime;
  }
  ASSERT_TRUE(static_cast<bool>(realtime.on_transcript));
  TranscriptSegment final_segment;
  final_segment.text = "Good morning.";
  final_segment.start_time = 0.0;
  final_segment.end_time = 1.2;
  realtime.on_transcript(final_segment, true);

  const ApiResponse transcript = api.session_transcript(id);
  ASSERT_EQ(transcript.status, 200);
  ASSERT_EQ(transcript.body["segments"].size(), 1U);
  EXPECT_EQ(transcript.body["segments"][0]["text"].asString(), "Good morning.");

  EXPECT_EQ(api.pause_session(id).status, 200);
  const ApiResponse paused_again = api.pause_session(id);
  EXPECT_EQ(paused_again.status, 409);
  EXPECT_EQ(error_code(paused_again), "INVALID_STATE_TRANSITION");
  EXPECT_EQ(api.resume_session(id).status, 200);

  const ApiResponse stats = api.session_stats();
  EXPECT_EQ(stats.body["active"].asUInt64(), 1U);
  EXPECT_EQ(stats.body["capacity"].asUInt64(), 1U);

  EXPECT_EQ(api.destroy_session(id).status, 200);
  EXPECT_EQ(api.destroy_session(id).status, 200);
  EXPECT_EQ(api.send_audio(id, std::string(640, '\0')).status, 409);
}

TEST_F(ApiHandlersTest, CreateRejectsMalformedBodies)
{
  ApiHandlers api = make_handlers(nullptr);
  EXPECT_EQ(api.create_session("{not json").status, 400);
  EXPECT_EQ(api.create_session("[1, 2]").status, 400);
  EXPECT_EQ(api.create_session("{\"meetingId\": \"m\", \"candidateSpeakerIds\": \"u\"}").status, 400);
  EXPECT_EQ(
    api.create_session("{\"meetingId\": \"m\", \"engineConfig\": {\"backend\": \"cloud\"}}").status,
    400);
  const ApiResponse missing = api.create_session("{}");
  EXPECT_EQ(missing.status, 400);
  EXPECT_EQ(error_code(missing), "INVALID_INPUT");
}

TEST_F(ApiHandlersTest, CapacityAndUnknownSessions)
{
  ApiHandlers api = make_handlers(nullptr);
  ASSERT_EQ(api.create_session("{\"meetingId\": \"first\"}").status, 201);

  const ApiResponse full = api.create_session("{\"meetingId\": \"second\"}");
  EXPECT_EQ(full.status, 503);
  EXPECT_EQ(error_code(full), "CAPACITY_EXCEEDED");

  EXPECT_EQ(api.session_status("sess_missing").status, 404);
  EXPECT_EQ(api.start_session("sess_missing").status, 404);
  EXPECT_EQ(api.session_transcript("sess_missing").status, 404);
  EXPECT_EQ(api.destroy_session("sess_missing").status, 200);
}

// ---------------------------------------------------------------- batch transcription

TEST_F(ApiHandlersTest, TranscribeFileReturnsFusedSegments)
{
  ApiHandlers api = make_handlers(nullptr);
  const ApiResponse response = api.transcribe_file(
    true, std::string(3200, '\x01'), "standup.wav", "[\"u_alice\"]");

  ASSERT_EQ(response.status, 200) << response.body.toStyledString();
  const Json::Value & body = response.body;
  for (const char * key :
    {"segments", "fullText", "language", "duration", "numSpeakers", "degraded", "stages"})
  {
    EXPECT_TRUE(body.isMember(key)) << key;
  }
  EXPECT_EQ(body["language"].asString(), "en");
  ASSERT_EQ(body["segments"].size(), 1U);
  EXPECT_EQ(body["segments"][0]["speaker"]["id"].asString(), "u_alice");
  EXPECT_EQ(
    body["segments"][0]["speaker"]["provenance"].asString(), "fallback-roundrobin");
  EXPECT_FALSE(body["degraded"].asBool());
}

TEST_F(ApiHandlersTest, TranscribeFileInputErrors)
{
  ApiHandlers api = make_handlers(nullptr);
  EXPECT_EQ(api.transcribe_file(false, "", "", "").status, 400);
  EXPECT_EQ(api.transcribe_file(true, "", "a.wav", "").status, 400);

  const ApiResponse bad_speakers =
    api.transcribe_file(true, std::string(100, '\x01'), "a.wav", "{\"id\": 3}");
  EXPECT_EQ(bad_speakers.status, 400);
  EXPECT_EQ(error_code(bad_speakers), "INVALID_INPUT");
  EXPECT_EQ(api.transcribe_file(true, std::string(100, '\x01'), "a.wav", "[{}]").status, 400);
}

TEST_F(ApiHandlersTest, SpeakersWithoutVoiceprintAreAccepted)
{
  ApiHandlers api = make_handlers(nullptr);
  const ApiResponse response = api.transcribe_file(
    true, std::string(3200, '\x01'), "standup.wav",
    "[{\"id\": \"s1\", \"name\": \"Alice\", \"voiceprint\": null},"
    " {\"id\": \"s2\", \"name\": \"Bob\"}]");
  ASSERT_EQ(response.status, 200) << response.body.toStyledString();
  EXPECT_EQ(response.body["segments"][0]["speaker"]["id"].asString(), "s1");

  const ApiResponse bad = api.transcribe_file(
    true, std::string(3200, '\x01'), "standup.wav",
    "[{\"id\": \"s1\", \"voiceprint\": \"abc\"}]");
  EXPECT_EQ(bad.status, 400);
}

TEST(ParseCandidates, NullVoiceprintMeansNoEmbedding)
{
  Json::Value speakers(Json::arrayValue);
  Json::Value alice(Json::objectValue);
  alice["id"] = "s1";
  alice["name"] = "Alice";
  alice["voiceprint"] = Json::Value(Json::nullValue);
  speakers.append(alice);
  Json::Value bob(Json::objectValue);
  bob["id"] = "s2";
  bob["name"] = "Bob";
  speakers.append(bob);
  Json::Value carol(Json::objectValue);
  carol["id"] = "s3";
  carol["voiceprint"].append(0.5);
  carol["voiceprint"].append(0.25);
  speakers.append(carol);

  std::vector<CandidateIdentity> parsed;
  std::string error;
  ASSERT_TRUE(parse_candidates(speakers, parsed, error)) << error;
  ASSERT_EQ(parsed.size(), 3U);
  EXPECT_EQ(parsed[0].name, "Alice");
  EXPECT_TRUE(parsed[0].embedding.empty());
  EXPECT_TRUE(parsed[1].embedding.empty());
  EXPECT_EQ(parsed[2].embedding.size(), 2U);
  EXPECT_EQ(parsed[2].name, "s3");

  speakers[1]["voiceprint"] = 7;
  EXPECT_FALSE(parse_candidates(speakers, parsed, error));
  EXPECT_FALSE(error.empty());
}

TEST_F(ApiHandlersTest, PipelineFailureIsServerErrorWithStages)
{
  ApiHandlers api = make_handlers(
    nullptr, make_error(ErrorCode::SUBPROCESS_ERROR, "whisper exited with code 1", "CUDA OOM"));
  const ApiResponse response = api.transcribe_file(true, std::string(100, '\x01'), "a.wav", "");

  EXPECT_EQ(response.status, 500);
  EXPECT_EQ(error_code(response), "SUBPROCESS_ERROR");
  EXPECT_FALSE(response.body["error"].isMember("details"));
  EXPECT_TRUE(response.body["stages"].isArray());
}

TEST_F(ApiHandlersTest, DiagnosticsExposeDetails)
{
  ApiHandlers api = make_handlers(
    nullptr, make_error(ErrorCode::SUBPROCESS_ERROR, "whisper exited with code 1", "CUDA OOM"),
    true);
  const ApiResponse response = api.transcribe_file(true, std::string(100, '\x01'), "a.wav", "");
  EXPECT_EQ(response.body["error"]["details"].asString(), "CUDA OOM");
}

// ---------------------------------------------------------------- voiceprints

TEST_F(ApiHandlersTest, ProfileRoutesWithoutVoiceprintSupport)
{
  ApiHandlers api = make_handlers(nullptr);
  const ApiResponse response = api.create_profile("{\"ownerId\": \"u_alice\"}");
  EXPECT_EQ(response.status, 400);
  EXPECT_EQ(error_code(response), "CAPABILITY_UNSUPPORTED");
  EXPECT_EQ(api.list_profiles().status, 400);
  EXPECT_EQ(api.delete_profile("vp_1").status, 400);

  const ApiResponse health = api.health();
  EXPECT_TRUE(health.body["providers"]["voiceprint"].isNull());
}

TEST_F(ApiHandlersTest, ProfileLifecycle)
{
  ApiHandlers api = make_handlers(scripted_voiceprint());

  EXPECT_EQ(api.create_profile("{}").status, 400);
  const ApiResponse created = api.create_profile("{\"ownerId\": \"u_alice\"}");
  ASSERT_EQ(created.status, 201);
  const std::string id = created.body["profile"]["profileId"].asString();
  EXPECT_EQ(created.body["profile"]["status"].asString(), profile_status_string(ProfileStatus::CREATED));

  const ApiResponse early = api.verify_profile(id, std::string(3200, '\x01'));
  EXPECT_EQ(early.status, 409);
  EXPECT_EQ(error_code(early), "INSUFFICIENT_ENROLLMENT");

  const ApiResponse enrolled = api.enroll_profile(id, std::string(3200, '\x01'));
  ASSERT_EQ(enrolled.status, 200) << enrolled.body.toStyledString();
  EXPECT_EQ(enrolled.body["enrollment"]["enrollmentProgress"].asInt(), 100);

  const ApiResponse verified = api.verify_profile(id, std::string(3200, '\x01'));
  ASSERT_EQ(verified.status, 200);
  EXPECT_TRUE(verified.body["verification"]["verified"].asBool());
  EXPECT_EQ(api.verify_profile(id, "").status, 400);

  const ApiResponse listed = api.list_profiles();
  ASSERT_EQ(listed.body["profiles"].size(), 1U);
  EXPECT_EQ(listed.body["profiles"][0]["dimension"].asUInt64(), 3U);

  EXPECT_EQ(api.delete_profile(id).status, 200);
  const ApiResponse gone = api.delete_profile(id);
  EXPECT_EQ(gone.status, 404);
  EXPECT_EQ(error_code(gone), "PROFILE_NOT_FOUND");
  EXPECT_EQ(api.enroll_profile(id, std::string(10, '\x01')).status, 404);
}

TEST_F(ApiHandlersTest, IdentifySpeakerAgainstEnrolledProfiles)
{
  ApiHandlers disabled = make_handlers(nullptr);
  const ApiResponse unsupported = disabled.identify_speaker(std::string(3200, '\x01'), "");
  EXPECT_EQ(unsupported.status, 400);
  EXPECT_EQ(error_code(unsupported), "CAPABILITY_UNSUPPORTED");

  ApiHandlers api = make_handlers(scripted_voiceprint());
  EXPECT_EQ(api.identify_speaker("", "").status, 400);

  // Nobody enrolled: an open search finds nobody
  const ApiResponse empty = api.identify_speaker(std::string(3200, '\x01'), "");
  ASSERT_EQ(empty.status, 200) << empty.body.toStyledString();
  EXPECT_FALSE(empty.body["identified"].asBool());
  EXPECT_EQ(empty.body["candidates"].size(), 0U);

  const ApiResponse created = api.create_profile("{\"ownerId\": \"u_alice\"}");
  const std::string id = created.body["profile"]["profileId"].asString();
  ASSERT_EQ(api.enroll_profile(id, std::string(3200, '\x01')).status, 200);

  const ApiResponse open = api.identify_speaker(std::string(3200, '\x01'), "");
  ASSERT_EQ(open.status, 200) << open.body.toStyledString();
  EXPECT_TRUE(open.body["identified"].asBool());
  EXPECT_EQ(open.body["profileId"].asString(), id);
  EXPECT_DOUBLE_EQ(open.body["confidence"].asDouble(), 1.0);
  ASSERT_EQ(open.body["candidates"].size(), 1U);
  EXPECT_EQ(open.body["candidates"][0]["profileId"].asString(), id);

  const ApiResponse narrowed =
    api.identify_speaker(std::string(3200, '\x01'), "[\"" + id + "\"]");
  ASSERT_EQ(narrowed.status, 200);
  EXPECT_EQ(narrowed.body["profileId"].asString(), id);

  const ApiResponse unknown = api.identify_speaker(std::string(3200, '\x01'), "[\"vp_missing\"]");
  EXPECT_EQ(unknown.status, 404);
  EXPECT_EQ(error_code(unknown), "PROFILE_NOT_FOUND");
  EXPECT_EQ(api.identify_speaker(std::string(3200, '\x01'), "{\"id\": 3}").status, 400);
}

TEST_F(ApiHandlersTest, HealthReportsProviders)
{
  ApiHandlers api = make_handlers(scripted_voiceprint());
  const ApiResponse health = api.health();
  ASSERT_EQ(health.status, 200);
  EXPECT_EQ(health.body["status"].asString(), "ok");
  EXPECT_EQ(health.body["providers"]["realtime"].asString(), "local-streaming");
  EXPECT_EQ(health.body["providers"]["batch"].asString(), "local-batch");
  EXPECT_EQ(health.body["providers"]["voiceprint"].asString(), "speechbrain");
  EXPECT_EQ(health.body["sessions"]["capacity"].asUInt64(), 1U);
}
