#include <gtest/gtest.h>

#include "meetscribe/provider_factory.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace meetscribe;

namespace
{

// Nothing listens on the discard port in the test environment.
const char * kRefusedHttp = "http://127.0.0.1:9/v1";
const char * kRefusedWs = "ws://127.0.0.1:9/asr";

ProviderSettings offline_settings()
{
  ProviderSettings settings;
  settings.hosted_batch.api_key = "test-key";
  settings.hosted_batch.base_url = kRefusedHttp;
  settings.hosted_batch.timeout_sec = 5;
  settings.hosted_streaming.api_key = "test-key";
  settings.hosted_streaming.url = kRefusedWs;
  settings.hosted_streaming.connect_timeout_sec = 5;
  return settings;
}

}  // namespace

TEST(ProviderFactory, BuildsEveryTranscriptionBackend)
{
  const ProviderFactory factory(offline_settings());
  for (const auto backend : {
      TranscriptionBackend::HOSTED_STREAMING, TranscriptionBackend::HOSTED_BATCH,
      TranscriptionBackend::LOCAL_STREAMING, TranscriptionBackend::LOCAL_BATCH})
  {
    const auto provider = factory.create_transcription(backend, "en");
    ASSERT_NE(provider, nullptr) << transcription_backend_string(backend);
    EXPECT_EQ(provider->kind(), backend);
  }
}

TEST(ProviderFactory, CapabilitiesMatchBackendKind)
{
  const ProviderFactory factory(offline_settings());

  const auto hosted_stream = factory.create_transcription(TranscriptionBackend::HOSTED_STREAMING);
  EXPECT_TRUE(hosted_stream->supports(Capability::STREAMING));
  EXPECT_FALSE(hosted_stream->supports(Capability::BATCH_TRANSCRIPTION));

  const auto hosted_batch = factory.create_transcription(TranscriptionBackend::HOSTED_BATCH);
  EXPECT_FALSE(hosted_batch->supports(Capability::STREAMING));
  EXPECT_TRUE(hosted_batch->supports(Capability::BATCH_TRANSCRIPTION));

  const auto local_stream = factory.create_transcription(TranscriptionBackend::LOCAL_STREAMING);
  EXPECT_TRUE(local_stream->supports(Capability::STREAMING));
  EXPECT_TRUE(local_stream->supports(Capability::BATCH_TRANSCRIPTION));

  const auto local_batch = factory.create_transcription(TranscriptionBackend::LOCAL_BATCH);
  EXPECT_FALSE(local_batch->supports(Capability::STREAMING));
}

TEST(ProviderFactory, BuildsBothVoiceprintFamilies)
{
  const ProviderFactory factory(offline_settings());

  const auto embedding = factory.create_voiceprint(VoiceprintBackend::EMBEDDING);
  ASSERT_NE(embedding, nullptr);
  EXPECT_EQ(embedding->kind(), VoiceprintBackend::EMBEDDING);
  EXPECT_FALSE(embedding->supports(Capability::DIARIZATION));
  EXPECT_TRUE(embedding->supports(Capability::VERIFICATION));

  const auto diarizing = factory.create_voiceprint(VoiceprintBackend::DIARIZATION);
  ASSERT_NE(diarizing, nullptr);
  EXPECT_EQ(diarizing->kind(), VoiceprintBackend::DIARIZATION);
  EXPECT_TRUE(diarizing->supports(Capability::DIARIZATION));
}

TEST(HostedBatchTranscription, RefusesRealtimeOperations)
{
  HostedBatchConfig config;
  config.api_key = "test-key";
  HostedBatchTranscription provider(config);

  EXPECT_EQ(provider.start_realtime(RealtimeConfig()).code, ErrorCode::CAPABILITY_UNSUPPORTED);
  EXPECT_EQ(provider.send_audio({1, 2}).code, ErrorCode::CAPABILITY_UNSUPPORTED);
}

TEST(HostedBatchTranscription, InputAndConfigurationChecks)
{
  HostedBatchConfig config;
  HostedBatchTranscription unconfigured(config);
  EXPECT_FALSE(unconfigured.transcribe_file({1, 2, 3}, TranscriptionOptions()).status.ok);
  EXPECT_FALSE(unconfigured.health_check());

  config.api_key = "test-key";
  HostedBatchTranscription provider(config);
  EXPECT_EQ(
    provider.transcribe_file({}, TranscriptionOptions()).status.code, ErrorCode::INVALID_INPUT);
}

TEST(HostedBatchTranscription, UnreachableServiceIsNetworkError)
{
  HostedBatchConfig config;
  config.api_key = "test-key";
  config.base_url = kRefusedHttp;
  config.timeout_sec = 5;
  HostedBatchTranscription provider(config);

  const TranscriptResult result =
    provider.transcribe_file(std::vector<uint8_t>(320, 0), TranscriptionOptions());
  EXPECT_EQ(result.status.code, ErrorCode::NETWORK_ERROR);
}

TEST(HostedStreamingTranscription, ConnectFailuresAreNetworkErrors)
{
  HostedStreamingConfig config;
  config.api_key = "test-key";
  HostedStreamingTranscription no_url(config);
  EXPECT_EQ(no_url.start_realtime(RealtimeConfig()).code, ErrorCode::NETWORK_ERROR);

  config.url = kRefusedWs;
  config.connect_timeout_sec = 5;
  HostedStreamingTranscription refused(config);
  EXPECT_EQ(refused.start_realtime(RealtimeConfig()).code, ErrorCode::NETWORK_ERROR);
}

TEST(HostedStreamingTranscription, AudioBeforeStartIsRejected)
{
  HostedStreamingConfig config;
  HostedStreamingTranscription provider(config);
  EXPECT_EQ(provider.send_audio({1, 2}).code, ErrorCode::INVALID_STATE_TRANSITION);
  EXPECT_EQ(
    provider.transcribe_file({1, 2}, TranscriptionOptions()).status.code,
    ErrorCode::CAPABILITY_UNSUPPORTED);
}
