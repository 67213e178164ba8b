#pragma once

#include "meetscribe/diarizing_voiceprint.hpp"
#include "meetscribe/embedding_voiceprint.hpp"
#include "meetscribe/hosted_transcription.hpp"
#include "meetscribe/local_transcription.hpp"
#include "meetscribe/transcription_provider.hpp"
#include "meetscribe/voiceprint_provider.hpp"

#include <memory>
#include <string>

namespace meetscribe
{

struct ProviderSettings
{
  HostedStreamingConfig hosted_streaming;
  HostedBatchConfig hosted_batch;
  LocalStreamingConfig local_streaming;
  LocalBatchConfig local_batch;
  EmbeddingVoiceprintConfig embedding_voiceprint;
  DiarizingVoiceprintConfig diarizing_voiceprint;

  TranscriptionBackend realtime_backend = TranscriptionBackend::LOCAL_STREAMING;
  TranscriptionBackend batch_backend = TranscriptionBackend::LOCAL_BATCH;
  bool voiceprint_enabled = true;
  VoiceprintBackend voiceprint_backend = VoiceprintBackend::DIARIZATION;
};

/// Maps backend kinds onto concrete providers. The settings are copied, so a
/// factory can be handed to other threads while the node reconfigures.
class ProviderFactory
{
public:
  explicit ProviderFactory(const ProviderSettings & settings);

  /// `language` overrides the configured default when non-empty
  std::unique_ptr<TranscriptionProvider> create_transcription(
    TranscriptionBackend backend, const std::string & language = "") const;

  std::shared_ptr<VoiceprintProvider> create_voiceprint(VoiceprintBackend backend) const;

  const ProviderSettings & settings() const { return settings_; }

private:
  ProviderSettings settings_;
};

}  // namespace meetscribe
