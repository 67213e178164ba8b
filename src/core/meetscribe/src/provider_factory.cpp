#include "meetscribe/provider_factory.hpp"

using namespace std;


namespace meetscribe
{

ProviderFactory::ProviderFactory(const ProviderSettings & settings)
: settings_(settings)
{
}

unique_ptr<TranscriptionProvider> ProviderFactory::create_transcription(
  TranscriptionBackend backend, const string & language) const
{
  switch (backend) {
    case TranscriptionBackend::HOSTED_STREAMING: {
        HostedStreamingConfig config = settings_.hosted_streaming;
        if (!language.empty()) {
          config.language = language;
        }
        return make_unique<HostedStreamingTranscription>(config);
      }
    case TranscriptionBackend::HOSTED_BATCH: {
        HostedBatchConfig config = settings_.hosted_batch;
        if (!language.empty()) {
          config.language = language;
        }
        return make_unique<HostedBatchTranscription>(config);
      }
    case TranscriptionBackend::LOCAL_STREAMING: {
        LocalStreamingConfig config = settings_.local_streaming;
        if (!language.empty()) {
          config.language = language;
        }
        return make_unique<LocalStreamingTranscription>(config);
      }
    case TranscriptionBackend::LOCAL_BATCH: {
        LocalBatchConfig config = settings_.local_batch;
        if (!language.empty()) {
          config.language = language;
        }
        return make_unique<LocalBatchTranscription>(config);
      }
  }
  return nullptr;
}

shared_ptr<VoiceprintProvider> ProviderFactory::create_voiceprint(VoiceprintBackend backend) const
{
  switch (backend) {
    case VoiceprintBackend::EMBEDDING:
      return make_shared<EmbeddingVoiceprint>(settings_.embedding_voiceprint);
    case VoiceprintBackend::DIARIZATION:
      return make_shared<DiarizingVoiceprint>(settings_.diarizing_voiceprint);
  }
  return nullptr;
}

}  // namespace meetscribe
