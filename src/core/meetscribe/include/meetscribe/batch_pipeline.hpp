#pragma once

#include "meetscribe/format_converter.hpp"
#include "meetscribe/segment_fusion.hpp"
#include "meetscribe/transcription_provider.hpp"
#include "meetscribe/voiceprint_provider.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace meetscribe
{

enum class StageStatus
{
  OK,
  SKIPPED,
  FAILED
};

std::string stage_status_string(StageStatus status);

struct StageReport
{
  std::string stage;      ///< format, transcription, diarization, fusion, cleanup
  StageStatus status = StageStatus::OK;
  std::string message;
  long duration_ms = 0;
};

struct BatchRequest
{
  std::vector<uint8_t> audio;
  std::string filename = "audio.wav";
  std::string language;
  std::vector<CandidateIdentity> candidates;
};

struct BatchResult
{
  Status status;
  std::vector<FusedTranscriptEntry> entries;
  TranscriptResult transcript;
  int num_speakers = 0;
  bool degraded = false;   ///< diarization failed, entries carry no speaker
  std::vector<StageReport> stages;
};

struct BatchPipelineConfig
{
  TranscriptionBackend backend = TranscriptionBackend::LOCAL_BATCH;
  std::string temp_directory;
  FusionConfig fusion;
};

using BatchProviderFactory = std::function<std::unique_ptr<TranscriptionProvider>(
      TranscriptionBackend backend, const std::string & language)>;

/// Whole-file processing: format -> transcription -> diarization -> fusion,
/// with every temporary file released before run() returns.
class BatchPipeline
{
public:
  /// `voiceprint` may be null; diarization is then skipped.
  BatchPipeline(
    const BatchPipelineConfig & config,
    BatchProviderFactory factory,
    std::shared_ptr<FormatConverter> converter,
    std::shared_ptr<VoiceprintProvider> voiceprint);

  BatchResult run(const BatchRequest & request);

private:
  BatchPipelineConfig config_;
  BatchProviderFactory factory_;
  std::shared_ptr<FormatConverter> converter_;
  std::shared_ptr<VoiceprintProvider> voiceprint_;
};

}  // namespace meetscribe
