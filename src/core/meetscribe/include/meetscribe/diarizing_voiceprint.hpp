#pragma once

#include "meetscribe/embedding_voiceprint.hpp"

#include <string>
#include <vector>

namespace meetscribe
{

struct DiarizingVoiceprintConfig
{
  std::string engine_name = "pyannote";
  std::string executable = "python3";
  std::vector<std::string> base_args = {"engines/pyannote_service.py"};
  std::string device = "cpu";
  size_t dimension = 512;
  int required_enrollments = 2;
  EnrollmentPolicy policy = EnrollmentPolicy::AVERAGE;
  MatchThresholds thresholds;
  int min_speakers = 1;
  int max_speakers = 10;
  long timeout_ms = 600000;
  std::string temp_directory;
};

/// Diarization-capable engines (pyannote). Engine contract:
///   embed <wav> <device>                 -> {success, embedding: [..]}
///   diarize <wav> <min> <max> <device>   -> {success, segments: [{speaker, start, end,
///                                            confidence?}], num_speakers?,
///                                            embeddings?: {tag: [..]}}
class DiarizingVoiceprint : public EmbeddingBackedVoiceprint
{
public:
  explicit DiarizingVoiceprint(const DiarizingVoiceprintConfig & config);

  std::string name() const override { return config_.engine_name; }
  VoiceprintBackend kind() const override { return VoiceprintBackend::DIARIZATION; }
  CapabilitySet capabilities() const override;

  DiarizationResult diarization(const std::vector<uint8_t> & audio) override;
  bool health_check() override;

protected:
  EmbeddingResult extract_embedding(const std::vector<uint8_t> & audio) override;

private:
  DiarizingVoiceprintConfig config_;
  SubprocessCommand command_;
};

/// Decodes a diarize document; segment order violations are SUBPROCESS_ERROR
Status parse_diarization_document(const Json::Value & document, DiarizationResult & out);

}  // namespace meetscribe
