#pragma once

#include "meetscribe/profile_store.hpp"
#include "meetscribe/subprocess_bridge.hpp"
#include "meetscribe/voiceprint_provider.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe
{

struct MatchThresholds
{
  double identification = 0.7;
  double verification = 0.75;
};

/// Profile management plus cosine identify/verify shared by every backend
/// that can turn audio into a speaker embedding.
class EmbeddingBackedVoiceprint : public VoiceprintProvider
{
public:
  ProfileResult create_profile(const std::string & owner_id) override;
  EnrollmentResult enroll_profile(
    const std::string & profile_id, const std::vector<uint8_t> & audio) override;
  Status delete_profile(const std::string & profile_id) override;
  std::vector<VoiceprintProfile> list_profiles() const override;

  IdentificationResult identify_speaker(
    const std::vector<uint8_t> & audio,
    const std::vector<std::string> & candidate_profile_ids) override;
  VerificationResult verify_speaker(
    const std::string & profile_id, const std::vector<uint8_t> & audio) override;

protected:
  struct EmbeddingResult
  {
    Status status;
    std::vector<float> embedding;
  };

  EmbeddingBackedVoiceprint(
    size_t dimension,
    int required_enrollments,
    EnrollmentPolicy policy,
    const MatchThresholds & thresholds);

  virtual EmbeddingResult extract_embedding(const std::vector<uint8_t> & audio) = 0;

  ProfileStore store_;
  MatchThresholds thresholds_;
};

struct EmbeddingVoiceprintConfig
{
  std::string engine_name = "speechbrain";
  std::string executable = "python3";
  std::vector<std::string> base_args = {"engines/speechbrain_service.py"};
  std::string device = "cpu";
  size_t dimension = 192;
  int required_enrollments = 1;
  EnrollmentPolicy policy = EnrollmentPolicy::REPLACE;
  MatchThresholds thresholds;
  long timeout_ms = 120000;
  std::string temp_directory;
};

/// Embedding-only engines (speechbrain ECAPA, wespeaker). No diarization.
/// Engine contract: `extract <wav> <device>` -> {success, embedding: [..]}
class EmbeddingVoiceprint : public EmbeddingBackedVoiceprint
{
public:
  explicit EmbeddingVoiceprint(const EmbeddingVoiceprintConfig & config);

  std::string name() const override { return config_.engine_name; }
  VoiceprintBackend kind() const override { return VoiceprintBackend::EMBEDDING; }
  CapabilitySet capabilities() const override;

  DiarizationResult diarization(const std::vector<uint8_t> & audio) override;
  bool health_check() override;

protected:
  EmbeddingResult extract_embedding(const std::vector<uint8_t> & audio) override;

private:
  EmbeddingVoiceprintConfig config_;
  SubprocessCommand command_;
};

}  // namespace meetscribe
