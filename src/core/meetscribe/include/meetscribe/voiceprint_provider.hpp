#pragma once

#include "meetscribe/errors.hpp"
#include "meetscribe/transcription_provider.hpp"
#include "meetscribe/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe
{

enum class VoiceprintBackend
{
  EMBEDDING,     ///< embedding extraction only (speechbrain, wespeaker)
  DIARIZATION    ///< diarization plus embeddings (pyannote)
};

std::string voiceprint_backend_string(VoiceprintBackend backend);
bool parse_voiceprint_backend(const std::string & text, VoiceprintBackend & out);

class VoiceprintProvider
{
public:
  virtual ~VoiceprintProvider() = default;

  virtual std::string name() const = 0;
  virtual VoiceprintBackend kind() const = 0;
  virtual CapabilitySet capabilities() const = 0;
  bool supports(Capability capability) const;

  virtual ProfileResult create_profile(const std::string & owner_id) = 0;
  virtual EnrollmentResult enroll_profile(
    const std::string & profile_id, const std::vector<uint8_t> & audio) = 0;
  virtual Status delete_profile(const std::string & profile_id) = 0;
  virtual std::vector<VoiceprintProfile> list_profiles() const = 0;

  virtual IdentificationResult identify_speaker(
    const std::vector<uint8_t> & audio,
    const std::vector<std::string> & candidate_profile_ids) = 0;
  virtual VerificationResult verify_speaker(
    const std::string & profile_id, const std::vector<uint8_t> & audio) = 0;
  virtual DiarizationResult diarization(const std::vector<uint8_t> & audio) = 0;

  virtual bool health_check() = 0;
};

}  // namespace meetscribe
