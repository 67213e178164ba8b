#pragma once

#include "meetscribe/errors.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace meetscribe
{

/// Times are seconds relative to the start of the stream or file.
struct TranscriptSegment
{
  std::string text;
  double start_time = 0.0;
  double end_time = 0.0;
  std::optional<double> confidence;
  std::optional<std::string> speaker_label;
};

struct TranscriptResult
{
  Status status;
  std::vector<TranscriptSegment> segments;
  std::string full_text;
  std::string language;
  double duration = 0.0;
};

struct DiarizationSegment
{
  std::string speaker_tag;   ///< provider-local tag such as "SPEAKER_01"
  double start_time = 0.0;
  double end_time = 0.0;
  std::optional<double> confidence;
};

struct DiarizationResult
{
  Status status;
  std::vector<DiarizationSegment> segments;
  int num_speakers = 0;
  std::map<std::string, std::vector<float>> speaker_embeddings;
};

enum class ProfileStatus
{
  CREATED,
  ENROLLING,
  ENROLLED,
  FAILED
};

std::string profile_status_string(ProfileStatus status);

struct VoiceprintProfile
{
  std::string profile_id;
  std::string owner_id;
  std::vector<float> embedding;
  int enrollment_count = 0;
  ProfileStatus status = ProfileStatus::CREATED;
};

struct ProfileResult
{
  Status status;
  VoiceprintProfile profile;
};

struct EnrollmentResult
{
  Status status;
  std::string profile_id;
  int enrollment_progress = 0;     ///< 0..100
  int remaining_enrollments = 0;
  ProfileStatus profile_status = ProfileStatus::CREATED;
};

struct IdentificationResult
{
  Status status;
  bool identified = false;
  std::optional<std::string> profile_id;
  double confidence = 0.0;
  /// (profile id, confidence), highest first
  std::vector<std::pair<std::string, double>> candidates;
};

struct VerificationResult
{
  Status status;
  bool verified = false;
  double confidence = 0.0;
  double threshold = 0.0;
};

/// An enrolled identity a transcript may be attributed to
struct CandidateIdentity
{
  std::string id;
  std::string name;
  std::vector<float> embedding;   ///< empty when no voiceprint is known
};

/// Cosine similarity in [-1, 1]; 0 when the vectors are empty, differ in
/// length or have zero norm
double cosine_similarity(const std::vector<float> & a, const std::vector<float> & b);

}  // namespace meetscribe
