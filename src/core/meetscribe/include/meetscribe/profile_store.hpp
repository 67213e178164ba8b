#pragma once

#include "meetscribe/errors.hpp"
#include "meetscribe/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meetscribe
{

enum class EnrollmentPolicy
{
  REPLACE,   ///< each enrollment overwrites the stored embedding
  AVERAGE    ///< running mean over all enrollments
};

bool parse_enrollment_policy(const std::string & text, EnrollmentPolicy & out);

/// Voiceprint profiles keyed by id. Every access goes through one mutex;
/// embedding extraction happens between begin_enrollment() and
/// apply_enrollment() without holding it.
class ProfileStore
{
public:
  /// dimension == 0 accepts any length, as long as it stays consistent per profile
  ProfileStore(size_t dimension, int required_enrollments, EnrollmentPolicy policy);

  VoiceprintProfile create(const std::string & owner_id);
  bool get(const std::string & profile_id, VoiceprintProfile & out) const;
  bool remove(const std::string & profile_id);
  std::vector<VoiceprintProfile> list() const;

  /// Marks the profile ENROLLING and reports the status it had before
  Status begin_enrollment(const std::string & profile_id, ProfileStatus & previous);
  EnrollmentResult apply_enrollment(
    const std::string & profile_id,
    const std::vector<float> & embedding,
    ProfileStatus previous);
  /// Extraction failed: a profile that was never enrolled becomes FAILED,
  /// otherwise the previous status is restored
  void abort_enrollment(const std::string & profile_id, ProfileStatus previous);

  size_t dimension() const { return dimension_; }
  int required_enrollments() const { return required_enrollments_; }

private:
  EnrollmentResult progress_of(const VoiceprintProfile & profile) const;

  const size_t dimension_;
  const int required_enrollments_;
  const EnrollmentPolicy policy_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, VoiceprintProfile> profiles_;
  std::atomic<uint64_t> sequence_{0};
};

}  // namespace meetscribe
