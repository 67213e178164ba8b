#include "meetscribe/profile_store.hpp"

#include <meetscribe_common/string_utils.hpp>

#include <algorithm>
#include <chrono>

using namespace std;


namespace meetscribe
{

bool parse_enrollment_policy(const string & text, EnrollmentPolicy & out)
{
  const string value = meetscribe_common::to_lower(meetscribe_common::trim(text));
  if (value == "replace") {
    out = EnrollmentPolicy::REPLACE;
  } else if (value == "average") {
    out = EnrollmentPolicy::AVERAGE;
  } else {
    return false;
  }
  return true;
}

ProfileStore::ProfileStore(size_t dimension, int required_enrollments, EnrollmentPolicy policy)
: dimension_(dimension),
  required_enrollments_(max(1, required_enrollments)),
  policy_(policy)
{
}

VoiceprintProfile ProfileStore::create(const string & owner_id)
{
  const auto now_ms = chrono::duration_cast<chrono::milliseconds>(
    chrono::system_clock::now().time_since_epoch()).count();

  VoiceprintProfile profile;
  profile.profile_id = "vp_" + to_string(now_ms) + "_" + to_string(++sequence_);
  profile.owner_id = owner_id;

  lock_guard<mutex> lock(mutex_);
  profiles_[profile.profile_id] = profile;
  return profile;
}

bool ProfileStore::get(const string & profile_id, VoiceprintProfile & out) const
{
  lock_guard<mutex> lock(mutex_);
  const auto it = profiles_.find(profile_id);
  if (it == profiles_.end()) {
    return false;
  }
  out = it->second;
  return true;
}

bool ProfileStore::remove(const string & profile_id)
{
  lock_guard<mutex> lock(mutex_);
  return profiles_.erase(profile_id) > 0;
}

vector<VoiceprintProfile> ProfileStore::list() const
{
  lock_guard<mutex> lock(mutex_);
  vector<VoiceprintProfile> out;
  out.reserve(profiles_.size());
  for (const auto & entry : profiles_) {
    out.push_back(entry.second);
  }
  sort(out.begin(), out.end(), [](const VoiceprintProfile & a, const VoiceprintProfile & b) {
      return a.profile_id < b.profile_id;
    });
  return out;
}

Status ProfileStore::begin_enrollment(const string & profile_id, ProfileStatus & previous)
{
  lock_guard<mutex> lock(mutex_);
  const auto it = profiles_.find(profile_id);
  if (it == profiles_.end()) {
    return make_error(ErrorCode::PROFILE_NOT_FOUND, "voiceprint profile not found: " + profile_id);
  }
  previous = it->second.status;
  if (it->second.status != ProfileStatus::ENROLLED) {
    it->second.status = ProfileStatus::ENROLLING;
  }
  return Status{};
}

EnrollmentResult ProfileStore::apply_enrollment(
  const string & profile_id,
  const vector<float> & embedding,
  ProfileStatus previous)
{
  EnrollmentResult out;
  out.profile_id = profile_id;

  lock_guard<mutex> lock(mutex_);
  const auto it = profiles_.find(profile_id);
  if (it == profiles_.end()) {
    out.status = make_error(
      ErrorCode::PROFILE_NOT_FOUND, "voiceprint profile deleted during enrollment: " + profile_id);
    return out;
  }
  VoiceprintProfile & profile = it->second;

  const size_t expected = dimension_ > 0 ? dimension_ : profile.embedding.size();
  if (embedding.empty() || (expected > 0 && embedding.size() != expected)) {
    profile.status = previous;
    out.status = make_error(
      ErrorCode::SUBPROCESS_ERROR,
      "embedding dimension " + to_string(embedding.size()) + " does not match expected " +
      to_string(expected));
    out.profile_status = profile.status;
    return out;
  }

  if (policy_ == EnrollmentPolicy::REPLACE || profile.embedding.empty()) {
    profile.embedding = embedding;
  } else {
    const float n = static_cast<float>(profile.enrollment_count);
    for (size_t i = 0; i < embedding.size(); ++i) {
      profile.embedding[i] = (profile.embedding[i] * n + embedding[i]) / (n + 1.0F);
    }
  }
  ++profile.enrollment_count;
  profile.status = profile.enrollment_count >= required_enrollments_ ?
    ProfileStatus::ENROLLED : ProfileStatus::ENROLLING;

  const EnrollmentResult progress = progress_of(profile);
  out.enrollment_progress = progress.enrollment_progress;
  out.remaining_enrollments = progress.remaining_enrollments;
  out.profile_status = profile.status;
  return out;
}

void ProfileStore::abort_enrollment(const string & profile_id, ProfileStatus previous)
{
  lock_guard<mutex> lock(mutex_);
  const auto it = profiles_.find(profile_id);
  if (it == profiles_.end()) {
    return;
  }
  it->second.status = it->second.enrollment_count == 0 ? ProfileStatus::FAILED : previous;
}

EnrollmentResult ProfileStore::progress_of(const VoiceprintProfile & profile) const
{
  EnrollmentResult out;
  out.profile_id = profile.profile_id;
  out.enrollment_progress = min(100, profile.enrollment_count * 100 / required_enrollments_);
  out.remaining_enrollments = max(0, required_enrollments_ - profile.enrollment_count);
  out.profile_status = profile.status;
  return out;
}

}  // namespace meetscribe
