#include "meetscribe/embedding_voiceprint.hpp"

#include "meetscribe/temp_files.hpp"

#include <meetscribe_common/json_utils.hpp>

#include <algorithm>

using namespace std;


namespace meetscribe
{

EmbeddingBackedVoiceprint::EmbeddingBackedVoiceprint(
  size_t dimension,
  int required_enrollments,
  EnrollmentPolicy policy,
  const MatchThresholds & thresholds)
: store_(dimension, required_enrollments, policy),
  thresholds_(thresholds)
{
}

ProfileResult EmbeddingBackedVoiceprint::create_profile(const string & owner_id)
{
  ProfileResult out;
  if (owner_id.empty()) {
    out.status = make_error(ErrorCode::INVALID_INPUT, "owner id is empty");
    return out;
  }
  out.profile = store_.create(owner_id);
  return out;
}

EnrollmentResult EmbeddingBackedVoiceprint::enroll_profile(
  const string & profile_id, const vector<uint8_t> & audio)
{
  EnrollmentResult out;
  out.profile_id = profile_id;

  VoiceprintProfile existing;
  if (!store_.get(profile_id, existing)) {
    out.status = make_error(ErrorCode::PROFILE_NOT_FOUND, "voiceprint profile not found: " + profile_id);
    return out;
  }
  if (audio.empty()) {
    out.status = make_error(ErrorCode::INVALID_INPUT, "enrollment audio is empty");
    return out;
  }

  ProfileStatus previous = existing.status;
  const Status begin = store_.begin_enrollment(profile_id, previous);
  if (!begin.ok) {
    out.status = begin;
    return out;
  }

  const EmbeddingResult extracted = extract_embedding(audio);
  if (!extracted.status.ok) {
    store_.abort_enrollment(profile_id, previous);
    out.status = extracted.status;
    return out;
  }
  return store_.apply_enrollment(profile_id, extracted.embedding, previous);
}

Status EmbeddingBackedVoiceprint::delete_profile(const string & profile_id)
{
  if (!store_.remove(profile_id)) {
    return make_error(ErrorCode::PROFILE_NOT_FOUND, "voiceprint profile not found: " + profile_id);
  }
  return Status{};
}

vector<VoiceprintProfile> EmbeddingBackedVoiceprint::list_profiles() const
{
  return store_.list();
}

IdentificationResult EmbeddingBackedVoiceprint::identify_speaker(
  const vector<uint8_t> & audio,
  const vector<string> & candidate_profile_ids)
{
  IdentificationResult out;

  vector<VoiceprintProfile> pool;
  if (candidate_profile_ids.empty()) {
    pool = store_.list();
  } else {
    for (const auto & id : candidate_profile_ids) {
      VoiceprintProfile profile;
      if (!store_.get(id, profile)) {
        out.status = make_error(ErrorCode::PROFILE_NOT_FOUND, "voiceprint profile not found: " + id);
        return out;
      }
      pool.push_back(profile);
    }
  }

  pool.erase(
    remove_if(pool.begin(), pool.end(), [](const VoiceprintProfile & p) {
      return p.status != ProfileStatus::ENROLLED;
    }),
    pool.end());
  if (pool.empty()) {
    out.status = make_error(
      ErrorCode::INSUFFICIENT_ENROLLMENT, "no enrolled profile among the candidates");
    return out;
  }

  const EmbeddingResult extracted = extract_embedding(audio);
  if (!extracted.status.ok) {
    out.status = extracted.status;
    return out;
  }

  for (const auto & profile : pool) {
    const double similarity = cosine_similarity(extracted.embedding, profile.embedding);
    out.candidates.emplace_back(profile.profile_id, max(0.0, similarity));
  }
  stable_sort(
    out.candidates.begin(), out.candidates.end(),
    [](const pair<string, double> & a, const pair<string, double> & b) {
      return a.second > b.second;
    });

  out.confidence = out.candidates.front().second;
  if (out.confidence >= thresholds_.identification) {
    out.identified = true;
    out.profile_id = out.candidates.front().first;
  }
  return out;
}

VerificationResult EmbeddingBackedVoiceprint::verify_speaker(
  const string & profile_id, const vector<uint8_t> & audio)
{
  VerificationResult out;
  out.threshold = thresholds_.verification;

  VoiceprintProfile profile;
  if (!store_.get(profile_id, profile)) {
    out.status = make_error(ErrorCode::PROFILE_NOT_FOUND, "voiceprint profile not found: " + profile_id);
    return out;
  }
  if (profile.status != ProfileStatus::ENROLLED) {
    out.status = make_error(
      ErrorCode::INSUFFICIENT_ENROLLMENT,
      "profile " + profile_id + " is " + profile_status_string(profile.status));
    return out;
  }

  const EmbeddingResult extracted = extract_embedding(audio);
  if (!extracted.status.ok) {
    out.status = extracted.status;
    return out;
  }
  out.confidence = max(0.0, cosine_similarity(extracted.embedding, profile.embedding));
  out.verified = out.confidence >= out.threshold;
  return out;
}

EmbeddingVoiceprint::EmbeddingVoiceprint(const EmbeddingVoiceprintConfig & config)
: EmbeddingBackedVoiceprint(
    config.dimension, config.required_enrollments, config.policy, config.thresholds),
  config_(config)
{
  command_.executable = config_.executable;
  command_.base_args = config_.base_args;
}

CapabilitySet EmbeddingVoiceprint::capabilities() const
{
  return {Capability::ENROLLMENT, Capability::IDENTIFICATION, Capability::VERIFICATION};
}

DiarizationResult EmbeddingVoiceprint::diarization(const vector<uint8_t> &)
{
  DiarizationResult out;
  out.status = unsupported_operation(name(), "diarization");
  return out;
}

bool EmbeddingVoiceprint::health_check()
{
  return run_one_shot(command_, "test", {}, chrono::seconds(30)).status.ok;
}

EmbeddingBackedVoiceprint::EmbeddingResult EmbeddingVoiceprint::extract_embedding(
  const vector<uint8_t> & audio)
{
  EmbeddingResult out;
  ScopedTempFile audio_file(config_.temp_directory, "voiceprint", ".wav");
  if (!audio_file.write(audio)) {
    out.status = make_error(ErrorCode::INTERNAL_ERROR, "failed to write " + audio_file.path());
    return out;
  }

  const OneShotResult run = run_one_shot(
    command_, "extract", {audio_file.path(), config_.device},
    chrono::milliseconds(config_.timeout_ms));
  if (!run.status.ok) {
    out.status = run.status;
    return out;
  }

  if (!run.document.isObject() || !run.document.isMember("embedding") ||
    !meetscribe_common::read_float_array(run.document["embedding"], out.embedding) ||
    out.embedding.empty())
  {
    out.status = make_error(
      ErrorCode::SUBPROCESS_ERROR, "extract returned no embedding", run.stderr_text);
  }
  return out;
}

}  // namespace meetscribe
