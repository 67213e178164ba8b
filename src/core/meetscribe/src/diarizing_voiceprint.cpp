#include "meetscribe/diarizing_voiceprint.hpp"

#include "meetscribe/temp_files.hpp"

#include <meetscribe_common/json_utils.hpp>

#include <set>

using namespace std;


namespace meetscribe
{

Status parse_diarization_document(const Json::Value & document, DiarizationResult & out)
{
  if (!document.isObject() || !document.isMember("segments") || !document["segments"].isArray()) {
    return make_error(ErrorCode::SUBPROCESS_ERROR, "diarize returned no segments");
  }

  out.segments.clear();
  out.speaker_embeddings.clear();
  SegmentOrderGuard guard;
  set<string> tags;
  for (const auto & item : document["segments"]) {
    DiarizationSegment segment;
    segment.speaker_tag = meetscribe_common::string_member(item, "speaker");
    if (segment.speaker_tag.empty() ||
      !meetscribe_common::number_member(item, "start", segment.start_time) ||
      !meetscribe_common::number_member(item, "end", segment.end_time))
    {
      return make_error(ErrorCode::SUBPROCESS_ERROR, "diarization segment is missing fields");
    }
    string error;
    if (!guard.accept(segment.start_time, segment.end_time, error)) {
      return make_error(ErrorCode::SUBPROCESS_ERROR, "protocol violation: " + error);
    }
    double confidence = 0.0;
    if (meetscribe_common::number_member(item, "confidence", confidence)) {
      segment.confidence = confidence;
    }
    tags.insert(segment.speaker_tag);
    out.segments.push_back(segment);
  }

  double num_speakers = 0.0;
  out.num_speakers = meetscribe_common::number_member(document, "num_speakers", num_speakers) ?
    static_cast<int>(num_speakers) : static_cast<int>(tags.size());

  if (document.isMember("embeddings") && document["embeddings"].isObject()) {
    const Json::Value & embeddings = document["embeddings"];
    for (const auto & tag : embeddings.getMemberNames()) {
      vector<float> vector_value;
      if (meetscribe_common::read_float_array(embeddings[tag], vector_value) &&
        !vector_value.empty())
      {
        out.speaker_embeddings[tag] = vector_value;
      }
    }
  }
  return Status{};
}

DiarizingVoiceprint::DiarizingVoiceprint(const DiarizingVoiceprintConfig & config)
: EmbeddingBackedVoiceprint(
    config.dimension, config.required_enrollments, config.policy, config.thresholds),
  config_(config)
{
  command_.executable = config_.executable;
  command_.base_args = config_.base_args;
}

CapabilitySet DiarizingVoiceprint::capabilities() const
{
  return {
    Capability::ENROLLMENT, Capability::IDENTIFICATION,
    Capability::VERIFICATION, Capability::DIARIZATION};
}

DiarizationResult DiarizingVoiceprint::diarization(const vector<uint8_t> & audio)
{
  DiarizationResult out;
  if (audio.empty()) {
    out.status = make_error(ErrorCode::INVALID_INPUT, "diarization audio is empty");
    return out;
  }

  ScopedTempFile audio_file(config_.temp_directory, "diarize", ".wav");
  if (!audio_file.write(audio)) {
    out.status = make_error(ErrorCode::INTERNAL_ERROR, "failed to write " + audio_file.path());
    return out;
  }

  const OneShotResult run = run_one_shot(
    command_, "diarize",
    {audio_file.path(), to_string(config_.min_speakers), to_string(config_.max_speakers),
      config_.device},
    chrono::milliseconds(config_.timeout_ms));
  if (!run.status.ok) {
    out.status = run.status;
    return out;
  }

  out.status = parse_diarization_document(run.document, out);
  if (!out.status.ok) {
    out.status.details = run.stderr_text;
  }
  return out;
}

bool DiarizingVoiceprint::health_check()
{
  return run_one_shot(command_, "test", {}, chrono::seconds(30)).status.ok;
}

EmbeddingBackedVoiceprint::EmbeddingResult DiarizingVoiceprint::extract_embedding(
  const vector<uint8_t> & audio)
{
  EmbeddingResult out;
  ScopedTempFile audio_file(config_.temp_directory, "voiceprint", ".wav");
  if (!audio_file.write(audio)) {
    out.status = make_error(ErrorCode::INTERNAL_ERROR, "failed to write " + audio_file.path());
    return out;
  }

  const OneShotResult run = run_one_shot(
    command_, "embed", {audio_file.path(), config_.device},
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
      ErrorCode::SUBPROCESS_ERROR, "embed returned no embedding", run.stderr_text);
  }
  return out;
}

}  // namespace meetscribe
