#pragma once

#include "meetscribe/types.hpp"

#include <string>
#include <vector>

namespace meetscribe
{

/// How a speaker was attributed, strongest first
enum class SpeakerProvenance
{
  ENROLLED_MATCH,
  DIARIZATION,
  FALLBACK_ROUNDROBIN,
  UNIDENTIFIED
};

/// "enrolled-match", "diarization", "fallback-roundrobin", "unidentified"
std::string speaker_provenance_string(SpeakerProvenance provenance);

struct SpeakerAttribution
{
  std::string id;      ///< candidate id, or the raw tag for DIARIZATION, empty when unidentified
  std::string name;
  double confidence = 0.0;
  SpeakerProvenance provenance = SpeakerProvenance::UNIDENTIFIED;
};

struct FusedTranscriptEntry
{
  std::string text;
  SpeakerAttribution speaker;
  double start_time = 0.0;
  double end_time = 0.0;
};

struct SentenceSpan
{
  std::string text;
  double start_time = 0.0;
  double end_time = 0.0;
};

/// Round-robin attributions never report more than this
constexpr double kMaxFallbackConfidence = 0.5;

struct FusionConfig
{
  size_t max_sentence_chars = 200;   ///< UTF-8 code points
  double match_threshold = 0.75;     ///< cosine similarity for tag -> identity
  double fallback_confidence = kMaxFallbackConfidence;
};

/// Joins consecutive segments until one ends with sentence punctuation or the
/// span reaches max_chars. A single longer segment is kept whole.
std::vector<SentenceSpan> group_sentences(
  const std::vector<TranscriptSegment> & segments, size_t max_chars);

/// `diarization` may be null when no diarization ran.
std::vector<FusedTranscriptEntry> fuse_segments(
  const std::vector<TranscriptSegment> & segments,
  const DiarizationResult * diarization,
  const std::vector<CandidateIdentity> & candidates,
  const FusionConfig & config = FusionConfig());

}  // namespace meetscribe
