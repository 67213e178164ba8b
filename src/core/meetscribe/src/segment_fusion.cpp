#include "meetscribe/segment_fusion.hpp"

#include <meetscribe_common/string_utils.hpp>

#include <algorithm>
#include <cctype>
#include <map>

using namespace std;


namespace meetscribe
{
namespace
{

bool is_ascii_word_byte(char c)
{
  const unsigned char u = static_cast<unsigned char>(c);
  return u < 0x80 && !isspace(u);
}

void append_text(string & span_text, const string & text)
{
  if (!span_text.empty() && is_ascii_word_byte(span_text.back()) &&
    is_ascii_word_byte(text.front()))
  {
    span_text.push_back(' ');
  }
  span_text += text;
}

struct TagMatch
{
  bool matched = false;
  const CandidateIdentity * identity = nullptr;
  double similarity = 0.0;
};

TagMatch match_tag(
  const string & tag,
  const DiarizationResult & diarization,
  const vector<CandidateIdentity> & candidates,
  double threshold)
{
  TagMatch best;
  const auto it = diarization.speaker_embeddings.find(tag);
  if (it == diarization.speaker_embeddings.end() || it->second.empty()) {
    return best;
  }
  for (const auto & candidate : candidates) {
    if (candidate.embedding.empty()) {
      continue;
    }
    const double similarity = cosine_similarity(it->second, candidate.embedding);
    if (!best.identity || similarity > best.similarity) {
      best.identity = &candidate;
      best.similarity = similarity;
    }
  }
  best.matched = best.identity && best.similarity >= threshold;
  return best;
}

// Index of the segment with the largest positive overlap, earliest start on
// ties; -1 when nothing overlaps.
int best_overlap(
  const SentenceSpan & span, const vector<DiarizationSegment> & segments, double & overlap)
{
  int best = -1;
  overlap = 0.0;
  const bool instant = span.end_time <= span.start_time;
  for (size_t i = 0; i < segments.size(); ++i) {
    const DiarizationSegment & segment = segments[i];
    double current = 0.0;
    if (instant) {
      if (segment.start_time > span.start_time || segment.end_time < span.start_time) {
        continue;
      }
    } else {
      current = min(span.end_time, segment.end_time) - max(span.start_time, segment.start_time);
      if (current <= 0.0) {
        continue;
      }
    }
    if (best < 0 || current > overlap ||
      (current == overlap && segment.start_time < segments[best].start_time))
    {
      best = static_cast<int>(i);
      overlap = current;
    }
  }
  return best;
}

}  // namespace

string speaker_provenance_string(SpeakerProvenance provenance)
{
  switch (provenance) {
    case SpeakerProvenance::ENROLLED_MATCH: return "enrolled-match";
    case SpeakerProvenance::DIARIZATION: return "diarization";
    case SpeakerProvenance::FALLBACK_ROUNDROBIN: return "fallback-roundrobin";
    case SpeakerProvenance::UNIDENTIFIED: return "unidentified";
  }
  return "unidentified";
}

vector<SentenceSpan> group_sentences(const vector<TranscriptSegment> & segments, size_t max_chars)
{
  vector<SentenceSpan> spans;
  SentenceSpan current;
  bool open = false;

  for (const auto & segment : segments) {
    const string text = meetscribe_common::trim(segment.text);
    if (text.empty()) {
      continue;
    }
    if (!open) {
      current = SentenceSpan();
      current.start_time = segment.start_time;
      open = true;
    }
    append_text(current.text, text);
    current.end_time = max(current.end_time, segment.end_time);

    if (meetscribe_common::ends_with_sentence_terminal(current.text) ||
      (max_chars > 0 && meetscribe_common::utf8_length(current.text) >= max_chars))
    {
      spans.push_back(current);
      open = false;
    }
  }
  if (open) {
    spans.push_back(current);
  }
  return spans;
}

vector<FusedTranscriptEntry> fuse_segments(
  const vector<TranscriptSegment> & segments,
  const DiarizationResult * diarization,
  const vector<CandidateIdentity> & candidates,
  const FusionConfig & config)
{
  const vector<SentenceSpan> spans = group_sentences(segments, config.max_sentence_chars);
  const double fallback_confidence = min(config.fallback_confidence, kMaxFallbackConfidence);
  map<string, TagMatch> tag_cache;

  vector<FusedTranscriptEntry> entries;
  entries.reserve(spans.size());
  for (size_t index = 0; index < spans.size(); ++index) {
    const SentenceSpan & span = spans[index];
    FusedTranscriptEntry entry;
    entry.text = span.text;
    entry.start_time = span.start_time;
    entry.end_time = span.end_time;

    double overlap = 0.0;
    const int hit = diarization ? best_overlap(span, diarization->segments, overlap) : -1;

    if (hit >= 0) {
      const DiarizationSegment & segment = diarization->segments[hit];
      auto cached = tag_cache.find(segment.speaker_tag);
      if (cached == tag_cache.end()) {
        cached = tag_cache.emplace(
          segment.speaker_tag,
          match_tag(segment.speaker_tag, *diarization, candidates, config.match_threshold)).first;
      }
      const TagMatch & match = cached->second;
      if (match.matched) {
        entry.speaker.id = match.identity->id;
        entry.speaker.name = match.identity->name;
        entry.speaker.confidence = match.similarity;
        entry.speaker.provenance = SpeakerProvenance::ENROLLED_MATCH;
      } else {
        const double length = span.end_time - span.start_time;
        entry.speaker.id = segment.speaker_tag;
        entry.speaker.name = segment.speaker_tag;
        entry.speaker.confidence = segment.confidence ?
          *segment.confidence : (length > 0.0 ? min(1.0, overlap / length) : 1.0);
        entry.speaker.provenance = SpeakerProvenance::DIARIZATION;
      }
    } else if (!candidates.empty()) {
      const CandidateIdentity & candidate = candidates[index % candidates.size()];
      entry.speaker.id = candidate.id;
      entry.speaker.name = candidate.name;
      entry.speaker.confidence = fallback_confidence;
      entry.speaker.provenance = SpeakerProvenance::FALLBACK_ROUNDROBIN;
    } else {
      entry.speaker.name = "Unknown";
      entry.speaker.confidence = 0.0;
      entry.speaker.provenance = SpeakerProvenance::UNIDENTIFIED;
    }
    entries.push_back(entry);
  }
  return entries;
}

}  // namespace meetscribe
