#include "meetscribe/transcription_provider.hpp"

#include "meetscribe/subprocess_bridge.hpp"

#include <meetscribe_common/json_utils.hpp>
#include <meetscribe_common/string_utils.hpp>

#include <cmath>

using namespace std;


namespace meetscribe
{

string capability_string(Capability capability)
{
  switch (capability) {
    case Capability::STREAMING:
      return "streaming";
    case Capability::BATCH_TRANSCRIPTION:
      return "batch-transcription";
    case Capability::ENROLLMENT:
      return "enrollment";
    case Capability::IDENTIFICATION:
      return "identification";
    case Capability::VERIFICATION:
      return "verification";
    case Capability::DIARIZATION:
      return "diarization";
    default:
      return "unknown";
  }
}

string transcription_backend_string(TranscriptionBackend backend)
{
  switch (backend) {
    case TranscriptionBackend::HOSTED_STREAMING:
      return "hosted-streaming";
    case TranscriptionBackend::HOSTED_BATCH:
      return "hosted-batch";
    case TranscriptionBackend::LOCAL_STREAMING:
      return "local-streaming";
    case TranscriptionBackend::LOCAL_BATCH:
      return "local-batch";
    default:
      return "unknown";
  }
}

bool parse_transcription_backend(const string & text, TranscriptionBackend & out)
{
  const string value = meetscribe_common::to_lower(meetscribe_common::trim(text));
  if (value == "hosted-streaming") {
    out = TranscriptionBackend::HOSTED_STREAMING;
  } else if (value == "hosted-batch") {
    out = TranscriptionBackend::HOSTED_BATCH;
  } else if (value == "local-streaming") {
    out = TranscriptionBackend::LOCAL_STREAMING;
  } else if (value == "local-batch") {
    out = TranscriptionBackend::LOCAL_BATCH;
  } else {
    return false;
  }
  return true;
}

bool TranscriptionProvider::supports(Capability capability) const
{
  return capabilities().count(capability) > 0;
}

Status parse_transcript_document(
  const Json::Value & document,
  ErrorCode violation_code,
  TranscriptResult & out)
{
  if (!document.isObject()) {
    return make_error(violation_code, "transcript document is not an object");
  }

  out.segments.clear();
  out.full_text = meetscribe_common::trim(meetscribe_common::string_member(document, "text"));
  out.language = meetscribe_common::string_member(document, "language", out.language);
  double duration = 0.0;
  if (meetscribe_common::number_member(document, "duration", duration)) {
    out.duration = duration;
  }

  SegmentOrderGuard guard;
  if (document.isMember("segments") && document["segments"].isArray()) {
    for (const auto & item : document["segments"]) {
      if (!item.isObject()) {
        return make_error(violation_code, "transcript segment is not an object");
      }
      TranscriptSegment segment;
      segment.text = meetscribe_common::trim(meetscribe_common::string_member(item, "text"));
      if (!meetscribe_common::number_member(item, "start", segment.start_time) ||
        !meetscribe_common::number_member(item, "end", segment.end_time))
      {
        return make_error(violation_code, "transcript segment is missing start/end");
      }

      string error;
      if (!guard.accept(segment.start_time, segment.end_time, error)) {
        return make_error(violation_code, "protocol violation: " + error);
      }

      double confidence = 0.0;
      double avg_logprob = 0.0;
      if (meetscribe_common::number_member(item, "confidence", confidence)) {
        segment.confidence = confidence;
      } else if (meetscribe_common::number_member(item, "avg_logprob", avg_logprob)) {
        segment.confidence = exp(avg_logprob);
      }
      const string speaker = meetscribe_common::string_member(item, "speaker");
      if (!speaker.empty()) {
        segment.speaker_label = speaker;
      }
      if (!segment.text.empty()) {
        out.segments.push_back(segment);
      }
    }
  }

  // Engines that only report text get a single segment spanning the file.
  if (out.segments.empty() && !out.full_text.empty()) {
    TranscriptSegment whole;
    whole.text = out.full_text;
    whole.start_time = 0.0;
    whole.end_time = out.duration;
    out.segments.push_back(whole);
  }

  if (out.full_text.empty()) {
    string joined;
    for (const auto & segment : out.segments) {
      if (!joined.empty()) {
        joined += " ";
      }
      joined += segment.text;
    }
    out.full_text = joined;
  }
  if (out.duration <= 0.0 && !out.segments.empty()) {
    out.duration = out.segments.back().end_time;
  }
  return Status{};
}

}  // namespace meetscribe
