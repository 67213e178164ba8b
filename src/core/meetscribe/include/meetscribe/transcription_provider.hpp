#pragma once

#include "meetscribe/errors.hpp"
#include "meetscribe/types.hpp"

#include <json/json.h>

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace meetscribe
{

enum class Capability
{
  STREAMING,
  BATCH_TRANSCRIPTION,
  ENROLLMENT,
  IDENTIFICATION,
  VERIFICATION,
  DIARIZATION
};

using CapabilitySet = std::set<Capability>;

std::string capability_string(Capability capability);

enum class TranscriptionBackend
{
  HOSTED_STREAMING,
  HOSTED_BATCH,
  LOCAL_STREAMING,
  LOCAL_BATCH
};

/// "hosted-streaming", "hosted-batch", "local-streaming", "local-batch"
std::string transcription_backend_string(TranscriptionBackend backend);
bool parse_transcription_backend(const std::string & text, TranscriptionBackend & out);

struct RealtimeConfig
{
  std::string language = "zh";
  int sample_rate = 16000;
  std::function<void(const TranscriptSegment & segment, bool is_final)> on_transcript;
  /// terminal == true means the stream is dead and no further audio is accepted
  std::function<void(const Status & error, bool terminal)> on_error;
  std::function<void()> on_complete;
};

struct TranscriptionOptions
{
  std::string language;          ///< empty: provider default
  std::string filename = "audio.wav";
};

class TranscriptionProvider
{
public:
  virtual ~TranscriptionProvider() = default;

  virtual std::string name() const = 0;
  virtual TranscriptionBackend kind() const = 0;
  virtual CapabilitySet capabilities() const = 0;
  bool supports(Capability capability) const;

  virtual Status start_realtime(const RealtimeConfig & config) = 0;
  virtual Status send_audio(const std::vector<uint8_t> & chunk) = 0;
  virtual Status stop_realtime() = 0;

  virtual TranscriptResult transcribe_file(
    const std::vector<uint8_t> & audio,
    const TranscriptionOptions & options) = 0;

  virtual bool health_check() = 0;
};

/// Fills `out` from an engine or API document of the form
/// {text, language?, duration?, segments?: [{text, start, end, confidence?|avg_logprob?}]}.
/// Segment order is validated; a violation yields `violation_code`.
Status parse_transcript_document(
  const Json::Value & document,
  ErrorCode violation_code,
  TranscriptResult & out);

}  // namespace meetscribe
