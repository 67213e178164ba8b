#include "meetscribe/voiceprint_provider.hpp"

#include <meetscribe_common/string_utils.hpp>

using namespace std;


namespace meetscribe
{

string voiceprint_backend_string(VoiceprintBackend backend)
{
  switch (backend) {
    case VoiceprintBackend::EMBEDDING:
      return "embedding";
    case VoiceprintBackend::DIARIZATION:
      return "diarization";
    default:
      return "unknown";
  }
}

bool parse_voiceprint_backend(const string & text, VoiceprintBackend & out)
{
  const string value = meetscribe_common::to_lower(meetscribe_common::trim(text));
  if (value == "embedding" || value == "speechbrain" || value == "wespeaker") {
    out = VoiceprintBackend::EMBEDDING;
  } else if (value == "diarization" || value == "pyannote") {
    out = VoiceprintBackend::DIARIZATION;
  } else {
    return false;
  }
  return true;
}

bool VoiceprintProvider::supports(Capability capability) const
{
  return capabilities().count(capability) > 0;
}

}  // namespace meetscribe
