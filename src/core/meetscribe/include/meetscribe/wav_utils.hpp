#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace meetscribe
{

struct WavInfo
{
  bool valid = false;
  uint16_t audio_format = 0;     ///< 1 = integer PCM
  uint16_t channels = 0;
  uint32_t sample_rate = 0;
  uint16_t bits_per_sample = 0;
  uint32_t data_size = 0;
  std::string error;
};

/// Reads the RIFF header and walks chunks up to "data"
WavInfo probe_wav(const std::string & path);

/// RIFF/WAVE image of raw PCM16 little-endian samples
std::vector<uint8_t> encode_pcm16_wav(
  const std::vector<uint8_t> & pcm16_le,
  uint32_t sample_rate,
  uint16_t channels = 1);

bool write_pcm16_wav(
  const std::string & path,
  const std::vector<uint8_t> & pcm16_le,
  uint32_t sample_rate,
  uint16_t channels = 1);

}  // namespace meetscribe
