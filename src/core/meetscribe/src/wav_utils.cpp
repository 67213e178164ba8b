#include "meetscribe/wav_utils.hpp"

#include <cstring>
#include <fstream>

using namespace std;


namespace meetscribe
{
namespace
{

uint16_t read_le16(const unsigned char * p)
{
  return static_cast<uint16_t>(p[0] | (p[1] << 8U));
}

uint32_t read_le32(const unsigned char * p)
{
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8U) |
         (static_cast<uint32_t>(p[2]) << 16U) |
         (static_cast<uint32_t>(p[3]) << 24U);
}

}  // namespace

WavInfo probe_wav(const string & path)
{
  WavInfo info;
  ifstream ifs(path, ios::binary);
  if (!ifs) {
    info.error = "cannot open " + path;
    return info;
  }

  unsigned char riff[12];
  if (!ifs.read(reinterpret_cast<char *>(riff), sizeof(riff)) ||
    memcmp(riff, "RIFF", 4) != 0 || memcmp(riff + 8, "WAVE", 4) != 0)
  {
    info.error = "not a RIFF/WAVE file";
    return info;
  }

  bool have_fmt = false;
  unsigned char header[8];
  while (ifs.read(reinterpret_cast<char *>(header), sizeof(header))) {
    const uint32_t chunk_size = read_le32(header + 4);
    if (memcmp(header, "fmt ", 4) == 0) {
      unsigned char fmt[16];
      if (chunk_size < sizeof(fmt) || !ifs.read(reinterpret_cast<char *>(fmt), sizeof(fmt))) {
        info.error = "truncated fmt chunk";
        return info;
      }
      info.audio_format = read_le16(fmt);
      info.channels = read_le16(fmt + 2);
      info.sample_rate = read_le32(fmt + 4);
      info.bits_per_sample = read_le16(fmt + 14);
      have_fmt = true;
      ifs.seekg(static_cast<streamoff>(chunk_size - sizeof(fmt) + (chunk_size & 1U)), ios::cur);
    } else if (memcmp(header, "data", 4) == 0) {
      if (!have_fmt) {
        info.error = "data chunk before fmt chunk";
        return info;
      }
      info.data_size = chunk_size;
      info.valid = true;
      return info;
    } else {
      ifs.seekg(static_cast<streamoff>(chunk_size + (chunk_size & 1U)), ios::cur);
    }
  }

  info.error = have_fmt ? "missing data chunk" : "missing fmt chunk";
  return info;
}

vector<uint8_t> encode_pcm16_wav(
  const vector<uint8_t> & pcm16_le,
  uint32_t sample_rate,
  uint16_t channels)
{
  const uint16_t bits_per_sample = 16;
  const uint16_t block_align = static_cast<uint16_t>(channels * (bits_per_sample / 8U));
  const uint32_t byte_rate = sample_rate * block_align;
  const uint32_t data_size = static_cast<uint32_t>(pcm16_le.size());
  const uint32_t chunk_size = 36U + data_size;

  vector<uint8_t> out;
  out.reserve(44U + pcm16_le.size());
  auto put_tag = [&out](const char * tag) {
      out.insert(out.end(), tag, tag + 4);
    };
  auto put_le16 = [&out](uint16_t v) {
      out.push_back(static_cast<uint8_t>(v & 0xFFU));
      out.push_back(static_cast<uint8_t>((v >> 8U) & 0xFFU));
    };
  auto put_le32 = [&out](uint32_t v) {
      for (unsigned shift = 0; shift < 32U; shift += 8U) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xFFU));
      }
    };

  put_tag("RIFF");
  put_le32(chunk_size);
  put_tag("WAVE");
  put_tag("fmt ");
  put_le32(16U);
  put_le16(1U);
  put_le16(channels);
  put_le32(sample_rate);
  put_le32(byte_rate);
  put_le16(block_align);
  put_le16(bits_per_sample);
  put_tag("data");
  put_le32(data_size);
  out.insert(out.end(), pcm16_le.begin(), pcm16_le.end());
  return out;
}

bool write_pcm16_wav(
  const string & path,
  const vector<uint8_t> & pcm16_le,
  uint32_t sample_rate,
  uint16_t channels)
{
  ofstream ofs(path, ios::binary | ios::trunc);
  if (!ofs) {
    return false;
  }
  const vector<uint8_t> image = encode_pcm16_wav(pcm16_le, sample_rate, channels);
  ofs.write(reinterpret_cast<const char *>(image.data()), static_cast<streamsize>(image.size()));
  return static_cast<bool>(ofs);
}

}  // namespace meetscribe
