#include <gtest/gtest.h>

#include "meetscribe/format_converter.hpp"
#include "meetscribe/temp_files.hpp"
#include "meetscribe/transcription_provider.hpp"
#include "meetscribe/types.hpp"
#include "meetscribe/wav_utils.hpp"

#include <meetscribe_common/json_utils.hpp>
#include <meetscribe_common/shell_utils.hpp>
#include <meetscribe_common/string_utils.hpp>

#include <filesystem>
#include <iterator>
#include <string>
#include <vector>

#include <unistd.h>

using namespace meetscribe;
namespace fs = std::filesystem;

namespace
{

class ScratchDir
{
public:
  explicit ScratchDir(const std::string & name)
  : path_(fs::temp_directory_path() /
      ("meetscribe_" + name + "_" + std::to_string(getpid())))
  {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~ScratchDir()
  {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  std::string path() const { return path_.string(); }
  size_t file_count() const
  {
    return static_cast<size_t>(std::distance(fs::directory_iterator(path_),
           fs::directory_iterator()));
  }

private:
  fs::path path_;
};

std::vector<uint8_t> silence(size_t samples)
{
  return std::vector<uint8_t>(samples * 2, 0);
}

}  // namespace

// ---------------------------------------------------------------- strings

TEST(StringUtils, TrimAndLower)
{
  EXPECT_EQ(meetscribe_common::trim("  hello \n"), "hello");
  EXPECT_EQ(meetscribe_common::trim("   "), "");
  EXPECT_EQ(meetscribe_common::to_lower("Local-Batch"), "local-batch");
}

TEST(StringUtils, ShellEscapeWrapsInSingleQuotes)
{
  EXPECT_EQ(meetscribe_common::shell_escape_single_quote("a b"), "'a b'");
  EXPECT_EQ(meetscribe_common::shell_escape_single_quote("it's"), "'it'\\''s'");
}

TEST(StringUtils, Utf8LengthCountsCodePoints)
{
  EXPECT_EQ(meetscribe_common::utf8_length("abc"), 3U);
  EXPECT_EQ(meetscribe_common::utf8_length("\xE4\xBD\xA0\xE5\xA5\xBD"), 2U);  // 你好
}

TEST(StringUtils, SentenceTerminals)
{
  EXPECT_TRUE(meetscribe_common::ends_with_sentence_terminal("Hello."));
  EXPECT_TRUE(meetscribe_common::ends_with_sentence_terminal("ok?  "));
  EXPECT_TRUE(meetscribe_common::ends_with_sentence_terminal("\xE5\xA5\xBD\xE3\x80\x82"));  // 好。
  EXPECT_FALSE(meetscribe_common::ends_with_sentence_terminal("and then"));
  EXPECT_FALSE(meetscribe_common::ends_with_sentence_terminal(""));
}

TEST(StringUtils, FileExtension)
{
  EXPECT_EQ(meetscribe_common::file_extension("meeting.MP3"), ".mp3");
  EXPECT_EQ(meetscribe_common::file_extension("/tmp/dir.d/noext"), "");
  EXPECT_EQ(meetscribe_common::file_extension("audio"), "");
}

// ---------------------------------------------------------------- json

TEST(JsonUtils, ParseRejectsTrailingGarbage)
{
  Json::Value doc;
  std::string error;
  EXPECT_TRUE(meetscribe_common::parse_json("{\"a\": 1}", doc, error));
  EXPECT_FALSE(meetscribe_common::parse_json("{\"a\": 1} x", doc, error));
  EXPECT_FALSE(error.empty());
}

TEST(JsonUtils, MemberAccessorsFallBack)
{
  Json::Value doc;
  std::string error;
  ASSERT_TRUE(meetscribe_common::parse_json("{\"s\": \"x\", \"n\": 2.5, \"v\": [1, 2]}", doc, error));

  EXPECT_EQ(meetscribe_common::string_member(doc, "s"), "x");
  EXPECT_EQ(meetscribe_common::string_member(doc, "n", "fallback"), "fallback");

  double n = 0.0;
  EXPECT_TRUE(meetscribe_common::number_member(doc, "n", n));
  EXPECT_DOUBLE_EQ(n, 2.5);
  EXPECT_FALSE(meetscribe_common::number_member(doc, "s", n));

  std::vector<float> v;
  EXPECT_TRUE(meetscribe_common::read_float_array(doc["v"], v));
  EXPECT_EQ(v.size(), 2U);
  EXPECT_FALSE(meetscribe_common::read_float_array(doc["s"], v));
}

TEST(JsonUtils, CompactSerializationIsOneLine)
{
  Json::Value doc(Json::objectValue);
  doc["type"] = "final";
  doc["text"] = "hi";
  EXPECT_EQ(meetscribe_common::to_compact_json(doc).find('\n'), std::string::npos);
}

// ---------------------------------------------------------------- shell

TEST(ShellUtils, CapturesOutputAndExitCode)
{
  const auto ok = meetscribe_common::run_shell_command("echo meetscribe");
  EXPECT_TRUE(ok.ok);
  EXPECT_EQ(meetscribe_common::trim(ok.output), "meetscribe");

  const auto failed = meetscribe_common::run_shell_command("exit 3");
  EXPECT_FALSE(failed.ok);
  EXPECT_EQ(failed.exit_code, 3);

  EXPECT_TRUE(meetscribe_common::command_exists("sh"));
  EXPECT_FALSE(meetscribe_common::command_exists("meetscribe-no-such-binary"));
}

// ---------------------------------------------------------------- similarity

TEST(CosineSimilarity, DegenerateInputsScoreZero)
{
  EXPECT_DOUBLE_EQ(cosine_similarity({}, {}), 0.0);
  EXPECT_DOUBLE_EQ(cosine_similarity({1.0F, 0.0F}, {1.0F}), 0.0);
  EXPECT_DOUBLE_EQ(cosine_similarity({0.0F, 0.0F}, {1.0F, 0.0F}), 0.0);
}

TEST(CosineSimilarity, DirectionOnly)
{
  EXPECT_NEAR(cosine_similarity({1.0F, 0.0F}, {5.0F, 0.0F}), 1.0, 1e-9);
  EXPECT_NEAR(cosine_similarity({1.0F, 0.0F}, {0.0F, 2.0F}), 0.0, 1e-9);
  EXPECT_NEAR(cosine_similarity({1.0F, 0.0F}, {-1.0F, 0.0F}), -1.0, 1e-9);
}

// ---------------------------------------------------------------- transcript documents

TEST(TranscriptDocument, ParsesSegmentsAndDerivesDuration)
{
  Json::Value doc;
  std::string error;
  ASSERT_TRUE(meetscribe_common::parse_json(
      "{\"text\": \"hello world\", \"language\": \"en\", \"segments\": ["
      "{\"text\": \" hello \", \"start\": 0.0, \"end\": 1.0, \"avg_logprob\": 0.0},"
      "{\"text\": \"world\", \"start\": 1.0, \"end\": 2.5, \"confidence\": 0.8}]}",
      doc, error));

  TranscriptResult out;
  const Status status = parse_transcript_document(doc, ErrorCode::PROTOCOL_VIOLATION, out);
  ASSERT_TRUE(status.ok) << status.error;
  ASSERT_EQ(out.segments.size(), 2U);
  EXPECT_EQ(out.segments[0].text, "hello");
  ASSERT_TRUE(out.segments[0].confidence.has_value());
  EXPECT_NEAR(*out.segments[0].confidence, 1.0, 1e-9);
  EXPECT_NEAR(*out.segments[1].confidence, 0.8, 1e-9);
  EXPECT_EQ(out.language, "en");
  EXPECT_DOUBLE_EQ(out.duration, 2.5);
}

TEST(TranscriptDocument, TextOnlyBecomesOneSegment)
{
  Json::Value doc;
  std::string error;
  ASSERT_TRUE(meetscribe_common::parse_json(
      "{\"text\": \"just text\", \"duration\": 4.0}", doc, error));

  TranscriptResult out;
  ASSERT_TRUE(parse_transcript_document(doc, ErrorCode::SUBPROCESS_ERROR, out).ok);
  ASSERT_EQ(out.segments.size(), 1U);
  EXPECT_DOUBLE_EQ(out.segments[0].end_time, 4.0);
}

TEST(TranscriptDocument, OutOfOrderSegmentsUseViolationCode)
{
  Json::Value doc;
  std::string error;
  ASSERT_TRUE(meetscribe_common::parse_json(
      "{\"segments\": [{\"text\": \"b\", \"start\": 2.0, \"end\": 3.0},"
      "{\"text\": \"a\", \"start\": 1.0, \"end\": 1.5}]}",
      doc, error));

  TranscriptResult out;
  const Status status = parse_transcript_document(doc, ErrorCode::PROTOCOL_VIOLATION, out);
  EXPECT_FALSE(status.ok);
  EXPECT_EQ(status.code, ErrorCode::PROTOCOL_VIOLATION);
}

TEST(TranscriptionBackend, NamesRoundTrip)
{
  for (const auto backend : {TranscriptionBackend::HOSTED_STREAMING,
      TranscriptionBackend::HOSTED_BATCH, TranscriptionBackend::LOCAL_STREAMING,
      TranscriptionBackend::LOCAL_BATCH})
  {
    TranscriptionBackend parsed = TranscriptionBackend::LOCAL_BATCH;
    ASSERT_TRUE(parse_transcription_backend(transcription_backend_string(backend), parsed));
    EXPECT_EQ(parsed, backend);
  }
  TranscriptionBackend ignored = TranscriptionBackend::LOCAL_BATCH;
  EXPECT_FALSE(parse_transcription_backend("cloud", ignored));
}

// ---------------------------------------------------------------- wav + temp files

TEST(WavUtils, WriteThenProbe)
{
  ScratchDir dir("wav");
  const std::string path = dir.path() + "/tone.wav";
  ASSERT_TRUE(write_pcm16_wav(path, silence(1600), 16000, 1));

  const WavInfo info = probe_wav(path);
  ASSERT_TRUE(info.valid) << info.error;
  EXPECT_EQ(info.audio_format, 1);
  EXPECT_EQ(info.channels, 1);
  EXPECT_EQ(info.sample_rate, 16000U);
  EXPECT_EQ(info.bits_per_sample, 16);
  EXPECT_EQ(info.data_size, 3200U);
}

TEST(WavUtils, InMemoryImageMatchesFileLayout)
{
  const std::vector<uint8_t> image = encode_pcm16_wav(silence(160), 8000, 1);
  ASSERT_EQ(image.size(), 44U + 320U);
  EXPECT_EQ(std::string(image.begin(), image.begin() + 4), "RIFF");
  EXPECT_EQ(std::string(image.begin() + 8, image.begin() + 12), "WAVE");
  EXPECT_EQ(std::string(image.begin() + 36, image.begin() + 40), "data");
  // sample rate, little-endian
  EXPECT_EQ(image[24], 0x40);
  EXPECT_EQ(image[25], 0x1F);
}

TEST(WavUtils, ProbeRejectsNonWav)
{
  ScratchDir dir("notwav");
  const std::string path = dir.path() + "/junk.wav";
  ASSERT_TRUE(write_file_bytes(path, std::vector<uint8_t>(64, 'x')));
  const WavInfo info = probe_wav(path);
  EXPECT_FALSE(info.valid);
  EXPECT_FALSE(info.error.empty());
}

TEST(TempFiles, RegistryRemovesEverythingItOwns)
{
  ScratchDir dir("registry");
  {
    TempFileRegistry registry(dir.path());
    EXPECT_FALSE(registry.write("a", ".bin", {1, 2, 3}).empty());
    const std::string allocated = registry.allocate("b", ".wav");
    ASSERT_TRUE(write_file_bytes(allocated, {4}));
    EXPECT_EQ(dir.file_count(), 2U);
    EXPECT_EQ(registry.cleanup(), 0U);
    EXPECT_EQ(dir.file_count(), 0U);

    registry.write("c", ".bin", {5});
    EXPECT_EQ(dir.file_count(), 1U);
  }
  EXPECT_EQ(dir.file_count(), 0U);
}

TEST(TempFiles, ScopedFileIsRemovedOnExit)
{
  ScratchDir dir("scoped");
  std::string path;
  {
    ScopedTempFile file(dir.path(), "clip", ".wav");
    ASSERT_TRUE(file.write(silence(10)));
    path = file.path();
    EXPECT_TRUE(fs::exists(path));
  }
  EXPECT_FALSE(fs::exists(path));
}

// ---------------------------------------------------------------- format conversion

TEST(FormatConverter, CompatibleWavPassesThrough)
{
  ScratchDir dir("convert_pass");
  TempFileRegistry registry(dir.path());
  const std::string path = dir.path() + "/in.wav";
  ASSERT_TRUE(write_pcm16_wav(path, silence(160), 16000, 1));

  FfmpegFormatConverter converter;
  const ConversionResult result = converter.ensure_compatible_format(path, registry);
  ASSERT_TRUE(result.status.ok) << result.status.error;
  EXPECT_EQ(result.path, path);
  EXPECT_TRUE(registry.paths().empty());
}

TEST(FormatConverter, RawPcmIsWrappedIntoRegistryFile)
{
  ScratchDir dir("convert_raw");
  TempFileRegistry registry(dir.path());
  const std::string path = dir.path() + "/in.pcm";
  ASSERT_TRUE(write_file_bytes(path, silence(160)));

  FfmpegFormatConverter converter;
  const ConversionResult result = converter.ensure_compatible_format(path, registry);
  ASSERT_TRUE(result.status.ok) << result.status.error;
  EXPECT_NE(result.path, path);
  EXPECT_TRUE(probe_wav(result.path).valid);
  ASSERT_EQ(registry.paths().size(), 1U);
  EXPECT_EQ(registry.paths().front(), result.path);
}

TEST(FormatConverter, OddLengthRawPcmIsRejected)
{
  ScratchDir dir("convert_odd");
  TempFileRegistry registry(dir.path());
  const std::string path = dir.path() + "/in.raw";
  ASSERT_TRUE(write_file_bytes(path, {1, 2, 3}));

  FfmpegFormatConverter converter;
  const ConversionResult result = converter.ensure_compatible_format(path, registry);
  EXPECT_FALSE(result.status.ok);
  EXPECT_EQ(result.status.code, ErrorCode::AUDIO_FORMAT_ERROR);
}

TEST(FormatConverter, MissingFileAndFailedConversionAreFormatErrors)
{
  ScratchDir dir("convert_fail");
  TempFileRegistry registry(dir.path());

  FfmpegConverterConfig config;
  config.ffmpeg_path = "/nonexistent/ffmpeg";
  FfmpegFormatConverter converter(config);

  const ConversionResult missing =
    converter.ensure_compatible_format(dir.path() + "/absent.mp3", registry);
  EXPECT_EQ(missing.status.code, ErrorCode::AUDIO_FORMAT_ERROR);

  const std::string path = dir.path() + "/in.mp3";
  ASSERT_TRUE(write_file_bytes(path, std::vector<uint8_t>(32, 0xFF)));
  const ConversionResult failed = converter.ensure_compatible_format(path, registry);
  EXPECT_FALSE(failed.status.ok);
  EXPECT_EQ(failed.status.code, ErrorCode::AUDIO_FORMAT_ERROR);
}
