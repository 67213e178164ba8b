#include <gtest/gtest.h>

#include "meetscribe/local_transcription.hpp"
#include "meetscribe/subprocess_bridge.hpp"

#include <atomic>
#include <csignal>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace meetscribe;
using namespace std::chrono_literals;

namespace
{

// `sh -c <script> fake <operation> <args...>`: inside the script $1 is the
// operation and $2.. are its arguments.
SubprocessCommand shell_engine(const std::string & script)
{
  SubprocessCommand command;
  command.executable = "/bin/sh";
  command.base_args = {"-c", script, "fake"};
  return command;
}

bool wait_for(const std::function<bool()> & predicate, std::chrono::milliseconds timeout = 5s)
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(10ms);
  }
  return predicate();
}

struct Recorder
{
  std::mutex mutex;
  std::vector<StreamMessage> messages;
  std::vector<Status> recoverable;
  std::vector<Status> terminal;
  std::atomic<bool> completed{false};

  StreamCallbacks callbacks()
  {
    StreamCallbacks cb;
    cb.on_message = [this](const StreamMessage & m) {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(m);
      };
    cb.on_recoverable_error = [this](const Status & s) {
        std::lock_guard<std::mutex> lock(mutex);
        recoverable.push_back(s);
      };
    cb.on_terminal_error = [this](const Status & s) {
        std::lock_guard<std::mutex> lock(mutex);
        terminal.push_back(s);
      };
    cb.on_complete = [this]() {completed = true;};
    return cb;
  }

  size_t message_count()
  {
    std::lock_guard<std::mutex> lock(mutex);
    return messages.size();
  }
  size_t recoverable_count()
  {
    std::lock_guard<std::mutex> lock(mutex);
    return recoverable.size();
  }
  size_t terminal_count()
  {
    std::lock_guard<std::mutex> lock(mutex);
    return terminal.size();
  }
};

}  // namespace

// ---------------------------------------------------------------- framing

TEST(LineFramer, KeepsPartialLineBuffered)
{
  LineFramer framer;
  const std::string first = "{\"a\":1}\n{\"b\"";
  auto lines = framer.feed(first.data(), first.size());
  ASSERT_EQ(lines.size(), 1U);
  EXPECT_EQ(lines[0], "{\"a\":1}");
  EXPECT_GT(framer.buffered(), 0U);

  const std::string second = ":2}\r\n";
  lines = framer.feed(second.data(), second.size());
  ASSERT_EQ(lines.size(), 1U);
  EXPECT_EQ(lines[0], "{\"b\":2}");
  EXPECT_EQ(framer.take_remainder(), "");
}

TEST(StreamMessage, ParsesKnownTypesOnly)
{
  StreamMessage message;
  std::string error;
  ASSERT_TRUE(parse_stream_message(
      "{\"type\":\"final\",\"text\":\"hi\",\"start\":1.0,\"end\":2.0}", message, error));
  EXPECT_EQ(message.type, StreamMessage::Type::FINAL);
  EXPECT_TRUE(message.has_times);
  EXPECT_DOUBLE_EQ(message.end, 2.0);

  ASSERT_TRUE(parse_stream_message("{\"type\":\"partial\",\"text\":\"h\"}", message, error));
  EXPECT_EQ(message.type, StreamMessage::Type::PARTIAL);
  EXPECT_FALSE(message.has_times);

  EXPECT_FALSE(parse_stream_message("{\"type\":\"banner\"}", message, error));
  EXPECT_FALSE(parse_stream_message("not json", message, error));
  EXPECT_FALSE(parse_stream_message("[1,2]", message, error));
}

TEST(SegmentOrderGuard, RejectsBackwardsAndInvertedSegments)
{
  SegmentOrderGuard guard;
  std::string error;
  EXPECT_TRUE(guard.accept(0.0, 1.0, error));
  EXPECT_TRUE(guard.accept(1.0, 1.0, error));
  EXPECT_FALSE(guard.accept(0.5, 2.0, error));
  EXPECT_FALSE(guard.accept(3.0, 2.0, error));
  guard.reset();
  EXPECT_TRUE(guard.accept(0.0, 0.5, error));
}

// ---------------------------------------------------------------- one-shot

TEST(OneShot, ParsesStdoutDocument)
{
  const auto result = run_one_shot(
    shell_engine("echo \"{\\\"success\\\": true, \\\"op\\\": \\\"$1\\\", \\\"arg\\\": \\\"$2\\\"}\""),
    "transcribe", {"file.wav"}, 5s);
  ASSERT_TRUE(result.status.ok) << result.status.error;
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.document["op"].asString(), "transcribe");
  EXPECT_EQ(result.document["arg"].asString(), "file.wav");
}

TEST(OneShot, NonZeroExitCarriesStderrVerbatim)
{
  const auto result = run_one_shot(
    shell_engine("echo 'model weights missing' >&2; exit 1"), "transcribe", {}, 5s);
  EXPECT_FALSE(result.status.ok);
  EXPECT_EQ(result.status.code, ErrorCode::SUBPROCESS_ERROR);
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.status.details, "model weights missing\n");
}

TEST(OneShot, SuccessFalseIsAFailure)
{
  const auto result = run_one_shot(
    shell_engine("echo '{\"success\": false, \"error\": \"CUDA unavailable\"}'"),
    "embed", {}, 5s);
  EXPECT_FALSE(result.status.ok);
  EXPECT_EQ(result.status.code, ErrorCode::SUBPROCESS_ERROR);
  EXPECT_EQ(result.status.error, "CUDA unavailable");
}

TEST(OneShot, MalformedAndEmptyOutput)
{
  auto result = run_one_shot(shell_engine("echo 'loading model...'"), "embed", {}, 5s);
  EXPECT_EQ(result.status.code, ErrorCode::SUBPROCESS_ERROR);

  result = run_one_shot(shell_engine("true"), "embed", {}, 5s);
  EXPECT_EQ(result.status.code, ErrorCode::SUBPROCESS_ERROR);
}

TEST(OneShot, TimeoutKillsTheEngine)
{
  const auto started = std::chrono::steady_clock::now();
  const auto result = run_one_shot(shell_engine("exec sleep 30"), "diarize", {}, 300ms);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_FALSE(result.status.ok);
  EXPECT_EQ(result.status.code, ErrorCode::SUBPROCESS_ERROR);
  EXPECT_NE(result.status.error.find("timed out"), std::string::npos);
  EXPECT_LT(elapsed, 5s);
}

TEST(OneShot, MissingExecutable)
{
  SubprocessCommand command;
  command.executable = "/nonexistent/python3";
  const auto result = run_one_shot(command, "test", {}, 5s);
  EXPECT_FALSE(result.status.ok);
  EXPECT_EQ(result.status.code, ErrorCode::SUBPROCESS_ERROR);
}

// ---------------------------------------------------------------- streaming

TEST(StreamingBridge, PartialAndFinalThenCleanClose)
{
  Recorder recorder;
  StreamingBridge bridge(shell_engine(
      "echo '{\"type\":\"partial\",\"text\":\"hel\"}';"
      "echo '{\"type\":\"final\",\"text\":\"hello\",\"start\":0.0,\"end\":1.2}';"
      "cat > /dev/null"));
  ASSERT_TRUE(bridge.start("stream", {"zh", "16000"}, recorder.callbacks()));
  EXPECT_TRUE(bridge.running());

  const std::vector<uint8_t> chunk(3200, 0);
  EXPECT_TRUE(bridge.write(chunk.data(), chunk.size()));
  ASSERT_TRUE(wait_for([&]() {return recorder.message_count() == 2;}));

  EXPECT_TRUE(bridge.close());
  EXPECT_TRUE(recorder.completed.load());
  EXPECT_EQ(recorder.terminal_count(), 0U);
  EXPECT_EQ(bridge.exit_code(), 0);

  std::lock_guard<std::mutex> lock(recorder.mutex);
  EXPECT_EQ(recorder.messages[0].type, StreamMessage::Type::PARTIAL);
  EXPECT_EQ(recorder.messages[1].type, StreamMessage::Type::FINAL);
  EXPECT_EQ(recorder.messages[1].text, "hello");
}

TEST(StreamingBridge, ErrorAndGarbageLinesAreRecoverable)
{
  Recorder recorder;
  StreamingBridge bridge(shell_engine(
      "echo '{\"type\":\"error\",\"error\":\"vad hiccup\"}';"
      "echo 'warming up';"
      "echo '{\"type\":\"final\",\"text\":\"still here\",\"start\":0,\"end\":1}';"
      "cat > /dev/null"));
  ASSERT_TRUE(bridge.start("stream", {}, recorder.callbacks()));
  ASSERT_TRUE(wait_for([&]() {return recorder.message_count() == 1;}));

  EXPECT_EQ(recorder.recoverable_count(), 2U);
  EXPECT_TRUE(bridge.running());
  bridge.close();
  EXPECT_EQ(recorder.terminal_count(), 0U);
}

TEST(StreamingBridge, OutOfOrderFinalIsDropped)
{
  Recorder recorder;
  StreamingBridge bridge(shell_engine(
      "echo '{\"type\":\"final\",\"text\":\"b\",\"start\":2,\"end\":3}';"
      "echo '{\"type\":\"final\",\"text\":\"a\",\"start\":1,\"end\":2}';"
      "echo '{\"type\":\"final\",\"text\":\"c\",\"start\":3,\"end\":4}';"
      "cat > /dev/null"));
  ASSERT_TRUE(bridge.start("stream", {}, recorder.callbacks()));
  ASSERT_TRUE(wait_for([&]() {return recorder.message_count() == 2;}));
  bridge.close();

  std::lock_guard<std::mutex> lock(recorder.mutex);
  ASSERT_EQ(recorder.recoverable.size(), 1U);
  EXPECT_EQ(recorder.recoverable[0].code, ErrorCode::PROTOCOL_VIOLATION);
  EXPECT_EQ(recorder.messages[1].text, "c");
}

TEST(StreamingBridge, CrashIsTerminal)
{
  Recorder recorder;
  StreamingBridge bridge(shell_engine(
      "echo '{\"type\":\"partial\",\"text\":\"x\"}'; echo 'segfault' >&2; exit 3"));
  ASSERT_TRUE(bridge.start("stream", {}, recorder.callbacks()));
  ASSERT_TRUE(wait_for([&]() {return recorder.terminal_count() == 1;}));

  {
    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT_EQ(recorder.terminal[0].code, ErrorCode::SUBPROCESS_ERROR);
  }
  EXPECT_FALSE(recorder.completed.load());
  EXPECT_FALSE(bridge.running());

  const std::vector<uint8_t> chunk(64, 0);
  EXPECT_FALSE(bridge.write(chunk.data(), chunk.size()));
  bridge.close();
}

TEST(StreamingBridge, CloseKillsAnEngineThatIgnoresEof)
{
  Recorder recorder;
  StreamingBridge bridge(shell_engine("exec sleep 30"), 200ms);
  ASSERT_TRUE(bridge.start("stream", {}, recorder.callbacks()));

  const auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(bridge.close());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
  EXPECT_TRUE(bridge.close());
  EXPECT_FALSE(bridge.running());
  EXPECT_EQ(recorder.terminal_count(), 0U);
  // sleep honours SIGTERM, so SIGKILL is never needed
  EXPECT_EQ(bridge.exit_code(), 128 + SIGTERM);
}

TEST(StreamingBridge, CloseEscalatesToSigkillWhenSigtermIsIgnored)
{
  Recorder recorder;
  StreamingBridge bridge(
    shell_engine("trap '' TERM; while :; do sleep 0.1; done"), 200ms);
  ASSERT_TRUE(bridge.start("stream", {}, recorder.callbacks()));
  // Give the shell time to install the trap.
  std::this_thread::sleep_for(200ms);

  const auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(bridge.close());
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_GE(elapsed, 1s);
  EXPECT_LT(elapsed, 8s);
  EXPECT_EQ(bridge.exit_code(), 128 + SIGKILL);
  EXPECT_FALSE(bridge.running());
}

TEST(StreamingBridge, WriteAfterCloseFails)
{
  Recorder recorder;
  StreamingBridge bridge(shell_engine("cat > /dev/null"));
  ASSERT_TRUE(bridge.start("stream", {}, recorder.callbacks()));
  bridge.close();

  const std::vector<uint8_t> chunk(64, 0);
  EXPECT_FALSE(bridge.write(chunk.data(), chunk.size()));
  EXPECT_FALSE(bridge.last_error().empty());
}

// ---------------------------------------------------------------- local providers

TEST(LocalBatchTranscription, RejectsStreaming)
{
  LocalBatchConfig config;
  LocalBatchTranscription provider(config);
  EXPECT_FALSE(provider.supports(Capability::STREAMING));
  EXPECT_TRUE(provider.supports(Capability::BATCH_TRANSCRIPTION));

  EXPECT_EQ(provider.start_realtime(RealtimeConfig()).code, ErrorCode::CAPABILITY_UNSUPPORTED);
  EXPECT_EQ(provider.send_audio({0, 0}).code, ErrorCode::CAPABILITY_UNSUPPORTED);
  EXPECT_EQ(provider.stop_realtime().code, ErrorCode::CAPABILITY_UNSUPPORTED);
}

TEST(LocalBatchTranscription, TranscribesThroughEngine)
{
  LocalBatchConfig config;
  config.executable = "/bin/sh";
  config.base_args = {
    "-c",
    "test -f \"$2\" || exit 2;"
    "echo '{\"success\":true,\"text\":\"good morning\",\"language\":\"en\","
    "\"segments\":[{\"text\":\"good morning\",\"start\":0.0,\"end\":1.5}]}'",
    "fake"};
  config.timeout_ms = 5000;
  LocalBatchTranscription provider(config);

  const TranscriptResult result = provider.transcribe_file(std::vector<uint8_t>(320, 0), {});
  ASSERT_TRUE(result.status.ok) << result.status.error;
  ASSERT_EQ(result.segments.size(), 1U);
  EXPECT_EQ(result.full_text, "good morning");
  EXPECT_EQ(result.language, "en");
}

TEST(LocalStreamingTranscription, StreamsFinalsToCallbacks)
{
  LocalStreamingConfig config;
  config.executable = "/bin/sh";
  config.base_args = {
    "-c",
    "echo '{\"type\":\"final\",\"text\":\"hello\",\"start\":0.0,\"end\":0.5}';"
    "cat > /dev/null",
    "fake"};
  config.close_grace_ms = 2000;
  LocalStreamingTranscription provider(config);
  EXPECT_TRUE(provider.supports(Capability::STREAMING));

  std::mutex mutex;
  std::vector<TranscriptSegment> finals;
  std::atomic<bool> completed{false};
  RealtimeConfig realtime;
  realtime.on_transcript = [&](const TranscriptSegment & segment, bool is_final) {
      if (is_final) {
        std::lock_guard<std::mutex> lock(mutex);
        finals.push_back(segment);
      }
    };
  realtime.on_complete = [&]() {completed = true;};

  ASSERT_TRUE(provider.start_realtime(realtime).ok);
  EXPECT_EQ(provider.start_realtime(realtime).code, ErrorCode::INVALID_STATE_TRANSITION);
  EXPECT_TRUE(provider.send_audio(std::vector<uint8_t>(3200, 0)).ok);
  ASSERT_TRUE(wait_for([&]() {
      std::lock_guard<std::mutex> lock(mutex);
      return finals.size() == 1;
    }));
  EXPECT_TRUE(provider.stop_realtime().ok);
  EXPECT_TRUE(completed.load());

  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(finals[0].text, "hello");
}
