#pragma once

#include "meetscribe/errors.hpp"

#include <json/json.h>
#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace meetscribe
{

/// An inference engine invocation: `<executable> <base_args...> <operation> <args...>`
struct SubprocessCommand
{
  std::string executable;
  std::vector<std::string> base_args;   ///< e.g. the service script passed to python3
};

struct OneShotResult
{
  Status status;
  Json::Value document;
  int exit_code = -1;
  std::string stderr_text;
};

/// Runs the engine to completion and parses stdout as one JSON document.
/// Non-zero exit, timeout, spawn failure, malformed output or a
/// {"success": false} document all yield SUBPROCESS_ERROR with the captured
/// stderr in Status::details.
OneShotResult run_one_shot(
  const SubprocessCommand & command,
  const std::string & operation,
  const std::vector<std::string> & args,
  std::chrono::milliseconds timeout);

/// Splits a byte stream on '\n', keeping an incomplete trailing line
/// buffered until the next feed.
class LineFramer
{
public:
  std::vector<std::string> feed(const char * data, size_t size);
  /// Returns and clears whatever is left without a newline
  std::string take_remainder();
  size_t buffered() const { return buffer_.size(); }

private:
  std::string buffer_;
};

struct StreamMessage
{
  enum class Type
  {
    PARTIAL,
    FINAL,
    ERROR
  };

  Type type = Type::PARTIAL;
  std::string text;
  double start = 0.0;
  double end = 0.0;
  bool has_times = false;
  std::string error;
};

/// Parses one NDJSON line `{type: partial|final|error, text?, start?, end?, error?}`
bool parse_stream_message(const std::string & line, StreamMessage & out, std::string & error);

/// Rejects segments that start before their predecessor or end before they
/// start.
class SegmentOrderGuard
{
public:
  bool accept(double start, double end, std::string & error);
  void reset();

private:
  double last_start_ = 0.0;
  bool seen_ = false;
};

struct StreamCallbacks
{
  std::function<void(const StreamMessage &)> on_message;
  /// Malformed or error-tagged output; the process keeps running
  std::function<void(const Status &)> on_recoverable_error;
  /// Crash or exit that was not requested through close()
  std::function<void(const Status &)> on_terminal_error;
  /// Output drained after a requested close
  std::function<void()> on_complete;
};

/// Long-lived engine process fed through stdin and read as NDJSON from
/// stdout by a dedicated reader thread. Callbacks run on that thread.
class StreamingBridge
{
public:
  StreamingBridge(
    const SubprocessCommand & command,
    std::chrono::milliseconds close_grace = std::chrono::milliseconds(3000));
  ~StreamingBridge();

  StreamingBridge(const StreamingBridge &) = delete;
  StreamingBridge & operator=(const StreamingBridge &) = delete;

  bool start(
    const std::string & operation,
    const std::vector<std::string> & args,
    const StreamCallbacks & callbacks);

  /// Single writer; concurrent callers are serialized. Fails promptly once
  /// close() has begun.
  bool write(const uint8_t * data, size_t size);

  /// Closes stdin, waits up to the grace period for a clean exit, then sends
  /// SIGTERM and finally SIGKILL, and joins the reader. Safe to call repeatedly.
  bool close();

  bool running() const;
  int exit_code() const { return exit_code_.load(); }
  std::string last_error() const;
  std::string stderr_tail() const;

private:
  void reader_loop();
  void handle_line(const std::string & line);
  void set_error(const std::string & error);
  bool reap(std::chrono::milliseconds timeout);

  SubprocessCommand command_;
  std::chrono::milliseconds close_grace_;
  StreamCallbacks callbacks_;
  SegmentOrderGuard order_guard_;

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;

  std::thread reader_thread_;
  std::atomic<bool> started_{false};
  std::atomic<bool> closing_{false};
  std::atomic<bool> stop_reader_{false};
  std::atomic<bool> exited_{false};
  std::atomic<int> exit_code_{-1};

  std::mutex write_mutex_;
  std::mutex close_mutex_;
  std::mutex reap_mutex_;
  mutable std::mutex error_mutex_;
  std::string last_error_;
  std::string stderr_tail_;
};

}  // namespace meetscribe
