#include "meetscribe/subprocess_bridge.hpp"

#include <meetscribe_common/json_utils.hpp>
#include <meetscribe_common/string_utils.hpp>

#include "rclcpp/rclcpp.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace std;


namespace meetscribe
{
namespace
{

constexpr size_t kStderrTailLimit = 8 * 1024;
constexpr size_t kOneShotStderrLimit = 256 * 1024;
constexpr int kPollTickMs = 100;
constexpr chrono::milliseconds kTermGrace(1000);

rclcpp::Logger bridge_logger()
{
  return rclcpp::get_logger("meetscribe.subprocess");
}

void ignore_sigpipe_once()
{
  static once_flag flag;
  call_once(flag, []() {
      signal(SIGPIPE, SIG_IGN);
    });
}

void close_fd(int & fd)
{
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

struct ChildPipes
{
  pid_t pid = -1;
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
};

vector<string> build_argv(
  const SubprocessCommand & command,
  const string & operation,
  const vector<string> & args)
{
  vector<string> argv;
  argv.reserve(command.base_args.size() + args.size() + 2);
  argv.push_back(command.executable);
  argv.insert(argv.end(), command.base_args.begin(), command.base_args.end());
  if (!operation.empty()) {
    argv.push_back(operation);
  }
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

bool spawn_child(const vector<string> & argv, ChildPipes & out, string & error)
{
  if (argv.empty() || argv.front().empty()) {
    error = "engine executable is empty";
    return false;
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  auto close_all = [&]() {
      for (int * p : {in_pipe, out_pipe, err_pipe}) {
        close_fd(p[0]);
        close_fd(p[1]);
      }
    };

  if (pipe2(in_pipe, O_CLOEXEC) != 0 ||
    pipe2(out_pipe, O_CLOEXEC) != 0 ||
    pipe2(err_pipe, O_CLOEXEC) != 0)
  {
    error = string("pipe failed: ") + strerror(errno);
    close_all();
    return false;
  }

  // Everything the child touches is prepared before fork.
  vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto & a : argv) {
    cargv.push_back(const_cast<char *>(a.c_str()));
  }
  cargv.push_back(nullptr);
  const string exec_error = "exec failed: " + argv.front() + "\n";

  const pid_t pid = fork();
  if (pid < 0) {
    error = string("fork failed: ") + strerror(errno);
    close_all();
    return false;
  }

  if (pid == 0) {
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(cargv[0], cargv.data());
    const ssize_t ignored = ::write(STDERR_FILENO, exec_error.data(), exec_error.size());
    (void)ignored;
    _exit(127);
  }

  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  out.pid = pid;
  out.stdin_fd = in_pipe[1];
  out.stdout_fd = out_pipe[0];
  out.stderr_fd = err_pipe[0];
  return true;
}

int decode_exit_status(int status)
{
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

/// Polls waitpid(WNOHANG) until the child is reaped or the timeout passes.
bool wait_for_exit(pid_t pid, chrono::milliseconds timeout, int & exit_code)
{
  const auto deadline = chrono::steady_clock::now() + timeout;
  while (true) {
    int status = 0;
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      exit_code = decode_exit_status(status);
      return true;
    }
    if (waited < 0 && errno != EINTR) {
      exit_code = -1;
      return true;
    }
    if (chrono::steady_clock::now() >= deadline) {
      return false;
    }
    this_thread::sleep_for(chrono::milliseconds(20));
  }
}

/// SIGTERM, up to kTermGrace for the engine to exit, then SIGKILL.
int kill_and_reap(pid_t pid)
{
  if (kill(pid, SIGTERM) != 0 && errno != ESRCH) {
    RCLCPP_WARN(bridge_logger(), "SIGTERM to pid %d failed: %s", pid, strerror(errno));
  }
  int exit_code = -1;
  if (wait_for_exit(pid, kTermGrace, exit_code)) {
    return exit_code;
  }

  RCLCPP_WARN(
    bridge_logger(), "pid %d ignored SIGTERM for %lld ms, sending SIGKILL",
    static_cast<int>(pid), static_cast<long long>(kTermGrace.count()));
  if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
    RCLCPP_WARN(bridge_logger(), "SIGKILL to pid %d failed: %s", pid, strerror(errno));
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return decode_exit_status(status);
}

/// Reads what is available on fd. Returns false on EOF or a hard error.
bool drain_fd(int fd, string & sink)
{
  char buffer[4096];
  const ssize_t n = ::read(fd, buffer, sizeof(buffer));
  if (n > 0) {
    sink.append(buffer, static_cast<size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
    return true;
  }
  return false;
}

void keep_tail(string & text, size_t limit)
{
  if (text.size() > limit) {
    text.erase(0, text.size() - limit);
  }
}

}  // namespace

OneShotResult run_one_shot(
  const SubprocessCommand & command,
  const string & operation,
  const vector<string> & args,
  chrono::milliseconds timeout)
{
  OneShotResult result;
  ignore_sigpipe_once();

  ChildPipes child;
  string spawn_error;
  if (!spawn_child(build_argv(command, operation, args), child, spawn_error)) {
    result.status = make_error(ErrorCode::SUBPROCESS_ERROR, operation + ": " + spawn_error);
    return result;
  }
  // One-shot engines take their input from arguments; stdin is EOF.
  close_fd(child.stdin_fd);

  string stdout_text;
  string failure;
  const auto deadline = chrono::steady_clock::now() + timeout;

  while (child.stdout_fd >= 0 || child.stderr_fd >= 0) {
    const auto now = chrono::steady_clock::now();
    if (now >= deadline) {
      failure = operation + " timed out after " + to_string(timeout.count()) + " ms";
      break;
    }

    pollfd fds[2];
    nfds_t count = 0;
    int stdout_index = -1;
    int stderr_index = -1;
    if (child.stdout_fd >= 0) {
      fds[count] = {child.stdout_fd, POLLIN, 0};
      stdout_index = static_cast<int>(count++);
    }
    if (child.stderr_fd >= 0) {
      fds[count] = {child.stderr_fd, POLLIN, 0};
      stderr_index = static_cast<int>(count++);
    }

    const long long remaining =
      chrono::duration_cast<chrono::milliseconds>(deadline - now).count();
    const int rc = poll(fds, count, static_cast<int>(min<long long>(remaining, kPollTickMs)));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      failure = string("poll failed: ") + strerror(errno);
      break;
    }
    if (rc == 0) {
      continue;
    }

    if (stdout_index >= 0 && fds[stdout_index].revents != 0) {
      if (!drain_fd(child.stdout_fd, stdout_text)) {
        close_fd(child.stdout_fd);
      }
    }
    if (stderr_index >= 0 && fds[stderr_index].revents != 0) {
      if (!drain_fd(child.stderr_fd, result.stderr_text)) {
        close_fd(child.stderr_fd);
      }
      keep_tail(result.stderr_text, kOneShotStderrLimit);
    }
  }
  close_fd(child.stdout_fd);
  close_fd(child.stderr_fd);

  if (failure.empty()) {
    const auto now = chrono::steady_clock::now();
    const auto remaining = now < deadline ?
      chrono::duration_cast<chrono::milliseconds>(deadline - now) : chrono::milliseconds(0);
    if (!wait_for_exit(child.pid, remaining, result.exit_code)) {
      failure = operation + " did not exit within " + to_string(timeout.count()) + " ms";
    }
  }

  if (!failure.empty()) {
    result.exit_code = kill_and_reap(child.pid);
    RCLCPP_WARN(
      bridge_logger(), "%s (pid %d killed)", failure.c_str(), static_cast<int>(child.pid));
    result.status = make_error(ErrorCode::SUBPROCESS_ERROR, failure, result.stderr_text);
    return result;
  }

  if (result.exit_code != 0) {
    result.status = make_error(
      ErrorCode::SUBPROCESS_ERROR,
      operation + " exited with code " + to_string(result.exit_code),
      result.stderr_text);
    return result;
  }

  const string trimmed = meetscribe_common::trim(stdout_text);
  if (trimmed.empty()) {
    result.status = make_error(
      ErrorCode::SUBPROCESS_ERROR, operation + " produced no output", result.stderr_text);
    return result;
  }

  string parse_error;
  if (!meetscribe_common::parse_json(trimmed, result.document, parse_error)) {
    result.status = make_error(
      ErrorCode::SUBPROCESS_ERROR,
      operation + " produced malformed output: " + meetscribe_common::trim(parse_error),
      result.stderr_text);
    return result;
  }

  const Json::Value & doc = result.document;
  if (doc.isObject() && doc.isMember("success") && doc["success"].isBool() &&
    !doc["success"].asBool())
  {
    result.status = make_error(
      ErrorCode::SUBPROCESS_ERROR,
      meetscribe_common::string_member(doc, "error", operation + " reported failure"),
      result.stderr_text);
    return result;
  }

  return result;
}

vector<string> LineFramer::feed(const char * data, size_t size)
{
  vector<string> lines;
  buffer_.append(data, size);

  size_t start = 0;
  while (true) {
    const size_t pos = buffer_.find('\n', start);
    if (pos == string::npos) {
      break;
    }
    string line = buffer_.substr(start, pos - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(move(line));
    start = pos + 1;
  }
  buffer_.erase(0, start);
  return lines;
}

string LineFramer::take_remainder()
{
  string rest;
  rest.swap(buffer_);
  return rest;
}

bool parse_stream_message(const string & line, StreamMessage & out, string & error)
{
  Json::Value doc;
  string parse_error;
  if (!meetscribe_common::parse_json(line, doc, parse_error)) {
    error = "malformed message: " + meetscribe_common::trim(parse_error);
    return false;
  }
  if (!doc.isObject()) {
    error = "message is not a JSON object";
    return false;
  }

  const string type = meetscribe_common::to_lower(meetscribe_common::string_member(doc, "type"));
  if (type == "partial") {
    out.type = StreamMessage::Type::PARTIAL;
  } else if (type == "final") {
    out.type = StreamMessage::Type::FINAL;
  } else if (type == "error") {
    out.type = StreamMessage::Type::ERROR;
  } else {
    error = "unknown message type: " + type;
    return false;
  }

  out.text = meetscribe_common::string_member(doc, "text");
  out.error = meetscribe_common::string_member(doc, "error");
  double start = 0.0;
  double end = 0.0;
  out.has_times = meetscribe_common::number_member(doc, "start", start) &&
    meetscribe_common::number_member(doc, "end", end);
  if (out.has_times) {
    out.start = start;
    out.end = end;
  }
  return true;
}

bool SegmentOrderGuard::accept(double start, double end, string & error)
{
  if (end < start) {
    ostringstream oss;
    oss << "segment ends before it starts (" << start << " > " << end << ")";
    error = oss.str();
    return false;
  }
  if (seen_ && start < last_start_) {
    ostringstream oss;
    oss << "segment starts at " << start << " before previous start " << last_start_;
    error = oss.str();
    return false;
  }
  seen_ = true;
  last_start_ = start;
  return true;
}

void SegmentOrderGuard::reset()
{
  seen_ = false;
  last_start_ = 0.0;
}

StreamingBridge::StreamingBridge(
  const SubprocessCommand & command,
  chrono::milliseconds close_grace)
: command_(command),
  close_grace_(close_grace)
{
}

StreamingBridge::~StreamingBridge()
{
  close();
  if (reader_thread_.joinable()) {
    reader_thread_.detach();
  }
}

bool StreamingBridge::start(
  const string & operation,
  const vector<string> & args,
  const StreamCallbacks & callbacks)
{
  if (started_.load()) {
    set_error("engine already started");
    return false;
  }
  ignore_sigpipe_once();

  ChildPipes child;
  string error;
  if (!spawn_child(build_argv(command_, operation, args), child, error)) {
    set_error(error);
    return false;
  }

  callbacks_ = callbacks;
  pid_ = child.pid;
  stdin_fd_ = child.stdin_fd;
  stdout_fd_ = child.stdout_fd;
  stderr_fd_ = child.stderr_fd;

  const int flags = fcntl(stdin_fd_, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(stdin_fd_, F_SETFL, flags | O_NONBLOCK);
  }

  started_ = true;
  reader_thread_ = thread(&StreamingBridge::reader_loop, this);
  RCLCPP_INFO(
    bridge_logger(), "started %s %s (pid %d)",
    command_.executable.c_str(), operation.c_str(), static_cast<int>(pid_));
  return true;
}

bool StreamingBridge::write(const uint8_t * data, size_t size)
{
  lock_guard<mutex> lock(write_mutex_);
  if (!started_.load() || closing_.load() || stdin_fd_ < 0) {
    set_error("engine input is closed");
    return false;
  }
  if (exited_.load()) {
    set_error("engine process has exited");
    return false;
  }

  size_t offset = 0;
  while (offset < size) {
    if (closing_.load()) {
      set_error("write cancelled by close");
      return false;
    }

    pollfd pfd{stdin_fd_, POLLOUT, 0};
    const int rc = poll(&pfd, 1, kPollTickMs);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      set_error(string("poll failed: ") + strerror(errno));
      return false;
    }
    if (rc == 0) {
      continue;
    }
    if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
      set_error("engine closed its input");
      return false;
    }

    const ssize_t n = ::write(stdin_fd_, data + offset, size - offset);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      set_error(string("write failed: ") + strerror(errno));
      return false;
    }
    offset += static_cast<size_t>(n);
  }
  return true;
}

bool StreamingBridge::close()
{
  lock_guard<mutex> close_lock(close_mutex_);
  if (!started_.load()) {
    return true;
  }

  closing_ = true;
  {
    // A blocked writer observes closing_ within one poll tick.
    lock_guard<mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
  }

  bool clean = reap(close_grace_);
  if (!clean) {
    RCLCPP_WARN(
      bridge_logger(), "engine pid %d did not exit within %lld ms, killing",
      static_cast<int>(pid_), static_cast<long long>(close_grace_.count()));
    lock_guard<mutex> lock(reap_mutex_);
    if (!exited_.load()) {
      exit_code_ = kill_and_reap(pid_);
      exited_ = true;
    }
  }

  stop_reader_ = true;
  if (reader_thread_.joinable() && reader_thread_.get_id() != this_thread::get_id()) {
    reader_thread_.join();
  }
  close_fd(stdout_fd_);
  close_fd(stderr_fd_);
  return clean;
}

bool StreamingBridge::running() const
{
  return started_.load() && !closing_.load() && !exited_.load();
}

string StreamingBridge::last_error() const
{
  lock_guard<mutex> lock(error_mutex_);
  return last_error_;
}

string StreamingBridge::stderr_tail() const
{
  lock_guard<mutex> lock(error_mutex_);
  return stderr_tail_;
}

void StreamingBridge::set_error(const string & error)
{
  lock_guard<mutex> lock(error_mutex_);
  last_error_ = error;
}

bool StreamingBridge::reap(chrono::milliseconds timeout)
{
  lock_guard<mutex> lock(reap_mutex_);
  if (exited_.load() || pid_ <= 0) {
    return true;
  }
  int code = -1;
  if (!wait_for_exit(pid_, timeout, code)) {
    return false;
  }
  exit_code_ = code;
  exited_ = true;
  return true;
}

void StreamingBridge::reader_loop()
{
  LineFramer framer;
  string chunk;
  bool stderr_open = stderr_fd_ >= 0;

  while (true) {
    pollfd fds[2];
    nfds_t count = 0;
    fds[count++] = {stdout_fd_, POLLIN, 0};
    if (stderr_open) {
      fds[count++] = {stderr_fd_, POLLIN, 0};
    }

    const int rc = poll(fds, count, kPollTickMs);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (rc == 0) {
      if (stop_reader_.load()) {
        break;
      }
      continue;
    }

    if (stderr_open && fds[1].revents != 0) {
      string err_chunk;
      stderr_open = drain_fd(stderr_fd_, err_chunk);
      if (!err_chunk.empty()) {
        lock_guard<mutex> lock(error_mutex_);
        stderr_tail_ += err_chunk;
        keep_tail(stderr_tail_, kStderrTailLimit);
      }
    }

    if (fds[0].revents != 0) {
      chunk.clear();
      const bool open = drain_fd(stdout_fd_, chunk);
      for (const auto & line : framer.feed(chunk.data(), chunk.size())) {
        handle_line(line);
      }
      if (!open) {
        break;
      }
    }
  }

  const string rest = framer.take_remainder();
  if (!meetscribe_common::trim(rest).empty()) {
    handle_line(rest);
  }

  if (closing_.load()) {
    if (callbacks_.on_complete) {
      callbacks_.on_complete();
    }
    return;
  }

  reap(chrono::milliseconds(500));
  ostringstream oss;
  oss << "engine exited unexpectedly";
  if (exited_.load() && exit_code_.load() >= 0) {
    oss << " with code " << exit_code_.load();
  }
  const string message = oss.str();
  set_error(message);
  RCLCPP_ERROR(bridge_logger(), "%s (pid %d)", message.c_str(), static_cast<int>(pid_));
  if (callbacks_.on_terminal_error) {
    callbacks_.on_terminal_error(
      make_error(ErrorCode::SUBPROCESS_ERROR, message, stderr_tail()));
  }
}

void StreamingBridge::handle_line(const string & line)
{
  const string trimmed = meetscribe_common::trim(line);
  if (trimmed.empty()) {
    return;
  }

  StreamMessage message;
  string error;
  if (!parse_stream_message(trimmed, message, error)) {
    if (callbacks_.on_recoverable_error) {
      callbacks_.on_recoverable_error(make_error(ErrorCode::PROTOCOL_VIOLATION, error));
    }
    return;
  }

  if (message.type == StreamMessage::Type::ERROR) {
    if (callbacks_.on_recoverable_error) {
      const string text = message.error.empty() ?
        (message.text.empty() ? "engine reported an error" : message.text) : message.error;
      callbacks_.on_recoverable_error(make_error(ErrorCode::SUBPROCESS_ERROR, text));
    }
    return;
  }

  if (message.type == StreamMessage::Type::FINAL && message.has_times &&
    !order_guard_.accept(message.start, message.end, error))
  {
    if (callbacks_.on_recoverable_error) {
      callbacks_.on_recoverable_error(
        make_error(ErrorCode::PROTOCOL_VIOLATION, "out-of-order segment: " + error));
    }
    return;
  }

  if (callbacks_.on_message) {
    callbacks_.on_message(message);
  }
}

}  // namespace meetscribe
