#include "meetscribe/hosted_transcription.hpp"

#include <meetscribe_common/curl_utils.hpp>
#include <meetscribe_common/json_utils.hpp>
#include <meetscribe_common/string_utils.hpp>

#include "rclcpp/rclcpp.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

#include <poll.h>

using namespace std;


namespace meetscribe
{
namespace
{

static const meetscribe_common::CurlGlobalGuard curl_guard;

rclcpp::Logger hosted_logger()
{
  return rclcpp::get_logger("meetscribe.hosted_asr");
}

// curl_ws_recv takes `curl_ws_frame **` before 8.0 and `const curl_ws_frame **`
// from 8.0 on; let the compiler pick.
template<typename Frame>
CURLcode ws_recv(
  CURLcode (*fn)(CURL *, void *, size_t, size_t *, Frame **),
  CURL * curl, void * buffer, size_t size, size_t * received, const curl_ws_frame *& meta)
{
  Frame * frame = nullptr;
  const CURLcode rc = fn(curl, buffer, size, received, &frame);
  meta = frame;
  return rc;
}

string http_error(long http_code, const string & body)
{
  ostringstream oss;
  oss << "http_" << http_code;
  const string trimmed = meetscribe_common::trim(body);
  if (!trimmed.empty()) {
    oss << ":" << trimmed.substr(0, 200);
  }
  return oss.str();
}

}  // namespace

HostedStreamingTranscription::HostedStreamingTranscription(const HostedStreamingConfig & config)
: config_(config)
{
}

HostedStreamingTranscription::~HostedStreamingTranscription()
{
  stop_realtime();
}

CapabilitySet HostedStreamingTranscription::capabilities() const
{
  return {Capability::STREAMING};
}

CURL * HostedStreamingTranscription::open_connection(string & error) const
{
  if (config_.url.empty()) {
    error = "streaming url is not configured";
    return nullptr;
  }
  if (config_.api_key.empty()) {
    error = "api_key is empty";
    return nullptr;
  }

  CURL * curl = curl_easy_init();
  if (!curl) {
    error = "curl_init_failed";
    return nullptr;
  }

  const string auth = "Authorization: Bearer " + config_.api_key;
  struct curl_slist * headers = nullptr;
  headers = curl_slist_append(headers, auth.c_str());

  curl_easy_setopt(curl, CURLOPT_URL, config_.url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config_.connect_timeout_sec);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(curl);
  curl_slist_free_all(headers);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
  if (rc != CURLE_OK) {
    error = "curl_error:" + string(curl_easy_strerror(rc));
    curl_easy_cleanup(curl);
    return nullptr;
  }
  return curl;
}

Status HostedStreamingTranscription::start_realtime(const RealtimeConfig & config)
{
  lock_guard<mutex> lifecycle(lifecycle_mutex_);
  {
    lock_guard<mutex> lock(curl_mutex_);
    if (curl_) {
      return make_error(ErrorCode::INVALID_STATE_TRANSITION, "stream already running");
    }
  }
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }

  string error;
  CURL * curl = open_connection(error);
  if (!curl) {
    return make_error(ErrorCode::NETWORK_ERROR, name() + " connect failed: " + error);
  }

  {
    lock_guard<mutex> lock(curl_mutex_);
    curl_ = curl;
    curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &socket_);
  }
  realtime_ = config;
  order_guard_.reset();
  stopping_ = false;
  stop_reader_ = false;
  {
    lock_guard<mutex> lock(finished_mutex_);
    finished_ = false;
  }

  Json::Value start(Json::objectValue);
  start["type"] = "start";
  start["language"] = config.language.empty() ? config_.language : config.language;
  start["sample_rate"] = config.sample_rate;
  start["format"] = "pcm_s16le";
  if (!config_.model.empty()) {
    start["model"] = config_.model;
  }
  const string payload = meetscribe_common::to_compact_json(start);
  const Status sent = send_frame(payload.data(), payload.size(), CURLWS_TEXT, false);
  if (!sent.ok) {
    teardown();
    return sent;
  }

  reader_thread_ = thread(&HostedStreamingTranscription::reader_loop, this);
  RCLCPP_INFO(hosted_logger(), "%s stream opened", name().c_str());
  return Status{};
}

Status HostedStreamingTranscription::send_audio(const vector<uint8_t> & chunk)
{
  {
    lock_guard<mutex> lock(curl_mutex_);
    if (!curl_) {
      return make_error(ErrorCode::INVALID_STATE_TRANSITION, "stream is not running");
    }
  }
  const size_t frame_limit = config_.max_frame_bytes > 0 ? config_.max_frame_bytes : chunk.size();
  for (size_t offset = 0; offset < chunk.size(); offset += frame_limit) {
    const size_t size = min(frame_limit, chunk.size() - offset);
    const Status sent = send_frame(
      reinterpret_cast<const char *>(chunk.data()) + offset, size, CURLWS_BINARY, true);
    if (!sent.ok) {
      return sent;
    }
  }
  return Status{};
}

Status HostedStreamingTranscription::stop_realtime()
{
  lock_guard<mutex> lifecycle(lifecycle_mutex_);
  {
    lock_guard<mutex> lock(curl_mutex_);
    if (!curl_) {
      if (reader_thread_.joinable()) {
        stop_reader_ = true;
        reader_thread_.join();
      }
      return Status{};
    }
  }

  stopping_ = true;
  const string end_frame = "{\"type\":\"end\"}";
  const Status sent = send_frame(end_frame.data(), end_frame.size(), CURLWS_TEXT, false);
  if (!sent.ok) {
    RCLCPP_WARN(hosted_logger(), "%s end frame failed: %s", name().c_str(), sent.error.c_str());
  } else {
    unique_lock<mutex> lock(finished_mutex_);
    const bool done = finished_cv_.wait_for(
      lock, chrono::milliseconds(config_.close_grace_ms), [this]() {return finished_;});
    if (!done) {
      RCLCPP_WARN(
        hosted_logger(), "%s did not finish within %ld ms, closing",
        name().c_str(), config_.close_grace_ms);
    }
  }

  stop_reader_ = true;
  if (reader_thread_.joinable()) {
    reader_thread_.join();
  }
  teardown();
  return Status{};
}

TranscriptResult HostedStreamingTranscription::transcribe_file(
  const vector<uint8_t> &,
  const TranscriptionOptions &)
{
  TranscriptResult out;
  out.status = unsupported_operation(name(), "transcribe_file");
  return out;
}

bool HostedStreamingTranscription::health_check()
{
  string error;
  CURL * curl = open_connection(error);
  if (!curl) {
    return false;
  }
  size_t sent = 0;
  curl_ws_send(curl, "", 0, &sent, 0, CURLWS_CLOSE);
  curl_easy_cleanup(curl);
  return true;
}

Status HostedStreamingTranscription::send_frame(
  const char * data, size_t size, unsigned int flags, bool cancellable)
{
  const auto deadline = chrono::steady_clock::now() + chrono::milliseconds(config_.send_timeout_ms);
  size_t offset = 0;
  while (true) {
    if (cancellable && stopping_.load()) {
      return make_error(ErrorCode::SESSION_TERMINATED, "stream is closing");
    }

    CURLcode rc = CURLE_OK;
    size_t sent = 0;
    {
      lock_guard<mutex> lock(curl_mutex_);
      if (!curl_) {
        return make_error(ErrorCode::NETWORK_ERROR, "connection closed");
      }
      rc = curl_ws_send(curl_, data + offset, size - offset, &sent, 0, flags);
    }
    offset += sent;
    if (rc == CURLE_OK && offset >= size) {
      return Status{};
    }
    if (rc != CURLE_OK && rc != CURLE_AGAIN) {
      return make_error(
        ErrorCode::NETWORK_ERROR, "websocket send failed: " + string(curl_easy_strerror(rc)));
    }
    if (chrono::steady_clock::now() >= deadline) {
      return make_error(ErrorCode::NETWORK_ERROR, "websocket send timed out");
    }
    wait_socket(POLLOUT, 50);
  }
}

void HostedStreamingTranscription::reader_loop()
{
  string frame_text;
  char buffer[8192];

  while (!stop_reader_.load()) {
    size_t received = 0;
    const curl_ws_frame * meta = nullptr;
    CURLcode rc = CURLE_OK;
    {
      lock_guard<mutex> lock(curl_mutex_);
      if (!curl_) {
        break;
      }
      rc = ws_recv(curl_ws_recv, curl_, buffer, sizeof(buffer), &received, meta);
    }

    if (rc == CURLE_AGAIN) {
      wait_socket(POLLIN, 50);
      continue;
    }
    if (rc != CURLE_OK) {
      if (!stopping_.load() && realtime_.on_error) {
        realtime_.on_error(
          make_error(
            ErrorCode::NETWORK_ERROR,
            "websocket receive failed: " + string(curl_easy_strerror(rc))),
          true);
      }
      mark_finished();
      return;
    }
    if (!meta) {
      continue;
    }

    if ((meta->flags & CURLWS_CLOSE) != 0) {
      if (!stopping_.load() && realtime_.on_error) {
        realtime_.on_error(
          make_error(ErrorCode::NETWORK_ERROR, "server closed the stream"), true);
      }
      mark_finished();
      return;
    }
    if ((meta->flags & CURLWS_TEXT) == 0 && (meta->flags & CURLWS_CONT) == 0) {
      continue;
    }

    frame_text.append(buffer, received);
    if (meta->bytesleft == 0) {
      handle_frame(frame_text);
      frame_text.clear();
    }
  }
}

void HostedStreamingTranscription::handle_frame(const string & text)
{
  Json::Value doc;
  string error;
  if (meetscribe_common::parse_json(text, doc, error) &&
    meetscribe_common::string_member(doc, "type") == "end")
  {
    if (realtime_.on_complete) {
      realtime_.on_complete();
    }
    mark_finished();
    return;
  }

  StreamMessage message;
  if (!parse_stream_message(text, message, error)) {
    if (realtime_.on_error) {
      realtime_.on_error(make_error(ErrorCode::PROTOCOL_VIOLATION, error), false);
    }
    return;
  }
  if (message.type == StreamMessage::Type::ERROR) {
    if (realtime_.on_error) {
      realtime_.on_error(
        make_error(
          ErrorCode::NETWORK_ERROR,
          message.error.empty() ? "server reported an error" : message.error),
        false);
    }
    return;
  }

  const bool is_final = message.type == StreamMessage::Type::FINAL;
  if (is_final && message.has_times && !order_guard_.accept(message.start, message.end, error)) {
    if (realtime_.on_error) {
      realtime_.on_error(
        make_error(ErrorCode::PROTOCOL_VIOLATION, "out-of-order segment: " + error), false);
    }
    return;
  }

  if (realtime_.on_transcript) {
    TranscriptSegment segment;
    segment.text = meetscribe_common::trim(message.text);
    segment.start_time = message.start;
    segment.end_time = message.end;
    if (!is_final && segment.text.empty()) {
      return;
    }
    realtime_.on_transcript(segment, is_final);
  }
}

void HostedStreamingTranscription::mark_finished()
{
  {
    lock_guard<mutex> lock(finished_mutex_);
    finished_ = true;
  }
  finished_cv_.notify_all();
}

bool HostedStreamingTranscription::wait_socket(short events, int timeout_ms) const
{
  if (socket_ == CURL_SOCKET_BAD) {
    this_thread::sleep_for(chrono::milliseconds(timeout_ms));
    return false;
  }
  pollfd pfd{socket_, events, 0};
  return poll(&pfd, 1, timeout_ms) > 0;
}

void HostedStreamingTranscription::teardown()
{
  lock_guard<mutex> lock(curl_mutex_);
  if (!curl_) {
    return;
  }
  size_t sent = 0;
  curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
  curl_easy_cleanup(curl_);
  curl_ = nullptr;
  socket_ = CURL_SOCKET_BAD;
}

HostedBatchTranscription::HostedBatchTranscription(const HostedBatchConfig & config)
: config_(config)
{
}

CapabilitySet HostedBatchTranscription::capabilities() const
{
  return {Capability::BATCH_TRANSCRIPTION};
}

Status HostedBatchTranscription::start_realtime(const RealtimeConfig &)
{
  return unsupported_operation(name(), "start_realtime");
}

Status HostedBatchTranscription::send_audio(const vector<uint8_t> &)
{
  return unsupported_operation(name(), "send_audio");
}

Status HostedBatchTranscription::stop_realtime()
{
  return unsupported_operation(name(), "stop_realtime");
}

TranscriptResult HostedBatchTranscription::transcribe_file(
  const vector<uint8_t> & audio,
  const TranscriptionOptions & options)
{
  TranscriptResult out;
  if (config_.api_key.empty()) {
    out.status = make_error(ErrorCode::INTERNAL_ERROR, "api_key is empty");
    return out;
  }
  if (audio.empty()) {
    out.status = make_error(ErrorCode::INVALID_INPUT, "audio is empty");
    return out;
  }

  CURL * curl = curl_easy_init();
  if (!curl) {
    out.status = make_error(ErrorCode::INTERNAL_ERROR, "curl_init_failed");
    return out;
  }

  const string language = options.language.empty() ? config_.language : options.language;
  const string url = config_.base_url + "/audio/transcriptions";
  string response_body;
  const string auth = "Authorization: Bearer " + config_.api_key;
  struct curl_slist * headers = nullptr;
  headers = curl_slist_append(headers, auth.c_str());

  curl_mime * mime = curl_mime_init(curl);
  curl_mimepart * part = nullptr;

  part = curl_mime_addpart(mime);
  curl_mime_name(part, "file");
  curl_mime_data(part, reinterpret_cast<const char *>(audio.data()), audio.size());
  curl_mime_filename(part, options.filename.empty() ? "audio.wav" : options.filename.c_str());

  part = curl_mime_addpart(mime);
  curl_mime_name(part, "model");
  curl_mime_data(part, config_.model.c_str(), CURL_ZERO_TERMINATED);

  if (!language.empty()) {
    part = curl_mime_addpart(mime);
    curl_mime_name(part, "language");
    curl_mime_data(part, language.c_str(), CURL_ZERO_TERMINATED);
  }

  part = curl_mime_addpart(mime);
  curl_mime_name(part, "response_format");
  curl_mime_data(part, "verbose_json", CURL_ZERO_TERMINATED);

  part = curl_mime_addpart(mime);
  curl_mime_name(part, "timestamp_granularities[]");
  curl_mime_data(part, "segment", CURL_ZERO_TERMINATED);

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, meetscribe_common::curl_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_sec);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  if (rc != CURLE_OK) {
    const string reason = meetscribe_common::is_network_error_code(rc) ? "network" : "curl";
    out.status = make_error(
      ErrorCode::NETWORK_ERROR, reason + "_error:" + string(curl_easy_strerror(rc)));
  } else if (http_code != 200) {
    out.status = make_error(ErrorCode::NETWORK_ERROR, http_error(http_code, response_body), response_body);
  } else {
    Json::Value doc;
    string parse_error;
    if (!meetscribe_common::parse_json(response_body, doc, parse_error)) {
      out.status = make_error(
        ErrorCode::PROTOCOL_VIOLATION, "invalid_json_response", response_body);
    } else {
      out.language = language;
      out.status = parse_transcript_document(doc, ErrorCode::PROTOCOL_VIOLATION, out);
    }
  }

  curl_mime_free(mime);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return out;
}

bool HostedBatchTranscription::health_check()
{
  if (config_.api_key.empty()) {
    return false;
  }
  long http_code = 0;
  string body;
  string error;
  const bool ok = meetscribe_common::perform_get(
    config_.base_url + "/models", {"Authorization: Bearer " + config_.api_key},
    10L, http_code, body, error);
  return ok && http_code == 200;
}

}  // namespace meetscribe
