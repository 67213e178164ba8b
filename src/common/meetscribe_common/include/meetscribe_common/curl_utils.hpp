#pragma once

#include <curl/curl.h>

#include <cstddef>
#include <string>
#include <vector>

namespace meetscribe_common
{

/// Appends received bytes to the std::string passed as userp
inline size_t curl_write_callback(void * contents, size_t size, size_t nmemb, void * userp)
{
  const size_t total = size * nmemb;
  auto * buffer = static_cast<std::string *>(userp);
  buffer->append(static_cast<const char *>(contents), total);
  return total;
}

/// True for curl codes caused by DNS, connect, timeout or transport failures
inline bool is_network_error_code(int curl_code)
{
  return curl_code == CURLE_COULDNT_RESOLVE_HOST ||
    curl_code == CURLE_COULDNT_CONNECT ||
    curl_code == CURLE_OPERATION_TIMEDOUT ||
    curl_code == CURLE_GOT_NOTHING ||
    curl_code == CURLE_SEND_ERROR ||
    curl_code == CURLE_RECV_ERROR ||
    curl_code == CURLE_SSL_CONNECT_ERROR;
}

/// curl_global_init/cleanup bound to a static instance (one per process)
class CurlGlobalGuard
{
public:
  CurlGlobalGuard()
  {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }

  ~CurlGlobalGuard()
  {
    curl_global_cleanup();
  }

  CurlGlobalGuard(const CurlGlobalGuard &) = delete;
  CurlGlobalGuard & operator=(const CurlGlobalGuard &) = delete;
};

inline struct curl_slist * build_header_list(const std::vector<std::string> & header_lines)
{
  struct curl_slist * headers = nullptr;
  for (const auto & h : header_lines) {
    headers = curl_slist_append(headers, h.c_str());
  }
  return headers;
}

/// Plain HTTP GET. Returns false on curl-level errors with out_error set;
/// HTTP status codes are left to the caller.
inline bool perform_get(
  const std::string & url,
  const std::vector<std::string> & header_lines,
  long timeout_sec,
  long & out_http_code,
  std::string & out_body,
  std::string & out_error)
{
  CURL * curl = curl_easy_init();
  if (!curl) {
    out_error = "curl_init_failed";
    return false;
  }

  struct curl_slist * headers = build_header_list(header_lines);

  out_body.clear();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out_body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out_http_code);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (rc != CURLE_OK) {
    out_error = std::string("curl_error:") + curl_easy_strerror(rc);
    return false;
  }
  return true;
}

}  // namespace meetscribe_common
