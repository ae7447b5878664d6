#include "mender/patch.hpp"

#include <curl/curl.h>

#include <mutex>

namespace mender {

namespace {

std::once_flag g_curl_init;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

// Owns one easy handle and its header list for the duration of a request.
struct EasyHandle {
  CURL* curl{curl_easy_init()};
  curl_slist* headers{nullptr};
  ~EasyHandle() {
    if (headers) curl_slist_free_all(headers);
    if (curl) curl_easy_cleanup(curl);
  }
};

HttpResponse perform(const std::string& url, const std::string* body, std::uint64_t timeout_ms) {
  HttpResponse resp;
  EasyHandle h;
  if (!h.curl) {
    resp.error = ErrorCode::advisory_unreachable;
    resp.error_message = "curl_easy_init failed";
    return resp;
  }
  const long total = static_cast<long>(timeout_ms);
  const long connect = total < 5000 ? total : 5000;
  curl_easy_setopt(h.curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h.curl, CURLOPT_TIMEOUT_MS, total);
  curl_easy_setopt(h.curl, CURLOPT_CONNECTTIMEOUT_MS, connect);
  curl_easy_setopt(h.curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &resp.body);
  if (body) {
    h.headers = curl_slist_append(h.headers, "Content-Type: application/json");
    curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);
    curl_easy_setopt(h.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(h.curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(h.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  const CURLcode rc = curl_easy_perform(h.curl);
  if (rc != CURLE_OK) {
    resp.error = rc == CURLE_OPERATION_TIMEDOUT ? ErrorCode::advisory_timeout : ErrorCode::advisory_unreachable;
    resp.error_message = std::string("curl error: ") + curl_easy_strerror(rc);
    return resp;
  }
  curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &resp.status);
  return resp;
}

}  // namespace

CurlTransport::CurlTransport() {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlTransport::post_json(const std::string& url, const std::string& body, std::uint64_t timeout_ms) {
  return perform(url, &body, timeout_ms);
}

HttpResponse CurlTransport::get(const std::string& url, std::uint64_t timeout_ms) {
  return perform(url, nullptr, timeout_ms);
}

}  // namespace mender
