/**
 * @file http_client.cpp
 * @brief CURL-backed HTTP transport and retry wrapper.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <spdlog/spdlog.h>
#include <sstream>
#include <thread>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

/**
 * Create a human readable error message for a CURL request.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb,
                      void *userp) {
  size_t total = size * nmemb;
  auto *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  hdrs->push_back(line);
  return total;
}

} // namespace

CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string http_proxy,
                               std::string https_proxy)
    : timeout_ms_(timeout_ms), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)) {}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    if (!https_proxy_.empty()) {
      proxy = &https_proxy_;
    } else if (!http_proxy_.empty()) {
      proxy = &http_proxy_;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0 && !http_proxy_.empty()) {
    proxy = &http_proxy_;
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

void CurlHttpClient::prepare(CURL *curl, const std::string &url,
                             std::string &response, char *errbuf) {
  curl_easy_reset(curl);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
}

HttpResponse
CurlHttpClient::get_with_headers(const std::string &url,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  std::string response;
  std::vector<std::string> resp_headers;
  char errbuf[CURL_ERROR_SIZE];
  prepare(curl, url, response, errbuf);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp_headers);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: autopullreview");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error("GET", url, res, errbuf);
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    if (http_code == 403 || http_code == 429) {
      // Let caller handle rate limiting
      return {response, resp_headers, http_code};
    }
    http_log()->error("curl GET {} failed with HTTP code {}", url, http_code);
    throw HttpStatusError(static_cast<int>(http_code),
                          "curl GET failed with HTTP code " +
                              std::to_string(http_code));
  }
  return {response, resp_headers, http_code};
}

std::string CurlHttpClient::post(const std::string &url,
                                 const std::string &data,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  std::string response;
  char errbuf[CURL_ERROR_SIZE];
  prepare(curl, url, response, errbuf);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(data.size()));
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: autopullreview");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error("POST", url, res, errbuf);
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    http_log()->error("curl POST {} failed with HTTP code {}", url, http_code);
    std::string msg =
        "curl POST failed with HTTP code " + std::to_string(http_code);
    if (!response.empty()) {
      msg += ": " + response.substr(0, 512);
    }
    throw HttpStatusError(static_cast<int>(http_code), msg);
  }
  return response;
}

bool is_transient_error(const std::exception &e) {
  if (dynamic_cast<const TransientNetworkError *>(&e)) {
    return true;
  }
  if (auto http_err = dynamic_cast<const HttpStatusError *>(&e)) {
    return http_err->status >= 500 && http_err->status < 600;
  }
  return false;
}

std::chrono::milliseconds retry_delay(int backoff_ms, int attempt) {
  constexpr int kMaxDoublings = 10;
  int exponent = std::min(std::max(attempt, 0), kMaxDoublings);
  return std::chrono::milliseconds(static_cast<long long>(backoff_ms)
                                   << exponent);
}

RetryHttpClient::RetryHttpClient(std::unique_ptr<HttpClient> inner,
                                 int max_retries, int backoff_ms)
    : inner_(std::move(inner)), max_retries_(max_retries),
      backoff_ms_(backoff_ms) {}

template <typename F> auto RetryHttpClient::request(F f) -> decltype(f()) {
  int attempt = 0;
  while (true) {
    try {
      return f();
    } catch (const std::exception &e) {
      if (attempt >= max_retries_ || !is_transient_error(e))
        throw;
      auto delay = retry_delay(backoff_ms_, attempt);
      http_log()->warn("Transient failure ({}), retrying in {} ms", e.what(),
                       delay.count());
      std::this_thread::sleep_for(delay);
      ++attempt;
    }
  }
}

HttpResponse
RetryHttpClient::get_with_headers(const std::string &url,
                                  const std::vector<std::string> &headers) {
  return request([&] { return inner_->get_with_headers(url, headers); });
}

std::string RetryHttpClient::post(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  return request([&] { return inner_->post(url, data, headers); });
}

} // namespace apr
