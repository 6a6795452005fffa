#ifndef AUTOPULLREVIEW_HTTP_CLIENT_HPP
#define AUTOPULLREVIEW_HTTP_CLIENT_HPP

#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <string>
#include <vector>

namespace apr {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request returning both body and response headers.
   *
   * Responses with status 403 or 429 are returned to the caller so it can
   * apply rate limit handling; other non-2xx codes raise HttpStatusError.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws TransientNetworkError On transport failures.
   * @throws HttpStatusError On unexpected HTTP status codes.
   */
  virtual HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP GET request.
   *
   * @return Response body content as a UTF-8 string.
   */
  virtual std::string get(const std::string &url,
                          const std::vector<std::string> &headers) {
    return get_with_headers(url, headers).body;
  }

  /**
   * Perform a HTTP POST request.
   *
   * @param url Absolute request URL.
   * @param data Request body payload encoded as UTF-8.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body content as a UTF-8 string.
   * @throws TransientNetworkError On transport failures.
   * @throws HttpStatusError On non-2xx HTTP status codes.
   */
  virtual std::string post(const std::string &url, const std::string &data,
                           const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  /// Borrowed pointer to the managed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * @note This class is not thread-safe; use one instance per thread or provide
 *       external synchronization.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Request timeout in milliseconds.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string http_proxy = {},
                          std::string https_proxy = {});

  /// @copydoc HttpClient::get_with_headers()
  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::post()
  std::string post(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;

  long timeout_ms() const { return timeout_ms_; }
  const std::string &http_proxy() const { return http_proxy_; }
  const std::string &https_proxy() const { return https_proxy_; }

private:
  void prepare(CURL *curl, const std::string &url, std::string &response,
               char *errbuf);
  void apply_proxy(CURL *curl, const std::string &url);
  CurlHandle curl_;
  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
};

/**
 * HTTP client wrapper that retries transient failures with exponential
 * backoff.
 *
 * Transport errors and 5xx status codes are retried; everything else is
 * rethrown immediately.
 */
class RetryHttpClient : public HttpClient {
public:
  /**
   * @param inner Underlying client performing real requests.
   * @param max_retries Maximum retries for transient failures.
   * @param backoff_ms Base delay in milliseconds for exponential backoff.
   */
  RetryHttpClient(std::unique_ptr<HttpClient> inner, int max_retries,
                  int backoff_ms = 100);

  /// @copydoc HttpClient::get_with_headers()
  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::post()
  std::string post(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;

  int max_retries() const { return max_retries_; }

private:
  template <typename F> auto request(F f) -> decltype(f());

  std::unique_ptr<HttpClient> inner_;
  int max_retries_;
  int backoff_ms_;
};

/**
 * Backoff before retry number @p attempt (zero based). The exponent stops
 * growing after ten doublings.
 */
std::chrono::milliseconds retry_delay(int backoff_ms, int attempt);

/// True when @p e represents a failure worth retrying.
bool is_transient_error(const std::exception &e);

} // namespace apr

#endif // AUTOPULLREVIEW_HTTP_CLIENT_HPP
