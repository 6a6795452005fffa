#ifndef AUTOPULLREVIEW_GITHUB_CLIENT_HPP
#define AUTOPULLREVIEW_GITHUB_CLIENT_HPP

#include "diff_source.hpp"
#include "http_client.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace apr {

/**
 * GitHub REST API diff source.
 *
 * Lists the files of a pull request through
 * `/repos/{owner}/{repo}/pulls/{number}/files`, following `Link` pagination.
 * Tokens are rotated when a rate limit response is received; with a single
 * token the client waits for the advertised reset, up to a bounded time.
 */
class GitHubClient : public DiffSource {
public:
  /**
   * Construct a GitHub API client.
   *
   * @param tokens Personal access tokens used for authenticated requests. An
   *        empty list performs anonymous requests.
   * @param http Optional HTTP client implementation. A default CURL-backed
   *        implementation is constructed when `nullptr` is supplied.
   * @param delay_ms Minimum delay between requests in milliseconds.
   * @param timeout_ms HTTP request timeout for the internally created client.
   * @param max_retries Number of retry attempts for transient failures.
   * @param api_base Base URL for the GitHub API endpoints.
   */
  explicit GitHubClient(std::vector<std::string> tokens,
                        std::unique_ptr<HttpClient> http = nullptr,
                        int delay_ms = 0, long timeout_ms = 30000,
                        int max_retries = 3,
                        std::string api_base = "https://api.github.com");

  /// @copydoc DiffSource::fetch()
  std::vector<DiffEntry> fetch(const PullRequestRef &ref) override;

  /// Longest single wait for a rate limit reset before giving up.
  void set_max_rate_limit_wait(std::chrono::seconds wait);

  const std::string &api_base() const { return api_base_; }

private:
  std::mutex mutex_;
  std::vector<std::string> tokens_;
  size_t token_index_{0};
  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  int delay_ms_;
  std::chrono::seconds max_rate_limit_wait_{60};
  std::chrono::steady_clock::time_point last_request_{};

  std::vector<std::string> request_headers() const;
  void enforce_delay();
  bool handle_rate_limit(const HttpResponse &resp);
};

} // namespace apr

#endif // AUTOPULLREVIEW_GITHUB_CLIENT_HPP
