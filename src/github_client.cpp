/**
 * @file github_client.cpp
 * @brief GitHub REST diff source.
 */

#include "github_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cctype>
#include <spdlog/spdlog.h>
#include <sstream>
#include <thread>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

/// Extract the `rel="next"` target from `Link` response headers.
std::string next_page_url(const std::vector<std::string> &headers) {
  std::string next_url;
  for (const auto &h : headers) {
    if (h.size() < 5) {
      continue;
    }
    std::string name = h.substr(0, 5);
    for (auto &c : name) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (name != "link:") {
      continue;
    }
    std::stringstream ss(h.substr(5));
    std::string part;
    while (std::getline(ss, part, ',')) {
      if (part.find("rel=\"next\"") != std::string::npos) {
        auto start = part.find('<');
        auto end = part.find('>', start);
        if (start != std::string::npos && end != std::string::npos) {
          next_url = part.substr(start + 1, end - start - 1);
        }
      }
    }
  }
  return next_url;
}

/// Parse the numeric value of header @p name (case-sensitive prefix match).
long header_value(const std::vector<std::string> &headers,
                  const std::string &name) {
  for (const auto &h : headers) {
    if (h.rfind(name, 0) == 0) {
      try {
        return std::stol(h.substr(name.size()));
      } catch (const std::logic_error &) {
        return -1;
      }
    }
  }
  return -1;
}

} // namespace

GitHubClient::GitHubClient(std::vector<std::string> tokens,
                           std::unique_ptr<HttpClient> http, int delay_ms,
                           long timeout_ms, int max_retries,
                           std::string api_base)
    : tokens_(std::move(tokens)),
      http_(std::make_unique<RetryHttpClient>(
          http ? std::move(http) : std::make_unique<CurlHttpClient>(timeout_ms),
          max_retries, 100)),
      api_base_(std::move(api_base)), delay_ms_(delay_ms) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
  ensure_default_logger();
}

void GitHubClient::set_max_rate_limit_wait(std::chrono::seconds wait) {
  std::scoped_lock lock(mutex_);
  max_rate_limit_wait_ = wait;
}

std::vector<std::string> GitHubClient::request_headers() const {
  std::vector<std::string> headers;
  if (!tokens_.empty()) {
    headers.push_back("Authorization: token " + tokens_[token_index_]);
  }
  headers.push_back("Accept: application/vnd.github+json");
  return headers;
}

std::vector<DiffEntry> GitHubClient::fetch(const PullRequestRef &ref) {
  std::scoped_lock lock(mutex_);
  std::string url = api_base_ + "/repos/" + ref.owner + "/" + ref.repo +
                    "/pulls/" + std::to_string(ref.number) +
                    "/files?per_page=100";
  github_client_log()->info("Fetching file listing for {}", to_string(ref));
  std::vector<DiffEntry> entries;
  const size_t max_rate_limited = tokens_.size() + 2;
  size_t rate_limited = 0;
  while (true) {
    enforce_delay();
    HttpResponse res;
    try {
      res = http_->get_with_headers(url, request_headers());
    } catch (const std::exception &e) {
      github_client_log()->error("HTTP GET {} failed: {}", url, e.what());
      throw ExternalCallError("Failed to fetch pull request files for " +
                              to_string(ref) + ": " + e.what());
    }
    if (handle_rate_limit(res)) {
      if (++rate_limited > max_rate_limited) {
        throw ExternalCallError("GitHub rate limit exhausted while fetching " +
                                to_string(ref));
      }
      continue;
    }
    if (res.status_code < 200 || res.status_code >= 300) {
      throw ExternalCallError("GitHub returned HTTP " +
                              std::to_string(res.status_code) + " for " +
                              to_string(ref));
    }
    try {
      auto page = parse_diff_entries(nlohmann::json::parse(res.body));
      entries.insert(entries.end(), std::make_move_iterator(page.begin()),
                     std::make_move_iterator(page.end()));
    } catch (const nlohmann::json::exception &e) {
      throw ExternalCallError("Failed to parse pull request files: " +
                              std::string(e.what()));
    } catch (const InputError &e) {
      throw ExternalCallError("Unexpected pull request files payload: " +
                              std::string(e.what()));
    }
    std::string next_url = next_page_url(res.headers);
    if (next_url.empty())
      break;
    url = next_url;
  }
  github_client_log()->info("{} lists {} files", to_string(ref),
                            entries.size());
  return entries;
}

/**
 * Inspect response headers for rate limit signals and pause if necessary.
 *
 * @return true when the request should be repeated.
 */
bool GitHubClient::handle_rate_limit(const HttpResponse &resp) {
  if (resp.status_code != 403 && resp.status_code != 429) {
    return false;
  }
  long remaining = header_value(resp.headers, "X-RateLimit-Remaining:");
  long reset = header_value(resp.headers, "X-RateLimit-Reset:");
  long retry_after = header_value(resp.headers, "Retry-After:");
  if (resp.status_code == 403 && remaining != 0 && retry_after < 0) {
    // Plain permission failure.
    return false;
  }
  if (tokens_.size() > 1) {
    token_index_ = (token_index_ + 1) % tokens_.size();
    github_client_log()->warn(
        "Rate limit hit, switching to next token (index {})", token_index_);
    return true;
  }
  std::chrono::seconds wait{0};
  if (retry_after > 0) {
    wait = std::chrono::seconds(retry_after);
  } else if (reset > 0) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch());
    if (reset > now.count()) {
      wait = std::chrono::seconds(reset - now.count());
    }
  }
  if (wait > max_rate_limit_wait_) {
    throw ExternalCallError("GitHub rate limit resets in " +
                            std::to_string(wait.count()) +
                            "s, longer than the allowed wait");
  }
  github_client_log()->warn("Rate limit hit, waiting {}s", wait.count());
  if (wait.count() > 0) {
    std::this_thread::sleep_for(wait);
  }
  last_request_ = std::chrono::steady_clock::now();
  return true;
}

/**
 * Ensure the minimum delay between successive HTTP requests is respected.
 */
void GitHubClient::enforce_delay() {
  if (delay_ms_ <= 0)
    return;
  auto now = std::chrono::steady_clock::now();
  auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(now - last_request_)
          .count();
  if (elapsed < delay_ms_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_ - elapsed));
  }
  last_request_ = std::chrono::steady_clock::now();
}

} // namespace apr
