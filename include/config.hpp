#ifndef AUTOPULLREVIEW_CONFIG_HPP
#define AUTOPULLREVIEW_CONFIG_HPP

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace apr {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Number of concurrent review workers.
  int workers() const { return workers_; }

  /// Set worker thread count (minimum 1).
  void set_workers(int w) { workers_ = w < 1 ? 1 : w; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// Number of HTTP retry attempts for GitHub requests.
  int http_retries() const { return http_retries_; }

  /// Set number of HTTP retry attempts.
  void set_http_retries(int r) { http_retries_ = r < 0 ? 0 : r; }

  const std::string &http_proxy() const { return http_proxy_; }
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  const std::string &https_proxy() const { return https_proxy_; }
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Base URL for the GitHub API.
  const std::string &github_api_base() const { return github_api_base_; }
  void set_github_api_base(const std::string &base) { github_api_base_ = base; }

  /// Minimum spacing between GitHub requests in milliseconds.
  int github_delay_ms() const { return github_delay_ms_; }
  void set_github_delay_ms(int ms) { github_delay_ms_ = ms < 0 ? 0 : ms; }

  /// GitHub personal access tokens listed inline.
  const std::vector<std::string> &github_tokens() const {
    return github_tokens_;
  }
  void set_github_tokens(std::vector<std::string> tokens) {
    github_tokens_ = std::move(tokens);
  }

  /// Files holding additional GitHub tokens.
  const std::vector<std::string> &github_token_files() const {
    return github_token_files_;
  }
  void set_github_token_files(std::vector<std::string> files) {
    github_token_files_ = std::move(files);
  }

  /// Base URL of the chat completion API.
  const std::string &model_api_base() const { return model_api_base_; }
  void set_model_api_base(const std::string &base) { model_api_base_ = base; }

  const std::string &model_name() const { return model_name_; }
  void set_model_name(const std::string &name) { model_name_ = name; }

  double model_temperature() const { return model_temperature_; }
  void set_model_temperature(double t) { model_temperature_ = t; }

  const std::string &model_api_key() const { return model_api_key_; }
  void set_model_api_key(const std::string &key) { model_api_key_ = key; }

  /// Environment variable consulted for the model API key.
  const std::string &model_api_key_env() const { return model_api_key_env_; }
  void set_model_api_key_env(const std::string &name) {
    model_api_key_env_ = name;
  }

  const std::string &model_api_key_file() const { return model_api_key_file_; }
  void set_model_api_key_file(const std::string &path) {
    model_api_key_file_ = path;
  }

  /// Automatic retries of transient model call failures.
  int model_retries() const { return model_retries_; }
  void set_model_retries(int r) { model_retries_ = r < 0 ? 0 : r; }

  long long primary_budget() const { return primary_budget_; }
  void set_primary_budget(long long v) { primary_budget_ = v; }

  long long long_pr_threshold() const { return long_pr_threshold_; }
  void set_long_pr_threshold(long long v) { long_pr_threshold_ = v; }

  long long batch_budget() const { return batch_budget_; }
  void set_batch_budget(long long v) { batch_budget_ = v; }

  long long chunk_budget() const { return chunk_budget_; }
  void set_chunk_budget(long long v) { chunk_budget_ = v; }

  /// Token counting policy ("bpe" or "approximate").
  const std::string &tokenizer() const { return tokenizer_; }
  void set_tokenizer(const std::string &name) { tokenizer_ = name; }

  /// Path of the BPE rank file.
  const std::string &tokenizer_vocabulary() const {
    return tokenizer_vocabulary_;
  }
  void set_tokenizer_vocabulary(const std::string &path) {
    tokenizer_vocabulary_ = path;
  }

  /// SQLite database holding review tasks.
  const std::string &task_db() const { return task_db_; }
  void set_task_db(const std::string &path) { task_db_ = path; }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logger pattern string.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logger pattern string.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep.
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to keep.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /**
   * Load configuration from a file on disk.
   *
   * @throws ConfigurationError When the file cannot be opened or parsed, or
   *         the extension is unsupported.
   */
  static Config from_file(const std::string &path);

  /// Create configuration from a JSON document.
  static Config from_json(const nlohmann::json &j);

  /**
   * Apply values from a JSON document. Sections `core`, `logging`,
   * `network`, `github`, `model`, `budgets`, `tokenizer` and `storage` are
   * flattened into the root before lookup.
   *
   * @throws ConfigurationError When a value has the wrong type.
   */
  void load_json(const nlohmann::json &j);

private:
  bool verbose_ = false;
  int workers_ = 2;
  int http_timeout_ = 30;
  int http_retries_ = 3;
  std::string http_proxy_;
  std::string https_proxy_;
  std::string github_api_base_ = "https://api.github.com";
  int github_delay_ms_ = 0;
  std::vector<std::string> github_tokens_;
  std::vector<std::string> github_token_files_;
  std::string model_api_base_ = "https://api.openai.com/v1";
  std::string model_name_ = "gpt-4";
  double model_temperature_ = 0.0;
  std::string model_api_key_;
  std::string model_api_key_env_ = "OPENAI_API_KEY";
  std::string model_api_key_file_;
  int model_retries_ = 0;
  long long primary_budget_ = 4000;
  long long long_pr_threshold_ = 3000;
  long long batch_budget_ = 2000;
  long long chunk_budget_ = 1500;
  std::string tokenizer_ = "bpe";
  std::string tokenizer_vocabulary_ = "cl100k_base.tiktoken";
  std::string task_db_ = "autopullreview.db";
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace apr

#endif // AUTOPULLREVIEW_CONFIG_HPP
