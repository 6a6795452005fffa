/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for autopullreview.
 */

#ifndef AUTOPULLREVIEW_CLI_HPP
#define AUTOPULLREVIEW_CLI_HPP

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace apr {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Optional members are only set when the flag was given, so configuration
 * file values apply otherwise.
 */
struct CliOptions {
  bool verbose = false;    ///< Enables verbose output
  std::string config_file; ///< Optional path to configuration file

  std::vector<std::string> pull_requests; ///< PR URLs or owner/repo#N
  std::string diff_file;   ///< Local JSON diff listing to review
  std::string output_file; ///< Write the review here as well
  std::string status_task; ///< Print status of this task and exit
  std::string result_task; ///< Print result of this task and exit

  std::optional<std::string> log_level;
  std::optional<std::string> log_pattern;
  std::optional<std::string> log_file;
  std::optional<int> log_rotate;
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI

  std::optional<long long> primary_budget;
  std::optional<long long> long_pr_threshold;
  std::optional<long long> batch_budget;
  std::optional<long long> chunk_budget;

  std::optional<std::string> tokenizer;
  std::optional<std::string> tokenizer_vocabulary;

  std::optional<std::string> model_name;
  std::optional<std::string> model_api_base;
  std::optional<double> model_temperature;
  std::optional<std::string> model_api_key;
  std::optional<std::string> model_api_key_file;
  std::optional<int> model_retries;

  std::vector<std::string> github_tokens;      ///< Personal access tokens
  std::vector<std::string> github_token_files; ///< Files containing tokens
  std::optional<std::string> github_api_base;
  std::optional<int> github_delay_ms; ///< Minimum spacing between requests

  std::optional<int> http_timeout;
  std::optional<int> http_retries;
  std::optional<std::string> http_proxy;
  std::optional<std::string> https_proxy;

  std::optional<int> workers;
  std::optional<std::string> task_db;
};

/**
 * Parse command line arguments.
 *
 * @throws CliParseExit For `--help`, `--version` (code 0) and parse errors
 *         (code 2).
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace apr

#endif // AUTOPULLREVIEW_CLI_HPP
