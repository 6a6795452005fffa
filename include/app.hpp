/**
 * @file app.hpp
 * @brief Application front end for autopullreview.
 *
 * Declares the App class, which parses the command line, merges it with the
 * configuration file and initializes logging before any review runs.
 */

#ifndef AUTOPULLREVIEW_APP_HPP
#define AUTOPULLREVIEW_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "model_client.hpp"
#include "review_workflow.hpp"
#include "token_counter.hpp"

namespace apr {

/**
 * Orchestrates CLI parsing, configuration loading and logger setup.
 *
 * After a successful run() the effective settings are available from
 * config(), with command line values already applied over file values.
 */
class App {
public:
  /**
   * Run the start-up sequence with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, 2 when the command line or configuration is
   *         invalid.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Effective configuration after command line overrides.
  const Config &config() const { return config_; }

  /// True when the process should terminate after run() returns.
  bool should_exit() const { return should_exit_; }

  /**
   * Budgets derived from the effective configuration.
   *
   * @throws ConfigurationError When a budget is not positive.
   */
  ReviewBudgets budgets() const;

  /// HTTP timeout of the effective configuration in milliseconds.
  long http_timeout_ms() const;

  /// Tokenizer selection derived from the effective configuration.
  TokenizerSettings tokenizer_settings() const;

  /**
   * Model client settings with the API key resolved from flag, file or
   * environment.
   *
   * @throws ConfigurationError When the key file cannot be read.
   */
  ModelSettings model_settings() const;

private:
  void apply_overrides();

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace apr

#endif // AUTOPULLREVIEW_APP_HPP
