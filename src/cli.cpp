#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace apr {

namespace {

std::string log_category_help_text() {
  static const std::array<std::string_view, 13> categories = {
      "app",     "cli",   "config",         "github.client",   "http",
      "logging", "main",  "model",          "queue",           "review.service",
      "review.workflow",  "tasks",          "tokenizer"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "review.workflow=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"autopullreview - budgeted language model pull request review"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_option("pull_requests", options.pull_requests,
                 "Pull requests to review (URL or OWNER/REPO#N)")
      ->type_name("PR");
  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "autopullreview " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option("-o,--output", options.output_file,
                 "Also write the review to FILE")
      ->type_name("FILE")
      ->group("General");
  auto *diff_opt =
      app.add_option("-d,--diff-file", options.diff_file,
                     "Review a local JSON file listing instead of fetching")
          ->type_name("FILE")
          ->group("General");
  auto *status_opt =
      app.add_option("--status", options.status_task,
                     "Print the status of a stored task and exit")
          ->type_name("ID")
          ->group("Tasks");
  auto *result_opt =
      app.add_option("--result", options.result_task,
                     "Print the result of a stored task and exit")
          ->type_name("ID")
          ->group("Tasks");
  status_opt->excludes(result_opt);
  diff_opt->excludes(status_opt);
  diff_opt->excludes(result_opt);
  app.add_option("--task-db", options.task_db, "SQLite task database path")
      ->type_name("FILE")
      ->group("Tasks");
  app.add_option("-w,--workers", options.workers,
                 "Number of pull requests reviewed concurrently")
      ->type_name("N")
      ->check(CLI::PositiveNumber)
      ->group("Tasks");

  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("--log-pattern", options.log_pattern,
                 "spdlog pattern for log lines")
      ->type_name("PATTERN")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  app.add_option("--log-rotate", options.log_rotate,
                 "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Logging");

  app.add_option("--primary-budget", options.primary_budget,
                 "Token ceiling of the main review group")
      ->type_name("TOKENS")
      ->group("Budgets");
  app.add_option("--long-pr-threshold", options.long_pr_threshold,
                 "Total tokens above which a change set is reviewed in stages")
      ->type_name("TOKENS")
      ->group("Budgets");
  app.add_option("--batch-budget", options.batch_budget,
                 "Token ceiling of each batch review call")
      ->type_name("TOKENS")
      ->group("Budgets");
  app.add_option("--chunk-budget", options.chunk_budget,
                 "Token ceiling of each overflow summary call")
      ->type_name("TOKENS")
      ->group("Budgets");

  app.add_option("--tokenizer", options.tokenizer,
                 "Token counting policy (bpe, approximate)")
      ->type_name("NAME")
      ->check(CLI::IsMember({"bpe", "approximate"}))
      ->group("Tokenizer");
  app.add_option("--tokenizer-vocabulary", options.tokenizer_vocabulary,
                 "BPE rank file in tiktoken format")
      ->type_name("FILE")
      ->group("Tokenizer");

  app.add_option("--model", options.model_name, "Model name")
      ->type_name("NAME")
      ->group("Model");
  app.add_option("--model-api-base", options.model_api_base,
                 "Base URL of the chat completion API")
      ->type_name("URL")
      ->group("Model");
  app.add_option("--model-temperature", options.model_temperature,
                 "Sampling temperature")
      ->type_name("T")
      ->group("Model");
  app.add_option("--model-api-key", options.model_api_key, "Model API key")
      ->type_name("KEY")
      ->group("Model");
  app.add_option("--model-api-key-file", options.model_api_key_file,
                 "File containing the model API key")
      ->type_name("FILE")
      ->group("Model");
  app.add_option("--model-retries", options.model_retries,
                 "Automatic retries of transient model call failures")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Model");

  app.add_option("-k,--github-token", options.github_tokens,
                 "GitHub personal access token (repeatable)")
      ->type_name("TOKEN")
      ->allow_extra_args(false)
      ->group("GitHub");
  app.add_option("-f,--github-token-file", options.github_token_files,
                 "File containing GitHub tokens (JSON, YAML, TOML or text)")
      ->type_name("FILE")
      ->allow_extra_args(false)
      ->group("GitHub");
  app.add_option("--github-api-base", options.github_api_base,
                 "Base URL for the GitHub API")
      ->type_name("URL")
      ->group("GitHub");
  app.add_option("--github-delay", options.github_delay_ms,
                 "Minimum delay between GitHub requests in milliseconds")
      ->type_name("MS")
      ->check(CLI::NonNegativeNumber)
      ->group("GitHub");

  app.add_option("--http-timeout", options.http_timeout,
                 "HTTP timeout in seconds")
      ->type_name("SECONDS")
      ->check(CLI::PositiveNumber)
      ->group("Network");
  app.add_option("--http-retries", options.http_retries,
                 "Retries for transient GitHub request failures")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Network");
  app.add_option("--http-proxy", options.http_proxy,
                 "Proxy URL for HTTP requests")
      ->type_name("URL")
      ->group("Network");
  app.add_option("--https-proxy", options.https_proxy,
                 "Proxy URL for HTTPS requests")
      ->type_name("URL")
      ->group("Network");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code == 0 ? 0 : 2);
  }
  return options;
}

} // namespace apr
