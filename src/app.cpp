#include "app.hpp"
#include "credential_loader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace apr {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::size_t positive_budget(long long value, const char *name) {
  if (value <= 0) {
    throw ConfigurationError(std::string(name) + " must be positive, got " +
                             std::to_string(value));
  }
  return static_cast<std::size_t>(value);
}
} // namespace

/**
 * Execute the start-up flow.
 *
 * Parses the command line, loads the configuration file when one was given,
 * applies command line overrides and initializes the logger together with
 * per-category levels.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
  } catch (const ConfigurationError &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 2;
  }
  apply_overrides();

  std::string level_str = config_.log_level();
  if (options_.verbose && !options_.log_level) {
    level_str = "debug";
  }
  spdlog::level::level_enum lvl = spdlog::level::info;
  try {
    lvl = spdlog::level::from_str(level_str);
  } catch (const spdlog::spdlog_ex &) {
    app_log()->warn("Unknown log level '{}', using info", level_str);
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()));
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, category_level] : config_.log_categories()) {
    try {
      category_levels[category] = spdlog::level::from_str(category_level);
    } catch (const spdlog::spdlog_ex &) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      category_level, category);
    }
  }
  configure_log_categories(category_levels);
  if (config_.verbose()) {
    app_log()->debug("Verbose mode enabled");
  }
  if (!options_.config_file.empty()) {
    app_log()->debug("Loaded configuration from {}", options_.config_file);
  }
  return 0;
}

void App::apply_overrides() {
  const auto &o = options_;
  if (o.verbose) {
    config_.set_verbose(true);
  }
  if (o.log_level) {
    config_.set_log_level(*o.log_level);
  }
  if (o.log_pattern) {
    config_.set_log_pattern(*o.log_pattern);
  }
  if (o.log_file) {
    config_.set_log_file(*o.log_file);
  }
  if (o.log_rotate) {
    config_.set_log_rotate(*o.log_rotate);
  }
  if (!o.log_categories.empty()) {
    auto merged = config_.log_categories();
    for (const auto &[name, level] : o.log_categories) {
      merged[name] = level;
    }
    config_.set_log_categories(std::move(merged));
  }
  if (o.primary_budget) {
    config_.set_primary_budget(*o.primary_budget);
  }
  if (o.long_pr_threshold) {
    config_.set_long_pr_threshold(*o.long_pr_threshold);
  }
  if (o.batch_budget) {
    config_.set_batch_budget(*o.batch_budget);
  }
  if (o.chunk_budget) {
    config_.set_chunk_budget(*o.chunk_budget);
  }
  if (o.tokenizer) {
    config_.set_tokenizer(*o.tokenizer);
  }
  if (o.tokenizer_vocabulary) {
    config_.set_tokenizer_vocabulary(*o.tokenizer_vocabulary);
  }
  if (o.model_name) {
    config_.set_model_name(*o.model_name);
  }
  if (o.model_api_base) {
    config_.set_model_api_base(*o.model_api_base);
  }
  if (o.model_temperature) {
    config_.set_model_temperature(*o.model_temperature);
  }
  if (o.model_api_key) {
    config_.set_model_api_key(*o.model_api_key);
  }
  if (o.model_api_key_file) {
    config_.set_model_api_key_file(*o.model_api_key_file);
  }
  if (o.model_retries) {
    config_.set_model_retries(*o.model_retries);
  }
  if (!o.github_tokens.empty()) {
    config_.set_github_tokens(o.github_tokens);
  }
  if (!o.github_token_files.empty()) {
    config_.set_github_token_files(o.github_token_files);
  }
  if (o.github_api_base) {
    config_.set_github_api_base(*o.github_api_base);
  }
  if (o.github_delay_ms) {
    config_.set_github_delay_ms(*o.github_delay_ms);
  }
  if (o.http_timeout) {
    config_.set_http_timeout(*o.http_timeout);
  }
  if (o.http_retries) {
    config_.set_http_retries(*o.http_retries);
  }
  if (o.http_proxy) {
    config_.set_http_proxy(*o.http_proxy);
  }
  if (o.https_proxy) {
    config_.set_https_proxy(*o.https_proxy);
  }
  if (o.workers) {
    config_.set_workers(*o.workers);
  }
  if (o.task_db) {
    config_.set_task_db(*o.task_db);
  }
}

ReviewBudgets App::budgets() const {
  ReviewBudgets budgets;
  budgets.primary_budget =
      positive_budget(config_.primary_budget(), "primary_budget");
  budgets.long_pr_threshold =
      positive_budget(config_.long_pr_threshold(), "long_pr_threshold");
  budgets.batch_budget = positive_budget(config_.batch_budget(), "batch_budget");
  budgets.chunk_budget = positive_budget(config_.chunk_budget(), "chunk_budget");
  budgets.validate();
  return budgets;
}

TokenizerSettings App::tokenizer_settings() const {
  TokenizerSettings settings;
  settings.mode = config_.tokenizer();
  settings.vocabulary_path = config_.tokenizer_vocabulary();
  return settings;
}

long App::http_timeout_ms() const {
  return static_cast<long>(config_.http_timeout()) * 1000L;
}

ModelSettings App::model_settings() const {
  ModelSettings settings;
  settings.api_base = config_.model_api_base();
  settings.model = config_.model_name();
  settings.temperature = config_.model_temperature();
  settings.api_key =
      resolve_model_api_key(config_.model_api_key(),
                            config_.model_api_key_file(),
                            config_.model_api_key_env());
  settings.retries = config_.model_retries();
  settings.http_proxy = config_.http_proxy();
  settings.https_proxy = config_.https_proxy();
  return settings;
}

} // namespace apr
