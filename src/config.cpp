#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Scalars are typed by content: booleans, integers and floating point numbers
 * are recognised, everything else stays a string.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::logic_error &) {
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::logic_error &) {
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/// Translate a TOML node to a JSON representation.
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files expose the same flat keys as flat ones.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    if (name == "tokenizer") {
      // The section shares its name with the policy key.
      normalized.erase(std::string{name});
    }
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"core", "logging", "network", "github",
                                   "model", "budgets", "tokenizer", "storage"}) {
    merge_section(section);
  }
  return normalized;
}

std::vector<std::string> string_list(const nlohmann::json &value) {
  if (value.is_string()) {
    return {value.get<std::string>()};
  }
  return value.get<std::vector<std::string>>();
}

std::pair<std::string, std::string> split_category(const std::string &raw) {
  auto pos = raw.find('=');
  if (pos == std::string::npos) {
    return {raw, "debug"};
  }
  return {raw.substr(0, pos), raw.substr(pos + 1)};
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  if (j.is_null()) {
    return;
  }
  if (!j.is_object()) {
    throw ConfigurationError("Configuration root must be an object");
  }
  nlohmann::json cfg = normalize_config_sections(j);
  try {
    if (cfg.contains("verbose")) {
      set_verbose(cfg["verbose"].get<bool>());
    }
    if (cfg.contains("workers")) {
      set_workers(cfg["workers"].get<int>());
    }
    if (cfg.contains("http_timeout")) {
      set_http_timeout(cfg["http_timeout"].get<int>());
    }
    if (cfg.contains("http_retries")) {
      set_http_retries(cfg["http_retries"].get<int>());
    }
    if (cfg.contains("http_proxy")) {
      set_http_proxy(cfg["http_proxy"].get<std::string>());
    }
    if (cfg.contains("https_proxy")) {
      set_https_proxy(cfg["https_proxy"].get<std::string>());
    }
    if (cfg.contains("github_api_base")) {
      set_github_api_base(cfg["github_api_base"].get<std::string>());
    }
    if (cfg.contains("github_delay_ms")) {
      set_github_delay_ms(cfg["github_delay_ms"].get<int>());
    }
    if (cfg.contains("github_tokens")) {
      set_github_tokens(string_list(cfg["github_tokens"]));
    }
    if (cfg.contains("github_token_files")) {
      set_github_token_files(string_list(cfg["github_token_files"]));
    }
    if (cfg.contains("model_api_base")) {
      set_model_api_base(cfg["model_api_base"].get<std::string>());
    }
    if (cfg.contains("model_name")) {
      set_model_name(cfg["model_name"].get<std::string>());
    }
    if (cfg.contains("model_temperature")) {
      set_model_temperature(cfg["model_temperature"].get<double>());
    }
    if (cfg.contains("model_api_key")) {
      set_model_api_key(cfg["model_api_key"].get<std::string>());
    }
    if (cfg.contains("model_api_key_env")) {
      set_model_api_key_env(cfg["model_api_key_env"].get<std::string>());
    }
    if (cfg.contains("model_api_key_file")) {
      set_model_api_key_file(cfg["model_api_key_file"].get<std::string>());
    }
    if (cfg.contains("model_retries")) {
      set_model_retries(cfg["model_retries"].get<int>());
    }
    if (cfg.contains("primary_budget")) {
      set_primary_budget(cfg["primary_budget"].get<long long>());
    }
    if (cfg.contains("long_pr_threshold")) {
      set_long_pr_threshold(cfg["long_pr_threshold"].get<long long>());
    }
    if (cfg.contains("batch_budget")) {
      set_batch_budget(cfg["batch_budget"].get<long long>());
    }
    if (cfg.contains("chunk_budget")) {
      set_chunk_budget(cfg["chunk_budget"].get<long long>());
    }
    if (cfg.contains("tokenizer")) {
      set_tokenizer(cfg["tokenizer"].get<std::string>());
    }
    if (cfg.contains("tokenizer_vocabulary")) {
      set_tokenizer_vocabulary(cfg["tokenizer_vocabulary"].get<std::string>());
    }
    if (cfg.contains("task_db")) {
      set_task_db(cfg["task_db"].get<std::string>());
    }
    if (cfg.contains("log_level")) {
      set_log_level(cfg["log_level"].get<std::string>());
    }
    if (cfg.contains("log_pattern")) {
      set_log_pattern(cfg["log_pattern"].get<std::string>());
    }
    if (cfg.contains("log_file")) {
      set_log_file(cfg["log_file"].get<std::string>());
    }
    if (cfg.contains("log_rotate")) {
      set_log_rotate(cfg["log_rotate"].get<int>());
    }
    if (cfg.contains("log_categories")) {
      std::unordered_map<std::string, std::string> categories;
      const auto &value = cfg["log_categories"];
      if (value.is_object()) {
        for (const auto &[key, v] : value.items()) {
          if (v.is_string()) {
            categories[key] = v.get<std::string>();
          } else if (v.is_null()) {
            categories[key] = "debug";
          } else {
            config_log()->warn("Unsupported value for log category '{}'; "
                               "expected string or null",
                               key);
          }
        }
      } else {
        for (const auto &raw : string_list(value)) {
          auto [name, level] = split_category(raw);
          if (!name.empty()) {
            categories[name] = level.empty() ? "debug" : level;
          }
        }
      }
      set_log_categories(std::move(categories));
    }
  } catch (const nlohmann::json::exception &e) {
    throw ConfigurationError(std::string("Invalid configuration value: ") +
                             e.what());
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    throw ConfigurationError("Unknown config file extension: " + path);
  }
  std::string ext = path.substr(pos + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw ConfigurationError("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw ConfigurationError("Unsupported config format: " + ext);
    }
  } catch (const ConfigurationError &) {
    throw;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw ConfigurationError("Failed to load config " + path + ": " +
                             e.what());
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace apr
