#include "credential_loader.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <toml++/toml.h>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace apr {

namespace {

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::vector<std::string> load_yaml(const std::string &path) {
  std::vector<std::string> secrets;
  YAML::Node node = YAML::LoadFile(path);
  if (node.IsSequence()) {
    std::transform(node.begin(), node.end(), std::back_inserter(secrets),
                   [](const YAML::Node &n) { return n.as<std::string>(); });
  } else if (node.IsScalar()) {
    secrets.push_back(node.as<std::string>());
  } else if (node.IsMap()) {
    if (node["token"]) {
      secrets.push_back(node["token"].as<std::string>());
    }
    if (node["tokens"]) {
      const YAML::Node tokens_node = node["tokens"];
      if (!tokens_node.IsSequence()) {
        throw ConfigurationError("YAML tokens entry must be a sequence");
      }
      std::transform(tokens_node.begin(), tokens_node.end(),
                     std::back_inserter(secrets),
                     [](const YAML::Node &n) { return n.as<std::string>(); });
    }
  }
  return secrets;
}

std::vector<std::string> load_json(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    throw ConfigurationError("Failed to open credential file " + path);
  }
  std::vector<std::string> secrets;
  nlohmann::json j;
  f >> j;
  if (j.is_array()) {
    std::transform(j.begin(), j.end(), std::back_inserter(secrets),
                   [](const nlohmann::json &item) {
                     return item.get<std::string>();
                   });
  } else if (j.is_object()) {
    if (j.contains("token")) {
      secrets.push_back(j["token"].get<std::string>());
    }
    if (j.contains("tokens")) {
      const auto &array = j["tokens"];
      if (!array.is_array()) {
        throw ConfigurationError("JSON tokens entry must be an array");
      }
      std::transform(array.begin(), array.end(), std::back_inserter(secrets),
                     [](const nlohmann::json &item) {
                       return item.get<std::string>();
                     });
    }
  } else if (j.is_string()) {
    secrets.push_back(j.get<std::string>());
  }
  return secrets;
}

std::vector<std::string> load_toml(const std::string &path) {
  std::vector<std::string> secrets;
  toml::table tbl = toml::parse_file(path);
  if (auto single = tbl["token"].value<std::string>()) {
    secrets.push_back(*single);
  }
  if (auto arr = tbl["tokens"].as_array()) {
    for (const auto &item : *arr) {
      if (auto value = item.value<std::string>()) {
        secrets.push_back(*value);
      } else {
        throw ConfigurationError("TOML tokens array must contain strings");
      }
    }
  }
  return secrets;
}

std::vector<std::string> load_text(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    throw ConfigurationError("Failed to open credential file " + path);
  }
  std::vector<std::string> secrets;
  std::string line;
  while (std::getline(f, line)) {
    line = trim(line);
    if (!line.empty()) {
      secrets.push_back(line);
    }
  }
  return secrets;
}

} // namespace

std::vector<std::string> load_credentials_from_file(const std::string &path) {
  auto slash = path.find_last_of("/\\");
  auto pos = path.find_last_of('.');
  std::string ext;
  if (pos != std::string::npos && (slash == std::string::npos || pos > slash)) {
    ext = path.substr(pos + 1);
  }
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  try {
    if (ext == "yaml" || ext == "yml") {
      return load_yaml(path);
    }
    if (ext == "json") {
      return load_json(path);
    }
    if (ext == "toml" || ext == "tml") {
      return load_toml(path);
    }
    if (ext.empty() || ext == "txt") {
      return load_text(path);
    }
  } catch (const ConfigurationError &) {
    throw;
  } catch (const YAML::Exception &e) {
    throw ConfigurationError("Invalid YAML credential file " + path + ": " +
                             e.what());
  } catch (const toml::parse_error &e) {
    throw ConfigurationError("Invalid TOML credential file " + path + ": " +
                             std::string(e.description()));
  } catch (const nlohmann::json::exception &e) {
    throw ConfigurationError("Invalid JSON credential file " + path + ": " +
                             e.what());
  }
  throw ConfigurationError("Unsupported credential file format: " + path);
}

std::vector<std::string>
resolve_github_tokens(const std::vector<std::string> &explicit_tokens,
                      const std::vector<std::string> &token_files) {
  std::vector<std::string> tokens;
  std::unordered_set<std::string> seen;
  auto add = [&](const std::string &token) {
    std::string t = trim(token);
    if (!t.empty() && seen.insert(t).second) {
      tokens.push_back(t);
    }
  };
  for (const auto &t : explicit_tokens) {
    add(t);
  }
  for (const auto &file : token_files) {
    for (const auto &t : load_credentials_from_file(file)) {
      add(t);
    }
  }
  if (tokens.empty()) {
    if (const char *env = std::getenv("GITHUB_TOKEN")) {
      add(env);
    }
  }
  return tokens;
}

std::string resolve_model_api_key(const std::string &explicit_key,
                                  const std::string &key_file,
                                  const std::string &env_var) {
  if (!explicit_key.empty()) {
    return explicit_key;
  }
  if (!key_file.empty()) {
    auto secrets = load_credentials_from_file(key_file);
    if (secrets.empty()) {
      throw ConfigurationError("Model API key file is empty: " + key_file);
    }
    return secrets.front();
  }
  if (!env_var.empty()) {
    if (const char *env = std::getenv(env_var.c_str())) {
      return trim(env);
    }
  }
  return {};
}

} // namespace apr
