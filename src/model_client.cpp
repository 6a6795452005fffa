#include "model_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> model_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("model");
  }();
  return logger;
}

std::string extract_content(const nlohmann::json &reply) {
  if (reply.contains("error") && !reply["error"].is_null()) {
    const auto &err = reply["error"];
    std::string message = err.is_object() && err.contains("message") &&
                                  err["message"].is_string()
                              ? err["message"].get<std::string>()
                              : err.dump();
    throw ExternalCallError("Model returned an error: " + message);
  }
  if (!reply.contains("choices") || !reply["choices"].is_array() ||
      reply["choices"].empty()) {
    throw ExternalCallError("Model reply contains no choices");
  }
  const auto &choice = reply["choices"][0];
  if (!choice.is_object() || !choice.contains("message")) {
    throw ExternalCallError("Model reply has no message");
  }
  const auto &message = choice["message"];
  if (!message.is_object() || !message.contains("content") ||
      !message["content"].is_string()) {
    throw ExternalCallError("Model reply has no message content");
  }
  return message["content"].get<std::string>();
}

} // namespace

OpenAiModelClient::OpenAiModelClient(ModelSettings settings,
                                     HttpClientFactory make_http)
    : settings_(std::move(settings)), make_http_(std::move(make_http)) {
  if (settings_.api_key.empty()) {
    throw ConfigurationError("Model API key is not configured");
  }
  while (!settings_.api_base.empty() && settings_.api_base.back() == '/') {
    settings_.api_base.pop_back();
  }
  if (!make_http_) {
    make_http_ = [timeout = settings_.timeout_ms, http = settings_.http_proxy,
                  https = settings_.https_proxy] {
      return std::make_unique<CurlHttpClient>(timeout, http, https);
    };
  }
}

std::unique_ptr<HttpClient> OpenAiModelClient::transport() const {
  auto http = make_http_();
  if (settings_.retries > 0) {
    return std::make_unique<RetryHttpClient>(std::move(http),
                                             settings_.retries, 500);
  }
  return http;
}

std::string
OpenAiModelClient::invoke(const std::vector<ChatMessage> &messages) {
  nlohmann::json payload;
  payload["model"] = settings_.model;
  payload["temperature"] = settings_.temperature;
  payload["messages"] = nlohmann::json::array();
  for (const auto &m : messages) {
    payload["messages"].push_back({{"role", m.role}, {"content", m.content}});
  }
  const std::string url = settings_.api_base + "/chat/completions";
  std::vector<std::string> headers{
      "Authorization: Bearer " + settings_.api_key,
      "Content-Type: application/json", "Accept: application/json"};
  model_log()->debug("Invoking model {} with {} messages", settings_.model,
                     messages.size());
  std::string body;
  try {
    body = transport()->post(url, payload.dump(), headers);
  } catch (const ReviewError &) {
    throw;
  } catch (const std::exception &e) {
    model_log()->error("Model call failed: {}", e.what());
    throw ExternalCallError(std::string("Model call failed: ") + e.what());
  }
  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &e) {
    model_log()->error("Unparseable model reply: {}", e.what());
    throw ExternalCallError(std::string("Unparseable model reply: ") +
                            e.what());
  }
  std::string content = extract_content(reply);
  model_log()->trace("Model reply: {}", content);
  return content;
}

} // namespace apr
