/**
 * @file model_client.hpp
 * @brief Language model invocation capability used by the review workflow.
 */

#ifndef AUTOPULLREVIEW_MODEL_CLIENT_HPP
#define AUTOPULLREVIEW_MODEL_CLIENT_HPP

#include "http_client.hpp"
#include "prompt_builder.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace apr {

/**
 * Remote model call. Implementations must be safe to invoke from several
 * review runs at once and must report failures by throwing; a failed call is
 * never turned into an empty answer.
 */
class ModelClient {
public:
  virtual ~ModelClient() = default;

  /**
   * Send @p messages to the model and return the text of its reply.
   *
   * @throws ExternalCallError On transport, quota or protocol failures.
   */
  virtual std::string invoke(const std::vector<ChatMessage> &messages) = 0;
};

/// Connection settings for an OpenAI compatible chat completion endpoint.
struct ModelSettings {
  std::string api_base{"https://api.openai.com/v1"};
  std::string model{"gpt-4"};
  double temperature{0.0};
  std::string api_key;
  int retries{0};        ///< Automatic retries of transient failures
  long timeout_ms{120000};
  std::string http_proxy;
  std::string https_proxy;
};

/// Creates the transport used by a single model call.
using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

/**
 * ModelClient talking to `{api_base}/chat/completions`.
 *
 * Every invoke() builds its own transport, so concurrent review runs issue
 * their model calls in parallel.
 */
class OpenAiModelClient : public ModelClient {
public:
  /**
   * @param settings Endpoint, model and credentials.
   * @param make_http Optional transport factory; a CURL client honouring the
   *        timeout and proxies in @p settings is created per call when empty.
   * @throws ConfigurationError When no API key is configured.
   */
  explicit OpenAiModelClient(ModelSettings settings,
                             HttpClientFactory make_http = nullptr);

  std::string invoke(const std::vector<ChatMessage> &messages) override;

  const ModelSettings &settings() const { return settings_; }

private:
  ModelSettings settings_;
  HttpClientFactory make_http_;

  std::unique_ptr<HttpClient> transport() const;
};

} // namespace apr

#endif // AUTOPULLREVIEW_MODEL_CLIENT_HPP
