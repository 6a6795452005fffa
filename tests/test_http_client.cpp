#include "errors.hpp"
#include "http_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>

using namespace apr;

namespace {
class FlakyHttpClient : public HttpClient {
public:
  int calls = 0;
  int failures = 2;
  int status = 503;

  HttpResponse get_with_headers(const std::string &,
                                const std::vector<std::string> &) override {
    if (calls++ < failures) {
      if (status == 0) {
        throw TransientNetworkError("connection reset");
      }
      throw HttpStatusError(status, "HTTP " + std::to_string(status));
    }
    HttpResponse res;
    res.status_code = 200;
    res.body = "ok";
    return res;
  }
  std::string post(const std::string &, const std::string &data,
                   const std::vector<std::string> &) override {
    if (calls++ < failures) {
      throw HttpStatusError(status, "HTTP " + std::to_string(status));
    }
    return data;
  }
};
} // namespace

TEST_CASE("transient error classification") {
  REQUIRE(is_transient_error(TransientNetworkError("timeout")));
  REQUIRE(is_transient_error(HttpStatusError(502, "bad gateway")));
  REQUIRE_FALSE(is_transient_error(HttpStatusError(404, "not found")));
  REQUIRE_FALSE(is_transient_error(std::runtime_error("other")));
}

TEST_CASE("retry client retries transient failures") {
  auto http = std::make_unique<FlakyHttpClient>();
  auto *raw = http.get();
  RetryHttpClient client(std::move(http), 3, 1);
  REQUIRE(client.get("https://example.invalid", {}) == "ok");
  REQUIRE(raw->calls == 3);
  REQUIRE(client.max_retries() == 3);
}

TEST_CASE("retry client retries network errors") {
  auto http = std::make_unique<FlakyHttpClient>();
  http->status = 0;
  auto *raw = http.get();
  RetryHttpClient client(std::move(http), 2, 1);
  REQUIRE(client.get_with_headers("u", {}).status_code == 200);
  REQUIRE(raw->calls == 3);
}

TEST_CASE("retry client gives up after the limit") {
  auto http = std::make_unique<FlakyHttpClient>();
  http->failures = 10;
  auto *raw = http.get();
  RetryHttpClient client(std::move(http), 2, 1);
  REQUIRE_THROWS_AS(client.post("u", "body", {}), HttpStatusError);
  REQUIRE(raw->calls == 3);
}

TEST_CASE("retry client does not retry client errors") {
  auto http = std::make_unique<FlakyHttpClient>();
  http->status = 401;
  auto *raw = http.get();
  RetryHttpClient client(std::move(http), 5, 1);
  try {
    client.post("u", "body", {});
    FAIL("expected HttpStatusError");
  } catch (const HttpStatusError &e) {
    REQUIRE(e.status == 401);
  }
  REQUIRE(raw->calls == 1);
}

TEST_CASE("retry backoff doubles and then levels off") {
  REQUIRE(retry_delay(100, 0) == std::chrono::milliseconds(100));
  REQUIRE(retry_delay(100, 3) == std::chrono::milliseconds(800));
  REQUIRE(retry_delay(100, 10) == std::chrono::milliseconds(102400));
  REQUIRE(retry_delay(100, 31) == retry_delay(100, 10));
  REQUIRE(retry_delay(100, 1000) == retry_delay(100, 10));
}

TEST_CASE("retry client survives long retry sequences") {
  auto http = std::make_unique<FlakyHttpClient>();
  http->failures = 40;
  auto *raw = http.get();
  RetryHttpClient client(std::move(http), 50, 0);
  REQUIRE(client.get_with_headers("u", {}).status_code == 200);
  REQUIRE(raw->calls == 41);
}

TEST_CASE("curl client keeps its settings") {
  CurlHttpClient client(1500, "http://proxy:3128", "http://secure:3128");
  REQUIRE(client.timeout_ms() == 1500);
  REQUIRE(client.http_proxy() == "http://proxy:3128");
  REQUIRE(client.https_proxy() == "http://secure:3128");
}
