#include "config.hpp"
#include "errors.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace apr;

TEST_CASE("config defaults") {
  Config cfg;
  REQUIRE_FALSE(cfg.verbose());
  REQUIRE(cfg.workers() == 2);
  REQUIRE(cfg.http_timeout() == 30);
  REQUIRE(cfg.http_retries() == 3);
  REQUIRE(cfg.github_api_base() == "https://api.github.com");
  REQUIRE(cfg.model_api_base() == "https://api.openai.com/v1");
  REQUIRE(cfg.model_name() == "gpt-4");
  REQUIRE(cfg.model_temperature() == 0.0);
  REQUIRE(cfg.model_api_key_env() == "OPENAI_API_KEY");
  REQUIRE(cfg.model_retries() == 0);
  REQUIRE(cfg.primary_budget() == 4000);
  REQUIRE(cfg.long_pr_threshold() == 3000);
  REQUIRE(cfg.batch_budget() == 2000);
  REQUIRE(cfg.chunk_budget() == 1500);
  REQUIRE(cfg.tokenizer() == "bpe");
  REQUIRE(cfg.tokenizer_vocabulary() == "cl100k_base.tiktoken");
  REQUIRE(cfg.task_db() == "autopullreview.db");
  REQUIRE(cfg.log_level() == "info");
  REQUIRE(cfg.log_rotate() == 3);
}

TEST_CASE("config from sectioned yaml") {
  const char *path = "test_config_sections.yaml";
  {
    std::ofstream f(path);
    f << "core:\n"
         "  verbose: true\n"
         "  workers: 4\n"
         "logging:\n"
         "  log_level: debug\n"
         "  log_rotate: 0\n"
         "  log_categories:\n"
         "    review.workflow: trace\n"
         "    http:\n"
         "network:\n"
         "  http_timeout: 10\n"
         "  https_proxy: http://proxy:8080\n"
         "github:\n"
         "  github_delay_ms: 250\n"
         "  github_tokens:\n"
         "    - t1\n"
         "    - t2\n"
         "model:\n"
         "  model_name: gpt-4o\n"
         "  model_temperature: 0.2\n"
         "budgets:\n"
         "  primary_budget: 8000\n"
         "  chunk_budget: 1000\n"
         "tokenizer:\n"
         "  tokenizer: approximate\n"
         "storage:\n"
         "  task_db: tasks.sqlite\n";
  }
  Config cfg = Config::from_file(path);
  REQUIRE(cfg.verbose());
  REQUIRE(cfg.workers() == 4);
  REQUIRE(cfg.log_level() == "debug");
  REQUIRE(cfg.log_rotate() == 0);
  REQUIRE(cfg.log_categories().at("review.workflow") == "trace");
  REQUIRE(cfg.log_categories().at("http") == "debug");
  REQUIRE(cfg.http_timeout() == 10);
  REQUIRE(cfg.https_proxy() == "http://proxy:8080");
  REQUIRE(cfg.github_tokens() == std::vector<std::string>{"t1", "t2"});
  REQUIRE(cfg.github_delay_ms() == 250);
  REQUIRE(cfg.model_name() == "gpt-4o");
  REQUIRE(cfg.model_temperature() == Catch::Approx(0.2));
  REQUIRE(cfg.primary_budget() == 8000);
  REQUIRE(cfg.chunk_budget() == 1000);
  REQUIRE(cfg.batch_budget() == 2000);
  REQUIRE(cfg.tokenizer() == "approximate");
  REQUIRE(cfg.task_db() == "tasks.sqlite");
  std::remove(path);
}

TEST_CASE("config from flat json and toml") {
  {
    const char *path = "test_config_flat.json";
    {
      std::ofstream f(path);
      f << R"({"model_api_base": "http://localhost:8000/v1",
               "github_token_files": "tokens.txt",
               "log_categories": ["model=trace", "queue"],
               "http_retries": 5})";
    }
    Config cfg = Config::from_file(path);
    REQUIRE(cfg.model_api_base() == "http://localhost:8000/v1");
    REQUIRE(cfg.github_token_files() == std::vector<std::string>{"tokens.txt"});
    REQUIRE(cfg.log_categories().at("model") == "trace");
    REQUIRE(cfg.log_categories().at("queue") == "debug");
    REQUIRE(cfg.http_retries() == 5);
    std::remove(path);
  }
  {
    const char *path = "test_config_flat.toml";
    {
      std::ofstream f(path);
      f << "[budgets]\n"
           "long_pr_threshold = 2500\n"
           "batch_budget = 1200\n"
           "[tokenizer]\n"
           "tokenizer_vocabulary = \"/opt/vocab.tiktoken\"\n"
           "[model]\n"
           "model_retries = 2\n";
    }
    Config cfg = Config::from_file(path);
    REQUIRE(cfg.long_pr_threshold() == 2500);
    REQUIRE(cfg.batch_budget() == 1200);
    REQUIRE(cfg.tokenizer() == "bpe");
    REQUIRE(cfg.tokenizer_vocabulary() == "/opt/vocab.tiktoken");
    REQUIRE(cfg.model_retries() == 2);
    std::remove(path);
  }
}

TEST_CASE("invalid configuration is rejected") {
  REQUIRE_THROWS_AS(Config::from_file("missing.yaml"), ConfigurationError);
  REQUIRE_THROWS_AS(Config::from_file("config.ini"), ConfigurationError);
  REQUIRE_THROWS_AS(Config::from_file("noextension"), ConfigurationError);
  REQUIRE_THROWS_AS(Config::from_json(nlohmann::json::array()),
                    ConfigurationError);
  REQUIRE_THROWS_AS(Config::from_json({{"workers", "many"}}),
                    ConfigurationError);

  const char *path = "test_config_broken.json";
  {
    std::ofstream f(path);
    f << "{\"workers\": ";
  }
  REQUIRE_THROWS_AS(Config::from_file(path), ConfigurationError);
  std::remove(path);
}

TEST_CASE("setters clamp counts") {
  Config cfg;
  cfg.set_workers(0);
  REQUIRE(cfg.workers() == 1);
  cfg.set_http_retries(-1);
  REQUIRE(cfg.http_retries() == 0);
  cfg.set_github_delay_ms(-10);
  REQUIRE(cfg.github_delay_ms() == 0);
  cfg.set_log_rotate(-4);
  REQUIRE(cfg.log_rotate() == 0);
  Config empty = Config::from_json(nullptr);
  REQUIRE(empty.workers() == 2);
}
