#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

TEST_CASE("log writes to file and honours category levels") {
  const char *path = "test_autopullreview.log";
  std::remove(path);
  apr::init_logger(spdlog::level::info, "", path, 0);
  auto workflow = apr::category_logger("review.workflow");
  auto http = apr::category_logger("http");
  REQUIRE(workflow->name() == "apr.review.workflow");
  REQUIRE(apr::category_logger("review.workflow") == workflow);

  apr::configure_log_categories({{"review.workflow", spdlog::level::debug}});
  REQUIRE(workflow->level() == spdlog::level::debug);
  REQUIRE(http->level() == spdlog::level::info);

  spdlog::debug("root debug message");
  spdlog::info("root info message");
  workflow->debug("workflow debug message");
  http->debug("http debug message");
  spdlog::shutdown();

  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content.find("root info message") != std::string::npos);
  REQUIRE(content.find("root debug message") == std::string::npos);
  REQUIRE(content.find("workflow debug message") != std::string::npos);
  REQUIRE(content.find("http debug message") == std::string::npos);
  std::remove(path);
}
