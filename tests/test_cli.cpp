#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>

TEST_CASE("cli parses pull requests and general flags") {
  char prog[] = "prog";
  char verbose[] = "--verbose";
  char pr1[] = "octo/hello#1";
  char pr2[] = "https://github.com/octo/hello/pull/2";
  char output_flag[] = "-o";
  char output[] = "review.json";
  char *argv[] = {prog, verbose, pr1, pr2, output_flag, output};
  apr::CliOptions opts = apr::parse_cli(6, argv);
  REQUIRE(opts.verbose);
  REQUIRE(opts.pull_requests ==
          std::vector<std::string>{"octo/hello#1",
                                   "https://github.com/octo/hello/pull/2"});
  REQUIRE(opts.output_file == "review.json");
  REQUIRE_FALSE(opts.log_level);
  REQUIRE_FALSE(opts.primary_budget);

  char *argv_empty[] = {prog};
  apr::CliOptions defaults = apr::parse_cli(1, argv_empty);
  REQUIRE_FALSE(defaults.verbose);
  REQUIRE(defaults.pull_requests.empty());
  REQUIRE(defaults.config_file.empty());
}

TEST_CASE("cli budgets and model options") {
  char prog[] = "prog";
  char primary[] = "--primary-budget";
  char primary_v[] = "6000";
  char batch[] = "--batch-budget";
  char batch_v[] = "1800";
  char model[] = "--model";
  char model_v[] = "gpt-4o";
  char temp[] = "--model-temperature";
  char temp_v[] = "0.5";
  char tokenizer[] = "--tokenizer";
  char tokenizer_v[] = "approximate";
  char *argv[] = {prog,  primary,   primary_v, batch,     batch_v,   model,
                  model_v, temp,    temp_v,    tokenizer, tokenizer_v};
  auto opts = apr::parse_cli(11, argv);
  REQUIRE(*opts.primary_budget == 6000);
  REQUIRE(*opts.batch_budget == 1800);
  REQUIRE_FALSE(opts.chunk_budget);
  REQUIRE(*opts.model_name == "gpt-4o");
  REQUIRE(*opts.model_temperature == 0.5);
  REQUIRE(*opts.tokenizer == "approximate");
}

TEST_CASE("cli github tokens are repeatable") {
  char prog[] = "prog";
  char k[] = "-k";
  char t1[] = "tok1";
  char t2[] = "tok2";
  char pr[] = "octo/hello#3";
  char delay[] = "--github-delay=250";
  char *argv[] = {prog, k, t1, k, t2, pr, delay};
  auto opts = apr::parse_cli(7, argv);
  REQUIRE(opts.github_tokens == std::vector<std::string>{"tok1", "tok2"});
  REQUIRE(*opts.github_delay_ms == 250);
  REQUIRE(opts.pull_requests == std::vector<std::string>{"octo/hello#3"});
}

TEST_CASE("cli log categories") {
  char prog[] = "prog";
  char flag[] = "--log-category";
  char cat1[] = "review.workflow=trace";
  char cat2[] = "http";
  char *argv[] = {prog, flag, cat1, flag, cat2};
  auto opts = apr::parse_cli(5, argv);
  REQUIRE(opts.log_categories.at("review.workflow") == "trace");
  REQUIRE(opts.log_categories.at("http") == "debug");

  char bad[] = "=info";
  char *argv_bad[] = {prog, flag, bad};
  try {
    apr::parse_cli(3, argv_bad);
    FAIL("expected CliParseExit");
  } catch (const apr::CliParseExit &e) {
    REQUIRE(e.exit_code() == 2);
  }
}

TEST_CASE("cli task queries") {
  char prog[] = "prog";
  char status[] = "--status";
  char id[] = "0f8e";
  char db[] = "--task-db";
  char db_v[] = "tasks.db";
  char *argv[] = {prog, status, id, db, db_v};
  auto opts = apr::parse_cli(5, argv);
  REQUIRE(opts.status_task == "0f8e");
  REQUIRE(*opts.task_db == "tasks.db");

  char result[] = "--result";
  char *argv_both[] = {prog, status, id, result, id};
  REQUIRE_THROWS_AS(apr::parse_cli(5, argv_both), apr::CliParseExit);
}

TEST_CASE("cli help and errors request exit") {
  char prog[] = "prog";
  char help[] = "--help";
  char *argv_help[] = {prog, help};
  try {
    apr::parse_cli(2, argv_help);
    FAIL("expected CliParseExit");
  } catch (const apr::CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }

  char version[] = "--version";
  char *argv_version[] = {prog, version};
  try {
    apr::parse_cli(2, argv_version);
    FAIL("expected CliParseExit");
  } catch (const apr::CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }

  char unknown[] = "--no-such-flag";
  char *argv_unknown[] = {prog, unknown};
  try {
    apr::parse_cli(2, argv_unknown);
    FAIL("expected CliParseExit");
  } catch (const apr::CliParseExit &e) {
    REQUIRE(e.exit_code() == 2);
  }

  char tokenizer[] = "--tokenizer";
  char words[] = "words";
  char *argv_tok[] = {prog, tokenizer, words};
  REQUIRE_THROWS_AS(apr::parse_cli(3, argv_tok), apr::CliParseExit);

  char workers[] = "--workers";
  char zero[] = "0";
  char *argv_workers[] = {prog, workers, zero};
  REQUIRE_THROWS_AS(apr::parse_cli(3, argv_workers), apr::CliParseExit);
}
