#include "diff_source.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>

using namespace apr;

TEST_CASE("parse diff entries from github listing") {
  auto listing = nlohmann::json::parse(R"([
    {"filename": "a.py", "status": "modified", "patch": "@@ -1 +1 @@\n+x"},
    {"filename": "logo.png", "status": "added"},
    {"filename": "old.js", "status": "removed", "patch": null},
    {"filename": "gone.md", "status": "deleted"}
  ])");
  auto entries = parse_diff_entries(listing);
  REQUIRE(entries.size() == 4);
  REQUIRE(entries[0].filename == "a.py");
  REQUIRE(entries[0].patch == std::string("@@ -1 +1 @@\n+x"));
  REQUIRE_FALSE(entries[1].patch.has_value());
  REQUIRE(entries[1].status == "added");
  REQUIRE_FALSE(entries[2].patch.has_value());
  REQUIRE(entries[3].status == "deleted");
}

TEST_CASE("parse diff entries accepts a files object") {
  auto listing = nlohmann::json::parse(R"({"files": [{"filename": "x.ts"}]})");
  auto entries = parse_diff_entries(listing);
  REQUIRE(entries.size() == 1);
  REQUIRE(entries[0].status == "modified");
}

TEST_CASE("malformed listings are input errors") {
  REQUIRE_THROWS_AS(parse_diff_entries(nlohmann::json::parse("42")),
                    InputError);
  REQUIRE_THROWS_AS(parse_diff_entries(nlohmann::json::parse(R"([{"x": 1}])")),
                    InputError);
  REQUIRE_THROWS_AS(
      parse_diff_entries(nlohmann::json::parse(R"([{"filename": 3}])")),
      InputError);
}

TEST_CASE("load diff file from disk") {
  const std::string path = "test_diff_source_listing.json";
  {
    std::ofstream out(path);
    out << R"([{"filename": "a.py", "patch": "+print(1)"}])";
  }
  auto entries = load_diff_file(path);
  REQUIRE(entries.size() == 1);
  REQUIRE(entries[0].patch == std::string("+print(1)"));

  {
    std::ofstream out(path, std::ios::trunc);
    out << "{not json";
  }
  REQUIRE_THROWS_AS(load_diff_file(path), InputError);
  std::remove(path.c_str());
  REQUIRE_THROWS_AS(load_diff_file("no-such-listing.json"), InputError);
}
