#include "patch_organizer.hpp"
#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>

using namespace apr;

namespace {
FilePatch patch(const std::string &name, const std::string &language,
                std::size_t tokens) {
  FilePatch p;
  p.filename = name;
  p.language = language;
  p.token_count = tokens;
  return p;
}

std::vector<std::string> names(const std::deque<FilePatch> &queue) {
  std::vector<std::string> out;
  for (const auto &p : queue) {
    out.push_back(p.filename);
  }
  return out;
}
} // namespace

TEST_CASE("five equal files overflow the primary budget") {
  std::vector<FilePatch> files;
  for (int i = 1; i <= 5; ++i) {
    files.push_back(patch("f" + std::to_string(i) + ".py", "python", 1000));
  }
  auto organized = organize_patches(files, 4000);
  REQUIRE(organized.buckets.remaining() == 4);
  REQUIRE(organized.overflow.size() == 1);
  // Stable sort keeps input order among equal counts.
  REQUIRE(names(organized.buckets.queue("python")) ==
          std::vector<std::string>{"f1.py", "f2.py", "f3.py", "f4.py"});
  REQUIRE(organized.overflow[0].filename == "f5.py");
}

TEST_CASE("organizer sorts largest first and admits later small files") {
  std::vector<FilePatch> files{patch("small.py", "python", 100),
                               patch("big.js", "javascript", 3000),
                               patch("mid.py", "python", 1500),
                               patch("tiny.md", "markdown", 50)};
  auto organized = organize_patches(files, 3200);
  // 3000 admitted, 1500 rejected, 100 admitted, 50 admitted.
  REQUIRE(organized.buckets.languages() ==
          std::vector<std::string>{"javascript", "python", "markdown"});
  REQUIRE(names(organized.buckets.queue("python")) ==
          std::vector<std::string>{"small.py"});
  REQUIRE(organized.overflow.size() == 1);
  REQUIRE(organized.overflow[0].filename == "mid.py");
}

TEST_CASE("organizer admission is inclusive at the budget") {
  std::vector<FilePatch> files{patch("a.py", "python", 600),
                               patch("b.py", "python", 400)};
  auto organized = organize_patches(files, 1000);
  REQUIRE(organized.buckets.remaining() == 2);
  REQUIRE(organized.overflow.empty());
}

TEST_CASE("every file lands exactly once") {
  std::vector<FilePatch> files;
  for (int i = 0; i < 40; ++i) {
    files.push_back(patch("file" + std::to_string(i),
                          i % 3 == 0 ? "python" : (i % 3 == 1 ? "text" : "unknown"),
                          static_cast<std::size_t>((i * 37) % 500)));
  }
  auto organized = organize_patches(files, 5000);
  std::multiset<std::string> seen;
  std::size_t bucket_total = 0;
  for (const auto &language : organized.buckets.languages()) {
    for (const auto &p : organized.buckets.queue(language)) {
      REQUIRE(p.language == language);
      seen.insert(p.filename);
      bucket_total += p.token_count;
    }
  }
  for (const auto &p : organized.overflow) {
    seen.insert(p.filename);
  }
  REQUIRE(seen.size() == files.size());
  for (const auto &f : files) {
    REQUIRE(seen.count(f.filename) == 1);
  }
  REQUIRE(bucket_total <= 5000);
}

TEST_CASE("organizer is deterministic") {
  std::vector<FilePatch> files{patch("a.py", "python", 10),
                               patch("b.ts", "typescript", 10),
                               patch("c.py", "python", 30),
                               patch("d.md", "markdown", 20)};
  auto first = organize_patches(files, 45);
  auto second = organize_patches(files, 45);
  REQUIRE(first.buckets.languages() == second.buckets.languages());
  for (const auto &language : first.buckets.languages()) {
    REQUIRE(names(first.buckets.queue(language)) ==
            names(second.buckets.queue(language)));
  }
  REQUIRE(first.overflow.size() == second.overflow.size());
}

TEST_CASE("zero token files are always admitted") {
  std::vector<FilePatch> files{patch("huge.py", "python", 9000),
                               patch("empty.png", "unknown", 0)};
  auto organized = organize_patches(files, 100);
  REQUIRE(organized.overflow.size() == 1);
  REQUIRE(organized.overflow[0].filename == "huge.py");
  REQUIRE(names(organized.buckets.queue("unknown")) ==
          std::vector<std::string>{"empty.png"});
}

TEST_CASE("language buckets pop in insertion order") {
  LanguageBuckets buckets;
  REQUIRE(buckets.empty());
  buckets.push(patch("a.py", "python", 1));
  buckets.push(patch("b.py", "python", 2));
  REQUIRE(buckets.remaining() == 2);
  REQUIRE(buckets.pop_front("python").filename == "a.py");
  REQUIRE(buckets.pop_front("python").filename == "b.py");
  REQUIRE(buckets.empty());
  REQUIRE(buckets.languages() == std::vector<std::string>{"python"});
  REQUIRE_THROWS_AS(buckets.pop_front("python"), std::out_of_range);
  REQUIRE_THROWS_AS(buckets.pop_front("go"), std::out_of_range);
  const LanguageBuckets &view = buckets;
  REQUIRE(view.queue("go").empty());
}
