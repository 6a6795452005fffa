#include "chunker.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace apr;

namespace {
FilePatch patch(const std::string &name, std::size_t tokens) {
  FilePatch p;
  p.filename = name;
  p.language = "python";
  p.token_count = tokens;
  return p;
}

std::vector<std::size_t> sizes(const std::vector<PatchChunk> &chunks) {
  std::vector<std::size_t> out;
  for (const auto &c : chunks) {
    out.push_back(c.size());
  }
  return out;
}
} // namespace

TEST_CASE("three 800 token files become three chunks") {
  std::vector<FilePatch> overflow{patch("a", 800), patch("b", 800),
                                  patch("c", 800)};
  auto chunks = chunk_patches(overflow, 1500);
  REQUIRE(sizes(chunks) == std::vector<std::size_t>{1, 1, 1});
  REQUIRE(chunks[0][0].filename == "a");
  REQUIRE(chunks[1][0].filename == "b");
  REQUIRE(chunks[2][0].filename == "c");
}

TEST_CASE("chunk admission is inclusive") {
  std::vector<FilePatch> overflow{patch("a", 700), patch("b", 800),
                                  patch("c", 1)};
  auto chunks = chunk_patches(overflow, 1500);
  REQUIRE(sizes(chunks) == std::vector<std::size_t>{2, 1});
}

TEST_CASE("oversized file becomes its own chunk") {
  std::vector<FilePatch> overflow{patch("a", 100), patch("huge", 5000),
                                  patch("b", 100)};
  auto chunks = chunk_patches(overflow, 1500);
  REQUIRE(sizes(chunks) == std::vector<std::size_t>{1, 1, 1});
  REQUIRE(chunks[1][0].filename == "huge");
}

TEST_CASE("chunks preserve order and cover every file") {
  std::vector<FilePatch> overflow;
  for (int i = 0; i < 10; ++i) {
    overflow.push_back(patch(std::to_string(i), 400));
  }
  auto chunks = chunk_patches(overflow, 1500);
  REQUIRE(sizes(chunks) == std::vector<std::size_t>{3, 3, 3, 1});
  int expected = 0;
  for (const auto &chunk : chunks) {
    for (const auto &p : chunk) {
      REQUIRE(p.filename == std::to_string(expected++));
    }
  }
  REQUIRE(expected == 10);
}

TEST_CASE("empty overflow yields no chunks") {
  REQUIRE(chunk_patches({}, 1500).empty());
}
