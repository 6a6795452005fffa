#include "prompt_builder.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace apr;

namespace {
FilePatch patch(const std::string &name, const std::string &language,
                const std::string &content) {
  FilePatch p;
  p.filename = name;
  p.language = language;
  p.content = content;
  return p;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}
} // namespace

TEST_CASE("files are formatted as fenced blocks") {
  std::vector<FilePatch> files{patch("a.py", "python", "+x = 1"),
                               patch("b.md", "markdown", "+# Title")};
  REQUIRE(format_files_content(files) ==
          "File: a.py (python)\n```python\n+x = 1\n```\n\n"
          "File: b.md (markdown)\n```markdown\n+# Title\n```");
  REQUIRE(format_files_content({}).empty());
}

TEST_CASE("deleted files are listed one per line") {
  REQUIRE(format_deleted_files({"old.py", "gone.js"}) ==
          "- old.py\n- gone.js");
  REQUIRE(format_deleted_files({}).empty());
}

TEST_CASE("short review prompt carries system prompt and files") {
  auto messages = build_short_review_prompt(
      {patch("a.py", "python", "+x = 1")}, {"old.py"});
  REQUIRE(messages.size() == 2);
  REQUIRE(messages[0].role == "system");
  REQUIRE(messages[0].content == review_system_prompt());
  REQUIRE(messages[1].role == "user");
  REQUIRE(contains(messages[1].content, "File: a.py (python)"));
  REQUIRE(contains(messages[1].content, "Deleted files:\n- old.py"));
  REQUIRE(contains(messages[1].content, "4. Overall assessment"));
}

TEST_CASE("batch and overflow prompts are single user messages") {
  std::vector<FilePatch> files{patch("a.py", "python", "+x")};
  auto batch = build_batch_review_prompt(files);
  REQUIRE(batch.size() == 1);
  REQUIRE(batch[0].role == "user");
  REQUIRE(contains(batch[0].content,
                   "Review this batch of files from a larger PR"));
  REQUIRE(contains(batch[0].content, "```python\n+x\n```"));

  auto summary = build_overflow_summary_prompt(files);
  REQUIRE(summary.size() == 1);
  REQUIRE(contains(summary[0].content,
                   "Provide a brief summary of these additional modified "
                   "files"));
}

TEST_CASE("synthesis prompt joins segments and summaries") {
  auto messages = build_synthesis_prompt({"first", "second"}, {"s1", "s2"},
                                         {"gone.py"});
  REQUIRE(messages.size() == 2);
  REQUIRE(messages[0].role == "system");
  const auto &user = messages[1].content;
  REQUIRE(contains(user, "first\n\n---\n\nsecond"));
  REQUIRE(contains(user, "Additional Modified Files Summary:\ns1\n\ns2"));
  REQUIRE(contains(user, "Deleted Files:\n- gone.py"));

  auto empty = build_synthesis_prompt({"only"}, {}, {});
  REQUIRE(contains(empty[1].content, "No additional files to summarize."));
}

TEST_CASE("system prompt requests json output") {
  const auto &prompt = review_system_prompt();
  REQUIRE(contains(prompt, "PR-Reviewer"));
  REQUIRE(contains(prompt, "\"code_suggestions\""));
  REQUIRE(contains(prompt, "\"security_analysis\""));
}
