#include "errors.hpp"
#include "review_workflow.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>

using namespace apr;

namespace {

/// Records every call and answers with a numbered reply.
class ScriptedModel : public ModelClient {
public:
  std::vector<std::vector<ChatMessage>> calls;
  int fail_on_call = 0; ///< 1-based call index that throws, 0 for none
  bool throw_runtime = false;

  std::string invoke(const std::vector<ChatMessage> &messages) override {
    calls.push_back(messages);
    int n = static_cast<int>(calls.size());
    if (n == fail_on_call) {
      if (throw_runtime) {
        throw std::runtime_error("socket closed");
      }
      throw ExternalCallError("model unavailable");
    }
    return "reply " + std::to_string(n);
  }

  const std::string &user_text(std::size_t i) const {
    return calls.at(i).back().content;
  }
};

FilePatch patch(const std::string &name, const std::string &language,
                std::size_t tokens) {
  FilePatch p;
  p.filename = name;
  p.language = language;
  p.content = "+" + name;
  p.token_count = tokens;
  return p;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("small change set takes the short path") {
  ScriptedModel model;
  ReviewWorkflow workflow(model, ReviewBudgets{});
  WorkflowState state({patch("a.py", "python", 100),
                       patch("b.py", "python", 200)},
                      {});
  std::string review = workflow.run(state);
  REQUIRE(model.calls.size() == 1);
  REQUIRE(model.calls[0].size() == 2);
  REQUIRE(contains(model.user_text(0), "File: a.py"));
  REQUIRE(contains(model.user_text(0), "File: b.py"));
  REQUIRE(review == "reply 1");
  REQUIRE(state.final_review == "reply 1");
  REQUIRE_FALSE(state.is_long_run);
  REQUIRE(state.batch_reviews.empty());
}

TEST_CASE("threshold boundary selects the path") {
  ReviewBudgets budgets;
  budgets.long_pr_threshold = 3000;
  {
    ScriptedModel model;
    ReviewWorkflow workflow(model, budgets);
    WorkflowState state({patch("a.py", "python", 3000)}, {});
    workflow.run(state);
    REQUIRE_FALSE(state.is_long_run);
    REQUIRE(model.calls.size() == 1);
  }
  {
    ScriptedModel model;
    ReviewWorkflow workflow(model, budgets);
    WorkflowState state({patch("a.py", "python", 3001)}, {});
    workflow.run(state);
    REQUIRE(state.is_long_run);
    // One batch review plus the synthesis.
    REQUIRE(model.calls.size() == 2);
  }
}

TEST_CASE("long change set reviews batches then summaries then synthesis") {
  ScriptedModel model;
  ReviewWorkflow workflow(model, ReviewBudgets{});
  std::vector<FilePatch> files;
  for (int i = 1; i <= 5; ++i) {
    files.push_back(patch("f" + std::to_string(i) + ".py", "python", 1000));
  }
  WorkflowState state(files, {"removed.js"});
  std::string review = workflow.run(state);

  // 4 admitted files at 1000 tokens fill two batches of 2000; the fifth is
  // summarized; then a synthesis call.
  REQUIRE(model.calls.size() == 4);
  REQUIRE(contains(model.user_text(0), "Review this batch"));
  REQUIRE(contains(model.user_text(0), "f1.py"));
  REQUIRE(contains(model.user_text(0), "f2.py"));
  REQUIRE(contains(model.user_text(1), "f3.py"));
  REQUIRE(contains(model.user_text(2), "Provide a brief summary"));
  REQUIRE(contains(model.user_text(2), "f5.py"));
  REQUIRE(contains(model.user_text(3), "reply 1\n\n---\n\nreply 2"));
  REQUIRE(contains(model.user_text(3), "reply 3"));
  REQUIRE(contains(model.user_text(3), "- removed.js"));
  REQUIRE(review == "reply 4");
  REQUIRE(state.batch_reviews ==
          std::vector<std::string>{"reply 1", "reply 2"});
  REQUIRE(state.overflow_summaries == std::vector<std::string>{"reply 3"});
  REQUIRE(state.overflow_files.size() == 1);
}

TEST_CASE("overflow summary is skipped without overflow") {
  ScriptedModel model;
  ReviewBudgets budgets;
  budgets.long_pr_threshold = 100;
  ReviewWorkflow workflow(model, budgets);
  WorkflowState state({patch("a.py", "python", 150),
                       patch("b.md", "markdown", 150)},
                      {});
  workflow.run(state);
  REQUIRE(model.calls.size() == 2);
  REQUIRE(contains(model.user_text(1), "No additional files to summarize."));
  REQUIRE(state.overflow_summaries.empty());
}

TEST_CASE("oversized file is reviewed alone") {
  ScriptedModel model;
  ReviewBudgets budgets;
  budgets.primary_budget = 10000;
  ReviewWorkflow workflow(model, budgets);
  WorkflowState state({patch("huge.py", "python", 5000)}, {});
  workflow.run(state);
  REQUIRE(state.batch_reviews.size() == 1);
  REQUIRE(model.calls.size() == 2);
}

TEST_CASE("failure in a batch review aborts the run") {
  ScriptedModel model;
  model.fail_on_call = 2;
  ReviewBudgets budgets;
  budgets.primary_budget = 6000;
  budgets.batch_budget = 1000;
  ReviewWorkflow workflow(model, budgets);
  WorkflowState state({patch("a.py", "python", 1000),
                       patch("b.py", "python", 1000),
                       patch("c.py", "python", 1000),
                       patch("d.py", "python", 500)},
                      {});
  REQUIRE_THROWS_AS(workflow.run(state), ExternalCallError);
  REQUIRE(model.calls.size() == 2);
  REQUIRE(state.final_review.empty());
  REQUIRE(state.batch_reviews.empty());
  REQUIRE(state.overflow_summaries.empty());
}

TEST_CASE("foreign model errors become external call errors") {
  ScriptedModel model;
  model.fail_on_call = 1;
  model.throw_runtime = true;
  ReviewWorkflow workflow(model, ReviewBudgets{});
  WorkflowState state({patch("a.py", "python", 10)}, {});
  REQUIRE_THROWS_AS(workflow.run(state), ExternalCallError);
  REQUIRE(state.final_review.empty());
}

TEST_CASE("failed overflow summary fails the run") {
  ScriptedModel model;
  ReviewBudgets budgets;
  budgets.primary_budget = 1000;
  budgets.long_pr_threshold = 500;
  ReviewWorkflow workflow(model, budgets);
  WorkflowState state({patch("a.py", "python", 900),
                       patch("b.py", "python", 900)},
                      {});
  model.fail_on_call = 2;
  REQUIRE_THROWS_AS(workflow.run(state), ExternalCallError);
  REQUIRE(state.batch_reviews.empty());
}

TEST_CASE("step walks the stages explicitly") {
  ScriptedModel model;
  ReviewWorkflow workflow(model, ReviewBudgets{});
  WorkflowState state({patch("a.py", "python", 10)}, {});
  REQUIRE(workflow.step(WorkflowStage::AnalyzeSize, state) ==
          WorkflowStage::ReviewShort);
  REQUIRE(workflow.step(WorkflowStage::ReviewShort, state) ==
          WorkflowStage::End);
  REQUIRE(workflow.step(WorkflowStage::End, state) == WorkflowStage::End);
  REQUIRE(std::string(to_string(WorkflowStage::SummarizeOverflow)) ==
          "summarize_overflow");
}

TEST_CASE("zero budgets are rejected") {
  ScriptedModel model;
  ReviewBudgets budgets;
  budgets.chunk_budget = 0;
  REQUIRE_THROWS_AS(ReviewWorkflow(model, budgets), ConfigurationError);
  budgets = ReviewBudgets{};
  budgets.batch_budget = 0;
  REQUIRE_THROWS_AS(budgets.validate(), ConfigurationError);
}
