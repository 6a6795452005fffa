#include "review_workflow.hpp"
#include "batch_scheduler.hpp"
#include "chunker.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "prompt_builder.hpp"
#include <spdlog/spdlog.h>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> workflow_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("review.workflow");
  }();
  return logger;
}

} // namespace

void ReviewBudgets::validate() const {
  if (primary_budget == 0) {
    throw ConfigurationError("primary_budget must be positive");
  }
  if (long_pr_threshold == 0) {
    throw ConfigurationError("long_pr_threshold must be positive");
  }
  if (batch_budget == 0) {
    throw ConfigurationError("batch_budget must be positive");
  }
  if (chunk_budget == 0) {
    throw ConfigurationError("chunk_budget must be positive");
  }
}

const char *to_string(WorkflowStage stage) {
  switch (stage) {
  case WorkflowStage::AnalyzeSize:
    return "analyze_size";
  case WorkflowStage::ReviewShort:
    return "review_short";
  case WorkflowStage::PrepareBatch:
    return "prepare_batch";
  case WorkflowStage::ReviewBatch:
    return "review_batch";
  case WorkflowStage::SummarizeOverflow:
    return "summarize_overflow";
  case WorkflowStage::Synthesize:
    return "synthesize";
  case WorkflowStage::End:
    return "end";
  }
  return "unknown";
}

ReviewWorkflow::ReviewWorkflow(ModelClient &model, ReviewBudgets budgets)
    : model_(model), budgets_(budgets) {
  budgets_.validate();
}

std::string
ReviewWorkflow::call_model(const std::vector<ChatMessage> &messages,
                           WorkflowStage stage) const {
  try {
    return model_.invoke(messages);
  } catch (const ReviewError &) {
    throw;
  } catch (const std::exception &e) {
    throw ExternalCallError(std::string("Model call failed during ") +
                            to_string(stage) + ": " + e.what());
  }
}

WorkflowStage ReviewWorkflow::step(WorkflowStage stage,
                                   WorkflowState &state) const {
  switch (stage) {
  case WorkflowStage::AnalyzeSize: {
    const std::size_t total = total_tokens(state.files);
    state.is_long_run = total > budgets_.long_pr_threshold;
    workflow_log()->info("Change set has {} files, {} tokens ({} path)",
                         state.files.size(), total,
                         state.is_long_run ? "long" : "short");
    if (!state.is_long_run) {
      return WorkflowStage::ReviewShort;
    }
    auto organized = organize_patches(state.files, budgets_.primary_budget);
    state.language_buckets = std::move(organized.buckets);
    state.overflow_files = std::move(organized.overflow);
    state.current_batch.clear();
    workflow_log()->info("{} files in language buckets, {} in overflow",
                         state.language_buckets.remaining(),
                         state.overflow_files.size());
    return WorkflowStage::PrepareBatch;
  }
  case WorkflowStage::ReviewShort:
    state.final_review = call_model(
        build_short_review_prompt(state.files, state.deleted_files), stage);
    return WorkflowStage::End;
  case WorkflowStage::PrepareBatch:
    state.current_batch =
        BatchScheduler(budgets_.batch_budget).next_batch(state.language_buckets);
    return state.current_batch.empty() ? WorkflowStage::SummarizeOverflow
                                       : WorkflowStage::ReviewBatch;
  case WorkflowStage::ReviewBatch:
    workflow_log()->info("Reviewing batch {} ({} files, {} tokens)",
                         state.batch_reviews.size() + 1,
                         state.current_batch.size(),
                         total_tokens(state.current_batch));
    state.batch_reviews.push_back(
        call_model(build_batch_review_prompt(state.current_batch), stage));
    return WorkflowStage::PrepareBatch;
  case WorkflowStage::SummarizeOverflow: {
    if (state.overflow_files.empty()) {
      return WorkflowStage::Synthesize;
    }
    auto chunks = chunk_patches(state.overflow_files, budgets_.chunk_budget);
    workflow_log()->info("Summarizing {} overflow files in {} chunks",
                         state.overflow_files.size(), chunks.size());
    for (const auto &chunk : chunks) {
      state.overflow_summaries.push_back(
          call_model(build_overflow_summary_prompt(chunk), stage));
    }
    return WorkflowStage::Synthesize;
  }
  case WorkflowStage::Synthesize:
    state.final_review =
        call_model(build_synthesis_prompt(state.batch_reviews,
                                          state.overflow_summaries,
                                          state.deleted_files),
                   stage);
    return WorkflowStage::End;
  case WorkflowStage::End:
    return WorkflowStage::End;
  }
  return WorkflowStage::End;
}

std::string ReviewWorkflow::run(WorkflowState &state) const {
  WorkflowStage stage = WorkflowStage::AnalyzeSize;
  try {
    while (stage != WorkflowStage::End) {
      WorkflowStage next = step(stage, state);
      workflow_log()->debug("{} -> {}", to_string(stage), to_string(next));
      stage = next;
    }
  } catch (const std::exception &e) {
    workflow_log()->error("Review aborted in {}: {}", to_string(stage),
                          e.what());
    state.current_batch.clear();
    state.batch_reviews.clear();
    state.overflow_summaries.clear();
    state.final_review.clear();
    throw;
  }
  return state.final_review;
}

} // namespace apr
