/**
 * @file review_workflow.hpp
 * @brief State machine driving one review run over a change set.
 *
 * A run starts in WorkflowStage::AnalyzeSize. Short change sets are reviewed
 * with a single model call; long ones are organized into language buckets,
 * reviewed batch by batch, their overflow summarized chunk by chunk, and the
 * partial results synthesized into the final review.
 */

#ifndef AUTOPULLREVIEW_REVIEW_WORKFLOW_HPP
#define AUTOPULLREVIEW_REVIEW_WORKFLOW_HPP

#include "file_patch.hpp"
#include "model_client.hpp"
#include "patch_organizer.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace apr {

/// Token ceilings governing how a change set is split across model calls.
struct ReviewBudgets {
  std::size_t primary_budget{4000};    ///< Main-group ceiling
  std::size_t long_pr_threshold{3000}; ///< Totals above this take the long path
  std::size_t batch_budget{2000};      ///< Per batch review call
  std::size_t chunk_budget{1500};      ///< Per overflow summary call

  /// @throws ConfigurationError When any budget is zero.
  void validate() const;
};

/// Stages of a review run.
enum class WorkflowStage {
  AnalyzeSize,
  ReviewShort,
  PrepareBatch,
  ReviewBatch,
  SummarizeOverflow,
  Synthesize,
  End
};

/// Stage name used in log output.
const char *to_string(WorkflowStage stage);

/**
 * Mutable context of one run. Owned exclusively by the caller of
 * ReviewWorkflow::run() or ReviewWorkflow::step().
 */
struct WorkflowState {
  std::vector<FilePatch> files;           ///< Input patches, as received
  std::vector<std::string> deleted_files; ///< Listed in the final narrative
  bool is_long_run{false};
  LanguageBuckets language_buckets;
  std::vector<FilePatch> overflow_files;
  std::vector<FilePatch> current_batch;
  std::vector<std::string> batch_reviews;
  std::vector<std::string> overflow_summaries;
  std::string final_review; ///< Set only by the terminal stage

  WorkflowState() = default;
  WorkflowState(std::vector<FilePatch> f, std::vector<std::string> deleted)
      : files(std::move(f)), deleted_files(std::move(deleted)) {}
};

/**
 * Transition function and driver for the review state machine.
 *
 * The workflow itself holds no per-run data, so one instance may drive
 * several runs concurrently as long as each has its own WorkflowState and the
 * model client tolerates concurrent calls.
 */
class ReviewWorkflow {
public:
  ReviewWorkflow(ModelClient &model, ReviewBudgets budgets);

  /**
   * Execute @p stage against @p state.
   *
   * @return The stage to execute next; WorkflowStage::End once finished.
   * @throws ExternalCallError When a model call fails.
   */
  WorkflowStage step(WorkflowStage stage, WorkflowState &state) const;

  /**
   * Run from WorkflowStage::AnalyzeSize until WorkflowStage::End.
   *
   * On failure the accumulated batch reviews, overflow summaries and final
   * review are cleared before the error propagates; the run cannot be
   * resumed.
   *
   * @return The final review text.
   */
  std::string run(WorkflowState &state) const;

  const ReviewBudgets &budgets() const { return budgets_; }

private:
  std::string call_model(const std::vector<ChatMessage> &messages,
                         WorkflowStage stage) const;

  ModelClient &model_;
  ReviewBudgets budgets_;
};

} // namespace apr

#endif // AUTOPULLREVIEW_REVIEW_WORKFLOW_HPP
