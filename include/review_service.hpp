/**
 * @file review_service.hpp
 * @brief Boundary between diff listings, the review workflow and task
 * tracking.
 */

#ifndef AUTOPULLREVIEW_REVIEW_SERVICE_HPP
#define AUTOPULLREVIEW_REVIEW_SERVICE_HPP

#include "diff_source.hpp"
#include "review_workflow.hpp"
#include "task_store.hpp"
#include "token_counter.hpp"
#include <string>
#include <vector>

namespace apr {

/**
 * Turns diff listings into reviews.
 *
 * The service is stateless across calls; each review() builds a fresh
 * WorkflowState so concurrent calls do not interact.
 */
class ReviewService {
public:
  /**
   * @throws ConfigurationError When @p budgets are invalid.
   */
  ReviewService(const TokenCounter &counter, ModelClient &model,
                ReviewBudgets budgets);

  /**
   * Build patches from @p entries and run the workflow.
   *
   * @return Final review text.
   * @throws InputError For malformed entries.
   * @throws ExternalCallError When a model call fails.
   */
  std::string review(const std::vector<DiffEntry> &entries) const;

  /**
   * Fetch, review and record one tracked task.
   *
   * Marks @p task_id in progress, then records either the parsed review and
   * success, or the failure detail and failure. Errors are rethrown after
   * being recorded.
   *
   * @return Final review text.
   */
  std::string process_task(const std::string &task_id,
                           const PullRequestRef &ref, DiffSource &source,
                           TaskTracker &tracker) const;

private:
  const TokenCounter &counter_;
  ReviewWorkflow workflow_;
};

} // namespace apr

#endif // AUTOPULLREVIEW_REVIEW_SERVICE_HPP
