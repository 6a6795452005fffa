/**
 * @file batch_scheduler.hpp
 * @brief Draining of language buckets into budgeted review batches.
 */

#ifndef AUTOPULLREVIEW_BATCH_SCHEDULER_HPP
#define AUTOPULLREVIEW_BATCH_SCHEDULER_HPP

#include "patch_organizer.hpp"
#include <cstddef>
#include <vector>

namespace apr {

/**
 * Extracts review batches from LanguageBuckets one step at a time.
 *
 * Each step walks the buckets in first-seen language order and pops patches
 * from a bucket's front while the batch total stays within the budget. A
 * bucket is left as soon as its next patch would not fit. When nothing fits
 * but patches remain, the front patch of the first non-empty bucket is
 * emitted alone so that every step makes progress.
 */
class BatchScheduler {
public:
  explicit BatchScheduler(std::size_t batch_budget)
      : batch_budget_(batch_budget) {}

  /**
   * Produce the next batch from @p buckets.
   *
   * @return Non-empty batch, or an empty vector once every bucket is drained.
   */
  std::vector<FilePatch> next_batch(LanguageBuckets &buckets) const;

  std::size_t batch_budget() const { return batch_budget_; }

private:
  std::size_t batch_budget_;
};

} // namespace apr

#endif // AUTOPULLREVIEW_BATCH_SCHEDULER_HPP
