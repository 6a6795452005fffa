#include "batch_scheduler.hpp"

namespace apr {

std::vector<FilePatch>
BatchScheduler::next_batch(LanguageBuckets &buckets) const {
  std::vector<FilePatch> batch;
  if (buckets.empty()) {
    return batch;
  }
  std::size_t total = 0;
  for (const auto &language : buckets.languages()) {
    const auto &queue = buckets.queue(language);
    while (!queue.empty() &&
           total + queue.front().token_count <= batch_budget_) {
      total += queue.front().token_count;
      batch.push_back(buckets.pop_front(language));
    }
  }
  if (batch.empty()) {
    // Front patch exceeds the budget on its own.
    for (const auto &language : buckets.languages()) {
      if (!buckets.queue(language).empty()) {
        batch.push_back(buckets.pop_front(language));
        break;
      }
    }
  }
  return batch;
}

} // namespace apr
