#include "review_service.hpp"
#include "log.hpp"
#include <spdlog/spdlog.h>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> service_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("review.service");
  }();
  return logger;
}

} // namespace

ReviewService::ReviewService(const TokenCounter &counter, ModelClient &model,
                             ReviewBudgets budgets)
    : counter_(counter), workflow_(model, budgets) {}

std::string
ReviewService::review(const std::vector<DiffEntry> &entries) const {
  ChangeSet change_set = build_change_set(entries, counter_);
  service_log()->debug("Built {} patches, {} deleted files using {} counter",
                       change_set.files.size(), change_set.deleted_files.size(),
                       counter_.name());
  WorkflowState state(std::move(change_set.files),
                      std::move(change_set.deleted_files));
  return workflow_.run(state);
}

std::string ReviewService::process_task(const std::string &task_id,
                                        const PullRequestRef &ref,
                                        DiffSource &source,
                                        TaskTracker &tracker) const {
  tracker.mark_in_progress(task_id);
  try {
    service_log()->info("Task {}: fetching {}", task_id, to_string(ref));
    auto entries = source.fetch(ref);
    service_log()->info("Task {}: generating review", task_id);
    std::string review_text = review(entries);
    tracker.mark_succeeded(task_id, parse_review_result(review_text));
    service_log()->info("Task {}: succeeded", task_id);
    return review_text;
  } catch (const std::exception &e) {
    service_log()->error("Task {} failed: {}", task_id, e.what());
    tracker.mark_failed(task_id, e.what());
    throw;
  }
}

} // namespace apr
