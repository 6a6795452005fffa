/**
 * @file task_store.hpp
 * @brief Persistent tracking of review tasks.
 *
 * Declares the TaskTracker interface used by the review service and its
 * SQLite implementation.
 */

#ifndef AUTOPULLREVIEW_TASK_STORE_HPP
#define AUTOPULLREVIEW_TASK_STORE_HPP

#include "pull_request_ref.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace apr {

/// Lifecycle of a review task.
enum class TaskStatus { Pending, InProgress, Succeeded, Failed };

/// Stored spelling: PENDING, IN_PROGRESS, SUCCESS or FAILED.
const char *to_string(TaskStatus status);

/// @throws std::invalid_argument For unknown spellings.
TaskStatus task_status_from_string(const std::string &value);

/// One tracked review.
struct AnalysisTask {
  std::string id;                       ///< UUID v4
  std::string repo;                     ///< "owner/repo"
  int pr_number{0};
  TaskStatus status{TaskStatus::Pending};
  std::optional<nlohmann::json> result; ///< Review or error detail
};

/** Task-tracking collaborator of the review service. */
class TaskTracker {
public:
  virtual ~TaskTracker() = default;

  /// Register a pending task for @p ref and return its identifier.
  virtual std::string create_task(const PullRequestRef &ref) = 0;

  virtual void mark_in_progress(const std::string &id) = 0;

  /// Record @p result and mark the task succeeded.
  virtual void mark_succeeded(const std::string &id,
                              const nlohmann::json &result) = 0;

  /// Record `{"error": detail}` and mark the task failed.
  virtual void mark_failed(const std::string &id,
                           const std::string &detail) = 0;

  /// Look up a task; std::nullopt when unknown.
  virtual std::optional<AnalysisTask> find(const std::string &id) = 0;
};

/**
 * SQLite backed TaskTracker storing rows in table `analysis_tasks`.
 *
 * All operations are serialized through an internal mutex so worker threads
 * may share one store.
 */
class SqliteTaskStore : public TaskTracker {
public:
  /**
   * Open or create the database at @p db_path.
   *
   * @throws std::runtime_error When the database cannot be opened or the
   *         table cannot be created.
   */
  explicit SqliteTaskStore(const std::string &db_path);
  ~SqliteTaskStore() override;
  SqliteTaskStore(const SqliteTaskStore &) = delete;
  SqliteTaskStore &operator=(const SqliteTaskStore &) = delete;

  std::string create_task(const PullRequestRef &ref) override;
  void mark_in_progress(const std::string &id) override;
  void mark_succeeded(const std::string &id,
                      const nlohmann::json &result) override;
  void mark_failed(const std::string &id, const std::string &detail) override;
  std::optional<AnalysisTask> find(const std::string &id) override;

private:
  void update(const std::string &id, TaskStatus status,
              const std::optional<std::string> &result);

  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

/// Random RFC 4122 version 4 identifier.
std::string generate_task_id();

/**
 * Convert final review text into the stored result document.
 *
 * An optional surrounding Markdown code fence is removed before parsing.
 * Text that is not JSON is wrapped as `{"review": text}`.
 */
nlohmann::json parse_review_result(const std::string &text);

} // namespace apr

#endif // AUTOPULLREVIEW_TASK_STORE_HPP
