/**
 * @file task_store.cpp
 * @brief SQLite storage of review tasks and result normalization.
 */
#include "task_store.hpp"
#include "log.hpp"
#include <iomanip>
#include <random>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> tasks_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("tasks");
  }();
  return logger;
}

/// RAII owner of a prepared statement.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("Failed to prepare statement: ") +
                               sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  void bind(int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind(int index, int value) { sqlite3_bind_int(stmt_, index, value); }
  void bind_null(int index) { sqlite3_bind_null(stmt_, index); }

  int step() { return sqlite3_step(stmt_); }

  std::string text(int column) const {
    const unsigned char *value = sqlite3_column_text(stmt_, column);
    return value ? reinterpret_cast<const char *>(value) : "";
  }
  bool is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
  }
  int integer(int column) const { return sqlite3_column_int(stmt_, column); }

private:
  sqlite3_stmt *stmt_ = nullptr;
};

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

} // namespace

const char *to_string(TaskStatus status) {
  switch (status) {
  case TaskStatus::Pending:
    return "PENDING";
  case TaskStatus::InProgress:
    return "IN_PROGRESS";
  case TaskStatus::Succeeded:
    return "SUCCESS";
  case TaskStatus::Failed:
    return "FAILED";
  }
  return "PENDING";
}

TaskStatus task_status_from_string(const std::string &value) {
  if (value == "PENDING")
    return TaskStatus::Pending;
  if (value == "IN_PROGRESS")
    return TaskStatus::InProgress;
  if (value == "SUCCESS")
    return TaskStatus::Succeeded;
  if (value == "FAILED")
    return TaskStatus::Failed;
  throw std::invalid_argument("Unknown task status: " + value);
}

SqliteTaskStore::SqliteTaskStore(const std::string &db_path) {
  tasks_log()->debug("Opening task database {}", db_path);
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open task database " + db_path +
                             ": " + msg);
  }
  const char *sql = "CREATE TABLE IF NOT EXISTS analysis_tasks("
                    "id TEXT PRIMARY KEY, repo TEXT, pr_number INTEGER,"
                    "status TEXT NOT NULL DEFAULT 'PENDING', result TEXT);"
                    "CREATE INDEX IF NOT EXISTS ix_analysis_tasks_repo "
                    "ON analysis_tasks(repo);";
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to create table: " + msg);
  }
}

SqliteTaskStore::~SqliteTaskStore() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

std::string SqliteTaskStore::create_task(const PullRequestRef &ref) {
  std::scoped_lock lock(mutex_);
  std::string id = generate_task_id();
  Statement stmt(db_, "INSERT INTO analysis_tasks(id,repo,pr_number,status) "
                      "VALUES(?,?,?,?)");
  stmt.bind(1, id);
  stmt.bind(2, ref.owner + "/" + ref.repo);
  stmt.bind(3, ref.number);
  stmt.bind(4, std::string(to_string(TaskStatus::Pending)));
  if (stmt.step() != SQLITE_DONE) {
    throw std::runtime_error("Failed to insert task: " +
                             std::string(sqlite3_errmsg(db_)));
  }
  tasks_log()->info("Task {} created for {}", id, apr::to_string(ref));
  return id;
}

void SqliteTaskStore::update(const std::string &id, TaskStatus status,
                             const std::optional<std::string> &result) {
  std::scoped_lock lock(mutex_);
  Statement stmt(db_, result ? "UPDATE analysis_tasks SET status=?, result=? "
                               "WHERE id=?"
                             : "UPDATE analysis_tasks SET status=? WHERE id=?");
  int index = 1;
  stmt.bind(index++, std::string(to_string(status)));
  if (result) {
    stmt.bind(index++, *result);
  }
  stmt.bind(index, id);
  if (stmt.step() != SQLITE_DONE) {
    throw std::runtime_error("Failed to update task " + id + ": " +
                             sqlite3_errmsg(db_));
  }
  if (sqlite3_changes(db_) == 0) {
    throw std::runtime_error("Unknown task " + id);
  }
  tasks_log()->debug("Task {} -> {}", id, to_string(status));
}

void SqliteTaskStore::mark_in_progress(const std::string &id) {
  update(id, TaskStatus::InProgress, std::nullopt);
}

void SqliteTaskStore::mark_succeeded(const std::string &id,
                                     const nlohmann::json &result) {
  update(id, TaskStatus::Succeeded, result.dump());
}

void SqliteTaskStore::mark_failed(const std::string &id,
                                  const std::string &detail) {
  update(id, TaskStatus::Failed, nlohmann::json{{"error", detail}}.dump());
}

std::optional<AnalysisTask> SqliteTaskStore::find(const std::string &id) {
  std::scoped_lock lock(mutex_);
  Statement stmt(db_, "SELECT id,repo,pr_number,status,result "
                      "FROM analysis_tasks WHERE id=?");
  stmt.bind(1, id);
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    throw std::runtime_error("Failed to query task " + id + ": " +
                             sqlite3_errmsg(db_));
  }
  AnalysisTask task;
  task.id = stmt.text(0);
  task.repo = stmt.text(1);
  task.pr_number = stmt.integer(2);
  task.status = task_status_from_string(stmt.text(3));
  if (!stmt.is_null(4)) {
    try {
      task.result = nlohmann::json::parse(stmt.text(4));
    } catch (const nlohmann::json::exception &) {
      task.result = nlohmann::json(stmt.text(4));
    }
  }
  return task;
}

std::string generate_task_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<unsigned int> byte(0, 255);
  unsigned char bytes[16];
  for (auto &b : bytes) {
    b = static_cast<unsigned char>(byte(rng));
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out << '-';
    }
    out << std::setw(2) << static_cast<unsigned int>(bytes[i]);
  }
  return out.str();
}

nlohmann::json parse_review_result(const std::string &text) {
  std::string body = trim(text);
  if (body.rfind("```", 0) == 0) {
    auto first_newline = body.find('\n');
    auto closing = body.rfind("```");
    if (first_newline != std::string::npos && closing > first_newline) {
      body = trim(body.substr(first_newline + 1, closing - first_newline - 1));
    }
  }
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &) {
    return nlohmann::json{{"review", text}};
  }
}

} // namespace apr
