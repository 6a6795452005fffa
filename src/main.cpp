#include "app.hpp"
#include "credential_loader.hpp"
#include "diff_source.hpp"
#include "errors.hpp"
#include "github_client.hpp"
#include "log.hpp"
#include "pull_request_ref.hpp"
#include "review_queue.hpp"
#include "review_service.hpp"
#include "task_store.hpp"

#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    apr::ensure_default_logger();
    return apr::category_logger("main");
  }();
  return logger;
}

void write_output(const std::string &path, const std::string &text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw apr::InputError("Cannot open output file: " + path);
  }
  out << text;
  if (!text.empty() && text.back() != '\n') {
    out << '\n';
  }
  main_log()->info("Review written to {}", path);
}

/// Print the stored status or result of a task.
int show_task(const apr::Config &cfg, const std::string &task_id,
              bool with_result) {
  apr::SqliteTaskStore store(cfg.task_db());
  auto task = store.find(task_id);
  if (!task) {
    throw apr::InputError("Unknown task id: " + task_id);
  }
  nlohmann::json out{{"task_id", task->id},
                     {"repo", task->repo},
                     {"pr_number", task->pr_number},
                     {"status", apr::to_string(task->status)}};
  if (with_result) {
    out["result"] = task->result ? *task->result : nlohmann::json();
  }
  std::cout << out.dump(2) << std::endl;
  return 0;
}

int run(const apr::App &app) {
  const auto &opts = app.options();
  const auto &cfg = app.config();

  if (!opts.status_task.empty()) {
    return show_task(cfg, opts.status_task, false);
  }
  if (!opts.result_task.empty()) {
    return show_task(cfg, opts.result_task, true);
  }
  if (opts.diff_file.empty() && opts.pull_requests.empty()) {
    throw apr::InputError(
        "Nothing to review: pass pull request references or --diff-file");
  }

  // References are validated before any external call is made.
  std::vector<apr::PullRequestRef> refs;
  refs.reserve(opts.pull_requests.size());
  for (const auto &text : opts.pull_requests) {
    refs.push_back(apr::parse_pull_request_ref(text));
  }

  auto budgets = app.budgets();
  auto counter = apr::make_token_counter(app.tokenizer_settings());
  main_log()->debug("Using {} token counter", counter->name());
  apr::OpenAiModelClient model(app.model_settings());
  apr::ReviewService service(*counter, model, budgets);

  if (!opts.diff_file.empty()) {
    std::string review = service.review(apr::load_diff_file(opts.diff_file));
    std::cout << review << std::endl;
    if (!opts.output_file.empty()) {
      write_output(opts.output_file, review);
    }
    return 0;
  }

  auto tokens = apr::resolve_github_tokens(cfg.github_tokens(),
                                           cfg.github_token_files());
  if (tokens.empty()) {
    main_log()->warn("No GitHub token configured, using anonymous requests");
  }
  long timeout_ms = app.http_timeout_ms();
  auto http = std::make_unique<apr::CurlHttpClient>(
      timeout_ms, cfg.http_proxy(), cfg.https_proxy());
  apr::GitHubClient github(tokens, std::move(http), cfg.github_delay_ms(),
                           timeout_ms, cfg.http_retries(),
                           cfg.github_api_base());
  apr::SqliteTaskStore store(cfg.task_db());

  apr::ReviewQueue queue(cfg.workers());
  queue.start();
  std::vector<std::pair<std::string, std::future<std::string>>> pending;
  for (const auto &ref : refs) {
    std::string task_id = store.create_task(ref);
    main_log()->info("Registered task {} for {}", task_id, apr::to_string(ref));
    std::cerr << "Task " << task_id << " queued for " << apr::to_string(ref)
              << std::endl;
    pending.emplace_back(
        task_id, queue.submit(apr::to_string(ref), [&, task_id, ref] {
          return service.process_task(task_id, ref, github, store);
        }));
  }

  int ret = 0;
  std::string last_review;
  for (std::size_t i = 0; i < pending.size(); ++i) {
    auto &[task_id, fut] = pending[i];
    try {
      std::string review = fut.get();
      if (pending.size() > 1) {
        std::cout << "=== " << apr::to_string(refs[i]) << " (task " << task_id
                  << ") ===\n";
      }
      std::cout << review << std::endl;
      last_review = std::move(review);
    } catch (const std::exception &e) {
      main_log()->error("Review of {} failed: {}", apr::to_string(refs[i]),
                        e.what());
      ret = 1;
    }
  }
  queue.stop();
  if (!opts.output_file.empty() && !last_review.empty()) {
    write_output(opts.output_file, last_review);
  }
  return ret;
}
} // namespace

/**
 * Program entry point. Maps failures to exit codes: 1 for a failed review,
 * 2 for configuration errors and 3 for invalid input.
 */
int main(int argc, char **argv) {
  apr::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }
  try {
    ret = run(app);
  } catch (const apr::ConfigurationError &e) {
    main_log()->error("Configuration error: {}", e.what());
    ret = 2;
  } catch (const apr::InputError &e) {
    main_log()->error("Invalid input: {}", e.what());
    ret = 3;
  } catch (const std::exception &e) {
    main_log()->error("{}", e.what());
    ret = 1;
  }
  spdlog::shutdown();
  return ret;
}
