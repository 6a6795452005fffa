#include "review_queue.hpp"
#include "log.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> queue_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("queue");
  }();
  return logger;
}

} // namespace

ReviewQueue::ReviewQueue(int workers) : workers_(std::max(1, workers)) {}

ReviewQueue::~ReviewQueue() { stop(); }

/**
 * Start worker threads if not already running.
 */
void ReviewQueue::start() {
  if (running_)
    return;
  running_ = true;
  threads_.reserve(workers_);
  for (int i = 0; i < workers_; ++i) {
    threads_.emplace_back(&ReviewQueue::worker, this);
  }
  queue_log()->debug("Started {} review workers", workers_);
}

void ReviewQueue::stop() {
  if (!running_)
    return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
  queue_log()->debug("Review workers stopped");
}

std::future<std::string>
ReviewQueue::submit(std::string name, std::function<std::string()> job) {
  auto task =
      std::make_shared<std::packaged_task<std::string()>>(std::move(job));
  std::future<std::string> fut = task->get_future();
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (running_) {
      jobs_.push(Job{name, task});
      lock.unlock();
      cv_.notify_one();
      queue_log()->debug("Queued review job {}", name);
      return fut;
    }
  }
  queue_log()->debug("Running review job {} inline", name);
  (*task)();
  return fut;
}

std::size_t ReviewQueue::outstanding_jobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size() + in_flight_.load(std::memory_order_relaxed);
}

void ReviewQueue::worker() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
      if (jobs_.empty())
        return;
      job = std::move(jobs_.front());
      jobs_.pop();
      in_flight_.fetch_add(1, std::memory_order_relaxed);
    }
    queue_log()->debug("Running review job {}", job.name);
    (*job.task)();
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
  }
}

} // namespace apr
