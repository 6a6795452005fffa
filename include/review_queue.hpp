/**
 * @file review_queue.hpp
 * @brief Worker pool running independent review jobs concurrently.
 */
#ifndef AUTOPULLREVIEW_REVIEW_QUEUE_HPP
#define AUTOPULLREVIEW_REVIEW_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace apr {

/**
 * Thread pool executing submitted review jobs across multiple workers.
 *
 * Each job produces the review text of one change set. Jobs never share
 * state through the queue; exceptions thrown by a job are delivered through
 * its future.
 */
class ReviewQueue {
public:
  /// @param workers Number of worker threads (at least one is used).
  explicit ReviewQueue(int workers);

  /// Destructor stops the workers after draining queued jobs.
  ~ReviewQueue();

  ReviewQueue(const ReviewQueue &) = delete;
  ReviewQueue &operator=(const ReviewQueue &) = delete;

  /// Start the worker threads.
  void start();

  /**
   * Stop the worker threads. Jobs already queued are still executed before
   * the workers exit.
   */
  void stop();

  /**
   * Submit a job for execution.
   *
   * @param name Label used in log output.
   * @param job Callable returning the review text.
   * @return Future that becomes ready once the job completes. When the queue
   *         is not running the job executes inline before returning.
   */
  std::future<std::string> submit(std::string name,
                                  std::function<std::string()> job);

  /// Number of queued plus running jobs.
  std::size_t outstanding_jobs() const;

  int workers() const { return workers_; }

private:
  void worker();

  struct Job {
    std::string name;
    std::shared_ptr<std::packaged_task<std::string()>> task;
  };

  int workers_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> threads_;
  std::queue<Job> jobs_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<std::size_t> in_flight_{0};
};

} // namespace apr

#endif // AUTOPULLREVIEW_REVIEW_QUEUE_HPP
