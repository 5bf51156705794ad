/**
 * @file worker_pool.hpp
 * @brief Fixed-size worker pool with an optional per-minute rate limit.
 */

#ifndef ARTICLESYNC_WORKER_POOL_HPP
#define ARTICLESYNC_WORKER_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace arsync {

/**
 * Runs submitted jobs on a bounded number of threads. When a rate is set,
 * job starts are spaced so that no more than `max_per_minute` begin in any
 * minute.
 */
class WorkerPool {
public:
  /**
   * @param workers Number of threads; values below one are raised to one.
   * @param max_per_minute Job start ceiling per minute, zero for unlimited.
   */
  explicit WorkerPool(int workers, int max_per_minute = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void start();

  /// Join all workers. Jobs still queued are dropped and their futures
  /// report a broken promise.
  void stop();

  bool running() const { return running_.load(); }

  /**
   * Queue @p job. When the pool is not running the job runs inline.
   *
   * @return Future that becomes ready when the job finishes or rethrows the
   *         job's exception.
   */
  std::future<void> submit(std::function<void()> job);

  /// Queued plus executing jobs.
  std::size_t outstanding_jobs() const;

  int workers() const { return workers_; }

private:
  void worker();
  bool wait_for_slot();

  int workers_;
  std::chrono::steady_clock::duration min_interval_{};
  std::chrono::steady_clock::time_point next_start_;
  std::mutex rate_mutex_;

  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> jobs_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> queued_{0};
  std::atomic<std::size_t> in_flight_{0};
};

} // namespace arsync

#endif // ARTICLESYNC_WORKER_POOL_HPP
