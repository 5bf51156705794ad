#include "worker_pool.hpp"

#include <algorithm>
#include <memory>

namespace arsync {

WorkerPool::WorkerPool(int workers, int max_per_minute)
    : workers_(std::max(1, workers)),
      next_start_(std::chrono::steady_clock::now()) {
  if (max_per_minute > 0) {
    min_interval_ =
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(60.0 / max_per_minute));
  }
}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  threads_.reserve(static_cast<std::size_t>(workers_));
  for (int i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::worker, this);
  }
}

void WorkerPool::stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    threads.swap(threads_);
    std::queue<std::function<void()>> dropped;
    jobs_.swap(dropped);
    queued_ = 0;
  }
  cv_.notify_all();
  for (auto &t : threads) {
    if (t.joinable()) {
      t.join();
    }
  }
}

std::future<void> WorkerPool::submit(std::function<void()> job) {
  auto task = std::make_shared<std::packaged_task<void()>>(std::move(job));
  std::future<void> fut = task->get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      jobs_.emplace([task]() { (*task)(); });
      queued_.fetch_add(1);
      task.reset();
    }
  }
  if (task) {
    (*task)();
    return fut;
  }
  cv_.notify_one();
  return fut;
}

std::size_t WorkerPool::outstanding_jobs() const {
  return queued_.load() + in_flight_.load();
}

bool WorkerPool::wait_for_slot() {
  if (min_interval_ <= std::chrono::steady_clock::duration::zero()) {
    return running_;
  }
  std::unique_lock<std::mutex> lock(rate_mutex_);
  while (running_) {
    auto now = std::chrono::steady_clock::now();
    if (now >= next_start_) {
      next_start_ = now + min_interval_;
      return true;
    }
    auto wait = std::min<std::chrono::steady_clock::duration>(
        next_start_ - now, std::chrono::milliseconds(50));
    lock.unlock();
    std::this_thread::sleep_for(wait);
    lock.lock();
  }
  return false;
}

void WorkerPool::worker() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
      if (!running_) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop();
      queued_.fetch_sub(1);
      in_flight_.fetch_add(1);
    }
    if (!wait_for_slot()) {
      in_flight_.fetch_sub(1);
      return;
    }
    job();
    in_flight_.fetch_sub(1);
  }
}

} // namespace arsync
