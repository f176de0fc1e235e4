// Repository: LogVault
// Component: Worker Pool
// Purpose: Fixed set of background threads draining a FIFO task queue for
//          the coordinator's async entry points.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_WORKER_POOL_HPP_
#define LOGVAULT_FALLBACK_WORKER_POOL_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace logvault::fallback {

class WorkerPool {
 public:
  using Task = std::function<void()>;

  // Throws std::invalid_argument if workers == 0.
  explicit WorkerPool(size_t workers);
  // Runs every queued task, then joins.
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // False once shutdown has begun; the task is not run.
  bool Submit(Task task);

  [[nodiscard]] size_t PendingTasks() const;
  [[nodiscard]] size_t worker_count() const { return threads_.size(); }

 private:
  void WorkerLoop();

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::deque<Task> queue_;
  std::atomic<bool> shutdown_{false};
  std::vector<std::thread> threads_;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_WORKER_POOL_HPP_
