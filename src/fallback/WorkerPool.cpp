// Repository: LogVault
// Component: Worker Pool
// Copyright (c) 2026 LogVault

#include "logvault/fallback/WorkerPool.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include "logvault/util/Logger.hpp"

namespace logvault::fallback {

using logvault::util::Logger;

WorkerPool::WorkerPool(size_t workers) {
  if (workers == 0) {
    throw std::invalid_argument("WorkerPool: workers must be > 0");
  }
  threads_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&WorkerPool::WorkerLoop, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
  }
  work_cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

bool WorkerPool::Submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_.load(std::memory_order_acquire)) return false;
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
  return true;
}

size_t WorkerPool::PendingTasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void WorkerPool::WorkerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] {
        return !queue_.empty() || shutdown_.load(std::memory_order_acquire);
      });
      // Drain before exiting so every submitted operation completes.
      if (queue_.empty()) return;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      task();
    } catch (const std::exception& e) {
      Logger::Error(std::string("[WorkerPool] task threw: ") + e.what());
    }
  }
}

}  // namespace logvault::fallback
