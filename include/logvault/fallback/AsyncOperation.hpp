// Repository: LogVault
// Component: Async Operation handle
// Purpose: Caller-side handle for work queued on the WorkerPool: wait, read
//          the result, or cancel before the work acquires its path lock.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_ASYNC_OPERATION_HPP_
#define LOGVAULT_FALLBACK_ASYNC_OPERATION_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace logvault::fallback {

// AsyncOperation<T>
//
// Copyable; copies share one completion state. Every operation completes
// exactly once, either with the operation's result or, when cancelled before
// it started, with the failure value of its synchronous counterpart (false
// or nullopt).
template <typename T>
class AsyncOperation {
 public:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool cancelled = false;
    std::optional<T> result;
    std::atomic<bool> cancel_requested{false};
  };

  AsyncOperation() = default;
  explicit AsyncOperation(std::shared_ptr<State> state) : state_(std::move(state)) {}

  bool Valid() const { return state_ != nullptr; }

  // Has no effect once the operation holds its path lock.
  void Cancel() {
    if (state_) state_->cancel_requested.store(true);
  }

  bool Done() const {
    RequireState();
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->done;
  }

  // True if the operation completed without running because of Cancel().
  bool Cancelled() const {
    RequireState();
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->done && state_->cancelled;
  }

  void Wait() const {
    RequireState();
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->done; });
  }

  // False on timeout.
  bool WaitFor(std::chrono::milliseconds timeout) const {
    RequireState();
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->done; });
  }

  // Blocks until complete.
  T Get() const {
    Wait();
    std::lock_guard<std::mutex> lock(state_->mutex);
    return *state_->result;
  }

  // Producer side.
  static void Complete(State& state, T value, bool cancelled) {
    {
      std::lock_guard<std::mutex> lock(state.mutex);
      if (state.done) return;
      state.result = std::move(value);
      state.cancelled = cancelled;
      state.done = true;
    }
    state.cv.notify_all();
  }

 private:
  void RequireState() const {
    if (!state_) {
      throw std::logic_error("AsyncOperation has no state");
    }
  }

  std::shared_ptr<State> state_;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_ASYNC_OPERATION_HPP_
