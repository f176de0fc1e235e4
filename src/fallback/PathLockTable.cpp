// Repository: LogVault
// Component: Path Lock Table
// Copyright (c) 2026 LogVault

#include "logvault/fallback/PathLockTable.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <thread>

#include "logvault/util/FileIo.hpp"
#include "logvault/util/Logger.hpp"

namespace logvault::fallback {

namespace {

// Wait slice between cancel/timeout checks.
constexpr auto kPollInterval = std::chrono::milliseconds(5);

using Clock = std::chrono::steady_clock;

bool Cancelled(const LockOptions& options) {
  return options.cancel != nullptr && options.cancel->load();
}

// Blocks on flock(LOCK_EX), honouring the same timeout/cancel options as the
// in-process wait.
LockStatus LockFile(int fd, const LockOptions& options, Clock::time_point deadline) {
  if (options.timeout_ms <= 0 && options.cancel == nullptr) {
    while (::flock(fd, LOCK_EX) != 0) {
      if (errno != EINTR) return LockStatus::kInterprocessFailed;
    }
    return LockStatus::kAcquired;
  }
  while (true) {
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) return LockStatus::kAcquired;
    if (errno != EWOULDBLOCK && errno != EINTR) return LockStatus::kInterprocessFailed;
    if (Cancelled(options)) return LockStatus::kCancelled;
    if (options.timeout_ms > 0 && Clock::now() >= deadline) return LockStatus::kTimedOut;
    std::this_thread::sleep_for(kPollInterval);
  }
}

}  // namespace

const char* LockStatusToString(LockStatus status) {
  switch (status) {
    case LockStatus::kAcquired: return "ACQUIRED";
    case LockStatus::kTimedOut: return "TIMED_OUT";
    case LockStatus::kCancelled: return "CANCELLED";
    case LockStatus::kInterprocessFailed: return "INTERPROCESS_FAILED";
    default: return "UNKNOWN";
  }
}

// ---------------------------------------------------------------------------
// Guard
// ---------------------------------------------------------------------------

PathLockTable::Guard::~Guard() {
  Release();
}

PathLockTable::Guard::Guard(Guard&& other)
    : table_(other.table_),
      entry_(std::move(other.entry_)),
      path_(std::move(other.path_)),
      lock_fd_(other.lock_fd_),
      status_(other.status_) {
  other.table_ = nullptr;
  other.entry_.reset();
  other.lock_fd_ = -1;
}

PathLockTable::Guard& PathLockTable::Guard::operator=(Guard&& other) {
  if (this != &other) {
    Release();
    table_ = other.table_;
    entry_ = std::move(other.entry_);
    path_ = std::move(other.path_);
    lock_fd_ = other.lock_fd_;
    status_ = other.status_;
    other.table_ = nullptr;
    other.entry_.reset();
    other.lock_fd_ = -1;
  }
  return *this;
}

void PathLockTable::Guard::Release() {
  if (!entry_) return;
  if (lock_fd_ >= 0) {
    (void)::flock(lock_fd_, LOCK_UN);
    ::close(lock_fd_);
    lock_fd_ = -1;
  }
  entry_->mutex.unlock();
  entry_.reset();
  if (table_ != nullptr) {
    table_->Unref(path_);
    table_ = nullptr;
  }
}

// ---------------------------------------------------------------------------
// Table
// ---------------------------------------------------------------------------

std::shared_ptr<PathLockTable::Entry> PathLockTable::Retain(const std::string& key) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  auto& entry = entries_[key];
  if (!entry) {
    entry = std::make_shared<Entry>();
  }
  entry->refs++;
  return entry;
}

void PathLockTable::Unref(const std::string& key) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) return;
  if (--it->second->refs == 0) {
    entries_.erase(it);
  }
}

size_t PathLockTable::ActivePaths() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return entries_.size();
}

PathLockTable::Guard PathLockTable::Acquire(const std::string& path,
                                            const LockOptions& options) {
  Guard guard;
  guard.path_ = util::NormalizePath(path);

  if (Cancelled(options)) {
    guard.status_ = LockStatus::kCancelled;
    return guard;
  }

  const Clock::time_point deadline =
      Clock::now() + std::chrono::milliseconds(std::max<int64_t>(options.timeout_ms, 0));
  std::shared_ptr<Entry> entry = Retain(guard.path_);

  LockStatus status = LockStatus::kAcquired;
  bool acquired = entry->mutex.try_lock();
  if (!acquired) {
    contended_++;
    if (options.timeout_ms <= 0 && options.cancel == nullptr) {
      entry->mutex.lock();
      acquired = true;
    } else {
      while (true) {
        if (Cancelled(options)) {
          status = LockStatus::kCancelled;
          break;
        }
        auto slice = std::chrono::duration_cast<Clock::duration>(kPollInterval);
        if (options.timeout_ms > 0) {
          const auto remaining = deadline - Clock::now();
          if (remaining <= Clock::duration::zero()) {
            status = LockStatus::kTimedOut;
            break;
          }
          slice = std::min(slice, remaining);
        }
        if (entry->mutex.try_lock_for(slice)) {
          acquired = true;
          break;
        }
      }
    }
  }

  if (!acquired) {
    Unref(guard.path_);
    guard.status_ = status;
    return guard;
  }

  if (options.interprocess) {
    const std::string lock_path = guard.path_ + ".lock";
    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    status = fd < 0 ? LockStatus::kInterprocessFailed : LockFile(fd, options, deadline);
    if (status != LockStatus::kAcquired) {
      util::Logger::Warn("[PathLockTable] inter-process lock " +
                         std::string(LockStatusToString(status)) + " path=" + lock_path);
      if (fd >= 0) ::close(fd);
      entry->mutex.unlock();
      Unref(guard.path_);
      guard.status_ = status;
      return guard;
    }
    guard.lock_fd_ = fd;
  }

  acquisitions_++;
  guard.table_ = this;
  guard.entry_ = std::move(entry);
  guard.status_ = LockStatus::kAcquired;
  return guard;
}

std::shared_ptr<PathLockTable> ProcessPathLockTable() {
  static const std::shared_ptr<PathLockTable> instance = std::make_shared<PathLockTable>();
  return instance;
}

}  // namespace logvault::fallback
