// Repository: LogVault
// Component: Path Lock Table
// Purpose: One mutex per normalized file path, shared by every coordinator
//          that is handed the same table.
// Copyright (c) 2026 LogVault
//
// Entries are reference counted by holders and waiters and erased when the
// last one leaves, so the table only ever holds currently active paths.
// Operations on distinct paths never contend. A caller holds at most one
// path lock at a time.

#ifndef LOGVAULT_FALLBACK_PATH_LOCK_TABLE_HPP_
#define LOGVAULT_FALLBACK_PATH_LOCK_TABLE_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace logvault::fallback {

enum class LockStatus {
  kAcquired,
  kTimedOut,
  kCancelled,
  kInterprocessFailed,  // <path>.lock could not be opened or locked
};

const char* LockStatusToString(LockStatus status);

struct LockOptions {
  int64_t timeout_ms = 0;                       // 0 = wait forever
  const std::atomic<bool>* cancel = nullptr;    // polled while waiting
  bool interprocess = false;                    // also flock(<path>.lock)
};

class PathLockTable {
 private:
  struct Entry {
    std::timed_mutex mutex;
    size_t refs = 0;  // holders + waiters
  };

 public:
  // Guard
  // Move-only RAII holder. Releases the path lock (and the inter-process lock
  // if one was taken) on destruction.
  class Guard {
   public:
    Guard() = default;
    ~Guard();
    Guard(Guard&& other);
    Guard& operator=(Guard&& other);
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;

    bool owns_lock() const { return entry_ != nullptr; }
    LockStatus status() const { return status_; }
    const std::string& path() const { return path_; }
    void Release();

   private:
    friend class PathLockTable;

    PathLockTable* table_ = nullptr;
    std::shared_ptr<Entry> entry_;
    std::string path_;
    int lock_fd_ = -1;
    LockStatus status_ = LockStatus::kAcquired;
  };

  PathLockTable() = default;
  PathLockTable(const PathLockTable&) = delete;
  PathLockTable& operator=(const PathLockTable&) = delete;

  // `path` is normalized here. Blocks until acquired, timed out or
  // cancelled; check Guard::owns_lock()/status().
  Guard Acquire(const std::string& path, const LockOptions& options = LockOptions());

  // Entries currently held or waited on.
  [[nodiscard]] size_t ActivePaths() const;
  [[nodiscard]] uint64_t TotalAcquisitions() const { return acquisitions_.load(); }
  [[nodiscard]] uint64_t ContendedAcquisitions() const { return contended_.load(); }

 private:
  std::shared_ptr<Entry> Retain(const std::string& key);
  void Unref(const std::string& key);

  mutable std::mutex table_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  std::atomic<uint64_t> acquisitions_{0};
  std::atomic<uint64_t> contended_{0};
};

// Process-wide table shared by every coordinator constructed without one.
std::shared_ptr<PathLockTable> ProcessPathLockTable();

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_PATH_LOCK_TABLE_HPP_
