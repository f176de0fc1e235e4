// Repository: LogVault
// Component: Fallback Performance Stats
// Purpose: Passive counters for the fallback layer: cache effectiveness,
//          per-operation latency, degraded paths taken.
// Copyright (c) 2026 LogVault
//
// These stats are observations only. They never affect control flow.

#ifndef LOGVAULT_FALLBACK_PERFORMANCE_STATS_HPP_
#define LOGVAULT_FALLBACK_PERFORMANCE_STATS_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace logvault::fallback {

struct CacheStats {
  size_t size = 0;
  size_t capacity = 0;  // 0 = unbounded (TTL-expired instead)
  uint64_t hits = 0;
  uint64_t misses = 0;

  double HitRate() const {
    const uint64_t total = hits + misses;
    return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
  }
};

enum class Operation {
  kWriteJson = 0,
  kWriteJsonLines,
  kWriteCsv,
  kReadJson,
  kReadJsonLines,
  kReadCsv,
};

constexpr size_t kOperationCount = 6;

const char* OperationToString(Operation op);

struct OperationStats {
  uint64_t count = 0;
  uint64_t failures = 0;
  int64_t total_us = 0;
  int64_t max_us = 0;

  int64_t MeanUs() const {
    return count > 0 ? total_us / static_cast<int64_t>(count) : 0;
  }
};

// =============================================================================
// PerformanceStats
// Point-in-time snapshot returned by FallbackCoordinator::GetPerformanceStats().
// =============================================================================

struct PerformanceStats {
  // ---- Caches ----
  CacheStats sanitizer_cache;
  CacheStats validation_cache;

  // ---- Path locks ----
  size_t active_path_locks = 0;      // Entries currently held or waited on
  uint64_t lock_acquisitions = 0;
  uint64_t lock_contended = 0;       // Acquisitions that had to wait
  uint64_t lock_timeouts = 0;

  // ---- Degraded paths ----
  uint64_t backups_created = 0;
  uint64_t backup_failures = 0;
  uint64_t fallback_writes = 0;      // Primary failed, fallback file written
  uint64_t failed_writes = 0;        // Primary and fallback both failed
  uint64_t degraded_reads = 0;       // Served from recovery
  uint64_t backup_restores = 0;      // Served after restoring a backup
  uint64_t fallback_reads = 0;       // Served from the fallback file
  uint64_t absent_reads = 0;         // Nothing salvageable
  uint64_t cancelled_operations = 0;

  // ---- Per operation ----
  std::array<OperationStats, kOperationCount> operations{};

  const OperationStats& For(Operation op) const {
    return operations[static_cast<size_t>(op)];
  }

  // Prometheus text exposition format.
  std::string GeneratePrometheusText() const;
};

// =============================================================================
// StatsRecorder
// Thread-safe accumulator behind PerformanceStats. Cache and lock figures are
// filled in by the coordinator at snapshot time.
// =============================================================================

class StatsRecorder {
 public:
  enum class Counter {
    kBackupCreated,
    kBackupFailure,
    kFallbackWrite,
    kFailedWrite,
    kDegradedRead,
    kBackupRestore,
    kFallbackRead,
    kAbsentRead,
    kCancelled,
    kLockTimeout,
  };

  void RecordOperation(Operation op, int64_t elapsed_us, bool ok);
  void Increment(Counter counter);
  // Copies accumulated values into `out`, leaving cache/lock fields untouched.
  void FillSnapshot(PerformanceStats* out) const;
  void Reset();

 private:
  mutable std::mutex mutex_;
  PerformanceStats stats_;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_PERFORMANCE_STATS_HPP_
