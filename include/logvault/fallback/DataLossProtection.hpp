// Repository: LogVault
// Component: Data Loss Protection
// Purpose: Per-message backups for log records that could not be delivered.
//          Messages are parked as one JSON file each in a backup directory
//          and handed back, oldest first, when the sink recovers.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_DATA_LOSS_PROTECTION_HPP_
#define LOGVAULT_FALLBACK_DATA_LOSS_PROTECTION_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "logvault/fallback/AtomicWriter.hpp"
#include "logvault/fallback/FormatTypes.hpp"
#include "logvault/fallback/Value.hpp"
#include "logvault/time/ITimeSource.hpp"

namespace logvault::fallback {

struct ProtectionStats {
  uint64_t backup_attempts = 0;
  uint64_t backup_successes = 0;
  uint64_t backup_failures = 0;
  uint64_t restore_attempts = 0;
  uint64_t restore_successes = 0;
  uint64_t restore_failures = 0;
  uint64_t messages_backed_up = 0;
  uint64_t messages_restored = 0;
  bool circuit_open = false;
};

// DataLossProtection
//
// File layout: <backup_dir>/<queue>_<timestamp_us>_<attempt>.json, where
// timestamp_us is zero-padded to 16 digits so names sort by creation time.
// Each file holds {"type":"message","queue":...,"timestamp_us":...,
// "message":<sanitized>}.
//
// Circuit breaker: every failed write attempt counts. After
// kCircuitFailureThreshold consecutive failed attempts the circuit opens and
// BackupMessage fails fast until kCircuitOpenMs has elapsed. A successful
// write resets the count.
//
// Thread-safe; one mutex serializes all operations. Retry backoff sleeps
// without holding it.
class DataLossProtection {
 public:
  static constexpr int kDefaultMaxRetries = 3;
  static constexpr int kCircuitFailureThreshold = 5;
  static constexpr int64_t kCircuitOpenMs = 30000;
  static constexpr int64_t kBackoffBaseMs = 10;

  // Creates backup_dir if needed. Throws std::runtime_error if it cannot be
  // created, std::invalid_argument on an empty dir or max_retries < 1.
  explicit DataLossProtection(std::string backup_dir, int max_retries = kDefaultMaxRetries,
                              std::shared_ptr<time::ITimeSource> time_source = nullptr,
                              bool fsync = true);

  DataLossProtection(const DataLossProtection&) = delete;
  DataLossProtection& operator=(const DataLossProtection&) = delete;

  // False if every attempt failed or the circuit is open.
  // Throws std::invalid_argument on an empty queue name or one containing '/'.
  bool BackupMessage(const Value& message, const std::string& queue = "default");

  // Sanitized messages, oldest first. Files that were read are deleted;
  // unreadable ones are logged and left in place.
  std::vector<Json> RestoreMessages(const std::string& queue = "default");

  // Removes message files (any queue) older than max_age_ms. Returns count.
  size_t CleanupOldBackups(int64_t max_age_ms);

  // Closes an expired circuit as a side effect.
  bool CircuitOpen();

  [[nodiscard]] ProtectionStats GetStats() const;

  // Number of message files currently stored for `queue`.
  size_t PendingCount(const std::string& queue = "default") const;

  [[nodiscard]] const std::string& backup_dir() const { return backup_dir_; }

  // Test hook: shortens the retry backoff (0 = no sleep).
  void SetBackoffBaseMsForTest(int64_t ms) { backoff_base_ms_ = ms; }

  // Parses "<queue>_<16 digits>_<attempt>.json" for the given queue.
  static std::optional<int64_t> ParseMessageFileName(const std::string& name,
                                                     const std::string& queue);

 private:
  struct StoredFile {
    std::string name;
    int64_t timestamp_us = 0;
  };

  bool CircuitOpenLocked();
  int64_t NextStampUs();
  std::vector<StoredFile> ListQueueFiles(const std::string& queue) const;

  std::string backup_dir_;
  int max_retries_;
  std::shared_ptr<time::ITimeSource> time_source_;
  AtomicWriter writer_;
  int64_t backoff_base_ms_ = kBackoffBaseMs;

  mutable std::mutex mutex_;
  ProtectionStats stats_;
  int failure_count_ = 0;
  bool circuit_open_ = false;
  int64_t circuit_opened_at_ms_ = 0;
  int64_t last_stamp_us_ = 0;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_DATA_LOSS_PROTECTION_HPP_
