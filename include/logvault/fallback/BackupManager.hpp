// Repository: LogVault
// Component: Backup Manager
// Purpose: Timestamped byte-exact copies of files before they are replaced,
//          and restore from those copies.
// Copyright (c) 2026 LogVault
//
// Naming: <dir>/<file>.<YYYYMMDDTHHMMSS.uuuuuuZ><suffix>. Without a backup
// directory, <dir> is the source's directory and <file> its base name. With
// one, <file> is the source's absolute path with '%' and '/' escaped as %25
// and %2F, so sources sharing a base name never share backups. Timestamps are
// UTC, strictly increasing within the process, and sort lexicographically in
// creation order. Backups are immutable and never deleted implicitly.

#ifndef LOGVAULT_FALLBACK_BACKUP_MANAGER_HPP_
#define LOGVAULT_FALLBACK_BACKUP_MANAGER_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "logvault/fallback/AtomicWriter.hpp"
#include "logvault/time/ITimeSource.hpp"

namespace logvault::fallback {

struct BackupRecord {
  std::string source_path;
  std::string backup_path;
  int64_t created_at_us = 0;
  uint64_t size_bytes = 0;
  uint32_t crc32 = 0;
};

class BackupManager {
 public:
  static constexpr const char* kDefaultSuffix = ".backup";

  // Empty backup_dir keeps backups beside their source.
  explicit BackupManager(std::string backup_dir = std::string(), bool fsync = true,
                         std::shared_ptr<time::ITimeSource> time_source = nullptr);

  // nullopt if the source is missing or the copy cannot be written. Throws
  // std::invalid_argument on an empty path or suffix.
  std::optional<BackupRecord> CreateBackup(const std::string& path,
                                           const std::string& suffix = kDefaultSuffix);

  // Atomically replaces `path` with the backup's bytes.
  bool RestoreFromBackup(const std::string& path, const std::string& backup_path);
  // As above, refusing a backup whose bytes no longer match the recorded CRC.
  bool RestoreFromBackup(const BackupRecord& record);

  // Oldest first.
  std::vector<std::string> ListBackups(const std::string& path,
                                       const std::string& suffix = kDefaultSuffix) const;
  std::optional<std::string> LatestBackup(const std::string& path,
                                          const std::string& suffix = kDefaultSuffix) const;

  // Deletes backups of `path` older than max_age_ms. Returns the count removed.
  size_t CleanupBackups(const std::string& path, int64_t max_age_ms,
                        const std::string& suffix = kDefaultSuffix);

  [[nodiscard]] const std::string& backup_dir() const { return backup_dir_; }

  static std::string FormatBackupTimestamp(int64_t utc_us);
  static std::optional<int64_t> ParseBackupTimestamp(const std::string& stamp);
  static uint32_t Crc32(const std::string& bytes);

 private:
  std::string DirectoryFor(const std::string& source) const;
  std::string BackupNameFor(const std::string& source) const;
  int64_t NextStampUs();

  std::string backup_dir_;
  AtomicWriter writer_;
  std::shared_ptr<time::ITimeSource> time_source_;

  std::mutex stamp_mutex_;
  int64_t last_stamp_us_ = 0;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_BACKUP_MANAGER_HPP_
