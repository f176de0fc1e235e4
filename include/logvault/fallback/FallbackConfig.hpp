// Repository: LogVault
// Component: Fallback Configuration
// Purpose: Tunables for FallbackCoordinator, with environment overrides.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_FALLBACK_CONFIG_HPP_
#define LOGVAULT_FALLBACK_FALLBACK_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace logvault::fallback {

struct FallbackConfig {
  // ---- Caches ----
  int64_t validation_ttl_ms = 60000;      // LOGVAULT_VALIDATION_TTL_MS
  size_t sanitizer_cache_capacity = 1000;  // LOGVAULT_SANITIZER_CACHE

  // ---- Backups ----
  bool backup_on_write = true;            // LOGVAULT_BACKUP_ON_WRITE
  std::string backup_suffix = ".backup";  // LOGVAULT_BACKUP_SUFFIX
  std::string backup_dir;                 // LOGVAULT_BACKUP_DIR (empty = beside source)
  bool restore_backup_on_read = false;    // LOGVAULT_RESTORE_BACKUP_ON_READ

  // ---- Fallback file ----
  bool fallback_enabled = true;                    // LOGVAULT_FALLBACK_ENABLED
  std::string fallback_extension = ".fallback.jsonl";  // LOGVAULT_FALLBACK_EXTENSION
  bool read_fallback_file = true;                  // LOGVAULT_READ_FALLBACK_FILE
  bool error_log_enabled = true;                   // LOGVAULT_ERROR_LOG

  // ---- Locking / execution ----
  int64_t lock_timeout_ms = 0;     // LOGVAULT_LOCK_TIMEOUT_MS (0 = wait forever)
  bool interprocess_lock = false;  // LOGVAULT_INTERPROCESS_LOCK
  size_t async_workers = 2;        // LOGVAULT_ASYNC_WORKERS
  bool fsync = true;               // LOGVAULT_FSYNC
  int json_indent = -1;            // LOGVAULT_JSON_INDENT (-1 = compact)

  // Defaults overlaid with any LOGVAULT_* variables that are set. Throws
  // std::invalid_argument naming the variable if a value does not parse.
  static FallbackConfig FromEnvironment();

  // Throws std::invalid_argument describing the first bad field.
  void Validate() const;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_FALLBACK_CONFIG_HPP_
