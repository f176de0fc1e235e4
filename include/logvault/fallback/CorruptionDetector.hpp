// Repository: LogVault
// Component: Corruption Detector
// Purpose: Format validity checks for JSON, JSON Lines and CSV files, with a
//          per-(path, format) result cache that expires after a fixed TTL.
// Copyright (c) 2026 LogVault
//
// Cache entries are never invalidated by watching files. A file modified by
// another process is only re-checked once its entry expires, or after
// Invalidate()/ClearCache(), or when the caller bypasses the cache.

#ifndef LOGVAULT_FALLBACK_CORRUPTION_DETECTOR_HPP_
#define LOGVAULT_FALLBACK_CORRUPTION_DETECTOR_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "logvault/fallback/FormatTypes.hpp"
#include "logvault/fallback/PerformanceStats.hpp"
#include "logvault/time/ITimeSource.hpp"

namespace logvault::fallback {

enum class CachePolicy {
  kUseCache,
  kBypass,  // always re-read; the fresh result still refreshes the cache
};

struct ValidationResult {
  std::string path;       // normalized
  Format format = Format::kJson;
  bool valid = false;
  int64_t checked_at_ms = 0;
  bool from_cache = false;
};

class CorruptionDetector {
 public:
  static constexpr int64_t kDefaultCacheTtlMs = 60000;

  // Null time source = system clock. Throws std::invalid_argument if ttl < 0.
  explicit CorruptionDetector(std::shared_ptr<time::ITimeSource> time_source = nullptr,
                              int64_t cache_ttl_ms = kDefaultCacheTtlMs);

  bool IsValidJSON(const std::string& path);
  bool IsValidJSONLines(const std::string& path);
  bool IsValidCSV(const std::string& path);

  // True if the file is corrupt (or missing) for `format`.
  bool DetectCorruption(const std::string& path, Format format);
  // Named-format variant. Unknown names report "not corrupt".
  bool DetectCorruption(const std::string& path, const std::string& format_name);

  ValidationResult Check(const std::string& path, Format format,
                         CachePolicy policy = CachePolicy::kUseCache);

  // Drops every cached entry for `path`, all formats.
  void Invalidate(const std::string& path);
  void ClearCache();
  [[nodiscard]] CacheStats GetCacheStats() const;
  [[nodiscard]] int64_t cache_ttl_ms() const { return cache_ttl_ms_; }

  // Content checks, no I/O and no cache.
  static bool IsValidJSONContent(const std::string& content);
  static bool IsValidJSONLinesContent(const std::string& content);
  static bool IsValidCSVContent(const std::string& content);
  static bool IsValidContent(const std::string& content, Format format);

 private:
  using CacheKey = std::pair<std::string, Format>;

  void PurgeExpiredLocked(int64_t now_ms);

  std::shared_ptr<time::ITimeSource> time_source_;
  int64_t cache_ttl_ms_;

  mutable std::mutex mutex_;
  std::map<CacheKey, ValidationResult> cache_;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_CORRUPTION_DETECTOR_HPP_
