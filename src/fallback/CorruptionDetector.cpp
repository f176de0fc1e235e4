// Repository: LogVault
// Component: Corruption Detector
// Copyright (c) 2026 LogVault

#include "logvault/fallback/CorruptionDetector.hpp"

#include <sstream>
#include <stdexcept>

#include "logvault/fallback/Csv.hpp"
#include "logvault/time/SystemTimeSource.hpp"
#include "logvault/util/FileIo.hpp"
#include "logvault/util/Logger.hpp"

namespace logvault::fallback {

namespace {

// Expired entries are swept lazily once the cache grows past this size.
constexpr size_t kPurgeThreshold = 4096;

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

CorruptionDetector::CorruptionDetector(std::shared_ptr<time::ITimeSource> time_source,
                                       int64_t cache_ttl_ms)
    : time_source_(time_source ? std::move(time_source) : time::DefaultTimeSource()),
      cache_ttl_ms_(cache_ttl_ms) {
  if (cache_ttl_ms < 0) {
    throw std::invalid_argument("validation cache TTL must be >= 0");
  }
}

// ---------------------------------------------------------------------------
// Content checks
// ---------------------------------------------------------------------------

bool CorruptionDetector::IsValidJSONContent(const std::string& content) {
  return Json::accept(content);
}

bool CorruptionDetector::IsValidJSONLinesContent(const std::string& content) {
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (IsBlank(line)) continue;
    if (!Json::accept(line)) return false;
  }
  return true;
}

bool CorruptionDetector::IsValidCSVContent(const std::string& content) {
  if (content.empty()) return false;
  if (content.find('\0') != std::string::npos) return false;

  const std::vector<CsvRow> rows = ParseCsv(content, /*resync=*/false);
  if (rows.empty()) return false;
  const size_t width = rows.front().fields.size();
  for (const auto& row : rows) {
    if (row.malformed || row.fields.size() != width) return false;
  }
  return true;
}

bool CorruptionDetector::IsValidContent(const std::string& content, Format format) {
  switch (format) {
    case Format::kJson: return IsValidJSONContent(content);
    case Format::kJsonLines: return IsValidJSONLinesContent(content);
    case Format::kCsv: return IsValidCSVContent(content);
  }
  return false;
}

// ---------------------------------------------------------------------------
// Cached file checks
// ---------------------------------------------------------------------------

ValidationResult CorruptionDetector::Check(const std::string& path, Format format,
                                           CachePolicy policy) {
  const std::string key_path = util::NormalizePath(path);
  const CacheKey key(key_path, format);

  if (policy == CachePolicy::kUseCache) {
    const int64_t now_ms = time_source_->NowUtcMs();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end() && now_ms - it->second.checked_at_ms < cache_ttl_ms_) {
      hits_++;
      ValidationResult cached = it->second;
      cached.from_cache = true;
      return cached;
    }
    misses_++;
  }

  ValidationResult result;
  result.path = key_path;
  result.format = format;
  std::optional<std::string> content = util::ReadFileBytes(key_path);
  if (!content.has_value() || !util::RegularFileExists(key_path)) {
    result.valid = false;
  } else {
    result.valid = IsValidContent(*content, format);
  }
  result.checked_at_ms = time_source_->NowUtcMs();

  if (!result.valid) {
    util::Logger::Debug("[CorruptionDetector] invalid " + std::string(FormatToString(format)) +
                        " path=" + key_path);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (cache_.size() >= kPurgeThreshold) {
    PurgeExpiredLocked(result.checked_at_ms);
  }
  cache_[key] = result;
  return result;
}

bool CorruptionDetector::IsValidJSON(const std::string& path) {
  return Check(path, Format::kJson).valid;
}

bool CorruptionDetector::IsValidJSONLines(const std::string& path) {
  return Check(path, Format::kJsonLines).valid;
}

bool CorruptionDetector::IsValidCSV(const std::string& path) {
  return Check(path, Format::kCsv).valid;
}

bool CorruptionDetector::DetectCorruption(const std::string& path, Format format) {
  return !Check(path, format).valid;
}

bool CorruptionDetector::DetectCorruption(const std::string& path,
                                          const std::string& format_name) {
  std::optional<Format> format = ParseFormatName(format_name);
  if (!format.has_value()) return false;
  return DetectCorruption(path, *format);
}

void CorruptionDetector::Invalidate(const std::string& path) {
  const std::string key_path = util::NormalizePath(path);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.lower_bound(CacheKey(key_path, Format::kJson));
  while (it != cache_.end() && it->first.first == key_path) {
    it = cache_.erase(it);
  }
}

void CorruptionDetector::ClearCache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
  hits_ = 0;
  misses_ = 0;
}

CacheStats CorruptionDetector::GetCacheStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats;
  stats.size = cache_.size();
  stats.hits = hits_;
  stats.misses = misses_;
  return stats;
}

void CorruptionDetector::PurgeExpiredLocked(int64_t now_ms) {
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (now_ms - it->second.checked_at_ms >= cache_ttl_ms_) {
      it = cache_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace logvault::fallback
