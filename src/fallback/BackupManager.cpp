// Repository: LogVault
// Component: Backup Manager
// Copyright (c) 2026 LogVault

#include "logvault/fallback/BackupManager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <zlib.h>

#include "logvault/time/SystemTimeSource.hpp"
#include "logvault/util/FileIo.hpp"
#include "logvault/util/Logger.hpp"

namespace logvault::fallback {

namespace {

// "YYYYMMDDTHHMMSS.uuuuuuZ"
constexpr size_t kStampLength = 23;

void RequireArguments(const std::string& path, const std::string& suffix) {
  if (path.empty()) {
    throw std::invalid_argument("BackupManager: path must not be empty");
  }
  if (suffix.empty()) {
    throw std::invalid_argument("BackupManager: suffix must not be empty");
  }
}

bool AllDigits(const std::string& s, size_t pos, size_t len) {
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

int ToInt(const std::string& s, size_t pos, size_t len) {
  return std::stoi(s.substr(pos, len));
}

// "/var/log/app.json" -> "%2Fvar%2Flog%2Fapp.json"
std::string EscapePath(const std::string& path) {
  std::string out;
  out.reserve(path.size() + 16);
  for (char c : path) {
    if (c == '%') {
      out += "%25";
    } else if (c == '/') {
      out += "%2F";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace

BackupManager::BackupManager(std::string backup_dir, bool fsync,
                             std::shared_ptr<time::ITimeSource> time_source)
    : backup_dir_(std::move(backup_dir)),
      writer_(std::make_shared<Sanitizer>(0), fsync),
      time_source_(time_source ? std::move(time_source) : time::DefaultTimeSource()) {}

std::string BackupManager::FormatBackupTimestamp(int64_t utc_us) {
  time_t s = static_cast<time_t>(utc_us / 1000000);
  int frac_us = static_cast<int>(utc_us % 1000000);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return std::string();
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02d.%06dZ",
                        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                        tm.tm_hour, tm.tm_min, tm.tm_sec, frac_us);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return std::string();
  return std::string(buf, static_cast<size_t>(n));
}

std::optional<int64_t> BackupManager::ParseBackupTimestamp(const std::string& stamp) {
  if (stamp.size() != kStampLength) return std::nullopt;
  if (stamp[8] != 'T' || stamp[15] != '.' || stamp[22] != 'Z') return std::nullopt;
  if (!AllDigits(stamp, 0, 8) || !AllDigits(stamp, 9, 6) || !AllDigits(stamp, 16, 6)) {
    return std::nullopt;
  }
  struct tm tm = {};
  tm.tm_year = ToInt(stamp, 0, 4) - 1900;
  tm.tm_mon = ToInt(stamp, 4, 2) - 1;
  tm.tm_mday = ToInt(stamp, 6, 2);
  tm.tm_hour = ToInt(stamp, 9, 2);
  tm.tm_min = ToInt(stamp, 11, 2);
  tm.tm_sec = ToInt(stamp, 13, 2);
  const time_t s = timegm(&tm);
  if (s == static_cast<time_t>(-1)) return std::nullopt;
  return static_cast<int64_t>(s) * 1000000 + ToInt(stamp, 16, 6);
}

uint32_t BackupManager::Crc32(const std::string& bytes) {
  uLong crc = crc32(0L, Z_NULL, 0);
  const auto* data = reinterpret_cast<const Bytef*>(bytes.data());
  size_t remaining = bytes.size();
  while (remaining > 0) {
    const uInt chunk = static_cast<uInt>(std::min<size_t>(remaining, 1u << 30));
    crc = crc32(crc, data, chunk);
    data += chunk;
    remaining -= chunk;
  }
  return static_cast<uint32_t>(crc);
}

std::string BackupManager::DirectoryFor(const std::string& source) const {
  return backup_dir_.empty() ? util::DirectoryOf(source) : backup_dir_;
}

std::string BackupManager::BackupNameFor(const std::string& source) const {
  return backup_dir_.empty() ? util::BaseName(source)
                             : EscapePath(util::NormalizePath(source));
}

int64_t BackupManager::NextStampUs() {
  const int64_t now_us = time_source_->NowUtcMs() * 1000;
  std::lock_guard<std::mutex> lock(stamp_mutex_);
  last_stamp_us_ = std::max(now_us, last_stamp_us_ + 1);
  return last_stamp_us_;
}

// ---------------------------------------------------------------------------
// Create / restore
// ---------------------------------------------------------------------------

std::optional<BackupRecord> BackupManager::CreateBackup(const std::string& path,
                                                        const std::string& suffix) {
  RequireArguments(path, suffix);

  if (!util::RegularFileExists(path)) return std::nullopt;
  std::optional<std::string> bytes = util::ReadFileBytes(path);
  if (!bytes.has_value()) {
    util::Logger::Warn("[BackupManager] cannot read source path=" + path);
    return std::nullopt;
  }

  const std::string dir = DirectoryFor(path);
  if (!backup_dir_.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      util::Logger::Warn("[BackupManager] cannot create backup dir=" + dir + ": " +
                         ec.message());
      return std::nullopt;
    }
  }

  BackupRecord record;
  record.source_path = path;
  record.size_bytes = bytes->size();
  record.crc32 = Crc32(*bytes);
  do {
    record.created_at_us = NextStampUs();
    record.backup_path = dir + "/" + BackupNameFor(path) + "." +
                         FormatBackupTimestamp(record.created_at_us) + suffix;
  } while (util::RegularFileExists(record.backup_path));

  std::string error;
  if (!writer_.WriteBytesAtomic(*bytes, record.backup_path, &error)) {
    util::Logger::Warn("[BackupManager] backup failed path=" + path + " reason=" + error);
    return std::nullopt;
  }
  util::Logger::Debug("[BackupManager] backup path=" + path + " -> " + record.backup_path);
  return record;
}

bool BackupManager::RestoreFromBackup(const std::string& path, const std::string& backup_path) {
  RequireArguments(path, kDefaultSuffix);
  if (backup_path.empty()) {
    throw std::invalid_argument("BackupManager: backup path must not be empty");
  }

  if (!util::RegularFileExists(backup_path)) return false;
  std::optional<std::string> bytes = util::ReadFileBytes(backup_path);
  if (!bytes.has_value()) return false;

  std::string error;
  if (!writer_.WriteBytesAtomic(*bytes, path, &error)) {
    util::Logger::Warn("[BackupManager] restore failed path=" + path + " reason=" + error);
    return false;
  }
  util::Logger::Info("[BackupManager] restored path=" + path + " from=" + backup_path);
  return true;
}

bool BackupManager::RestoreFromBackup(const BackupRecord& record) {
  std::optional<std::string> bytes = util::ReadFileBytes(record.backup_path);
  if (!bytes.has_value()) return false;
  if (bytes->size() != record.size_bytes || Crc32(*bytes) != record.crc32) {
    util::Logger::Warn("[BackupManager] checksum mismatch backup=" + record.backup_path);
    return false;
  }
  return RestoreFromBackup(record.source_path, record.backup_path);
}

// ---------------------------------------------------------------------------
// Listing / cleanup
// ---------------------------------------------------------------------------

std::vector<std::string> BackupManager::ListBackups(const std::string& path,
                                                    const std::string& suffix) const {
  RequireArguments(path, suffix);

  const std::string dir = DirectoryFor(path);
  const std::string prefix = BackupNameFor(path) + ".";
  std::vector<std::string> stamps;
  for (const auto& name : util::ListFileNames(dir)) {
    if (name.size() != prefix.size() + kStampLength + suffix.size()) continue;
    if (name.compare(0, prefix.size(), prefix) != 0) continue;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
    std::string stamp = name.substr(prefix.size(), kStampLength);
    if (!ParseBackupTimestamp(stamp).has_value()) continue;
    stamps.push_back(std::move(stamp));
  }
  std::sort(stamps.begin(), stamps.end());

  std::vector<std::string> paths;
  paths.reserve(stamps.size());
  for (const auto& stamp : stamps) {
    paths.push_back(dir + "/" + prefix + stamp + suffix);
  }
  return paths;
}

std::optional<std::string> BackupManager::LatestBackup(const std::string& path,
                                                       const std::string& suffix) const {
  std::vector<std::string> backups = ListBackups(path, suffix);
  if (backups.empty()) return std::nullopt;
  return backups.back();
}

size_t BackupManager::CleanupBackups(const std::string& path, int64_t max_age_ms,
                                     const std::string& suffix) {
  if (max_age_ms < 0) {
    throw std::invalid_argument("BackupManager: max_age_ms must be >= 0");
  }
  const int64_t now_us = time_source_->NowUtcMs() * 1000;
  const std::string prefix = BackupNameFor(path) + ".";

  size_t removed = 0;
  for (const auto& backup : ListBackups(path, suffix)) {
    const std::string name = util::BaseName(backup);
    std::optional<int64_t> created_us =
        ParseBackupTimestamp(name.substr(prefix.size(), kStampLength));
    if (!created_us.has_value()) continue;
    if (now_us - *created_us <= max_age_ms * 1000) continue;
    if (util::RemoveFile(backup)) {
      removed++;
    } else {
      util::Logger::Warn("[BackupManager] cannot remove backup=" + backup);
    }
  }
  if (removed > 0) {
    util::Logger::Info("[BackupManager] removed " + std::to_string(removed) +
                       " expired backups of path=" + path);
  }
  return removed;
}

}  // namespace logvault::fallback
