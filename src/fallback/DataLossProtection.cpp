// Repository: LogVault
// Component: Data Loss Protection
// Copyright (c) 2026 LogVault

#include "logvault/fallback/DataLossProtection.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "logvault/time/SystemTimeSource.hpp"
#include "logvault/util/FileIo.hpp"
#include "logvault/util/Logger.hpp"

namespace logvault::fallback {

namespace {

constexpr size_t kStampDigits = 16;
constexpr const char* kExtension = ".json";
constexpr size_t kExtensionLength = 5;

void RequireQueue(const std::string& queue) {
  if (queue.empty() || queue.find('/') != std::string::npos) {
    throw std::invalid_argument("DataLossProtection: invalid queue name '" + queue + "'");
  }
}

bool AllDigits(const std::string& s, size_t pos, size_t len) {
  if (len == 0 || pos + len > s.size()) return false;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

// "<16 digits>_<digits>.json" starting at `pos`.
std::optional<int64_t> ParseStampAndAttempt(const std::string& name, size_t pos) {
  if (name.size() < pos + kStampDigits + 2 + kExtensionLength) return std::nullopt;
  if (name.compare(name.size() - kExtensionLength, kExtensionLength, kExtension) != 0) {
    return std::nullopt;
  }
  if (!AllDigits(name, pos, kStampDigits)) return std::nullopt;
  if (name[pos + kStampDigits] != '_') return std::nullopt;
  const size_t attempt_pos = pos + kStampDigits + 1;
  const size_t attempt_len = name.size() - kExtensionLength - attempt_pos;
  if (!AllDigits(name, attempt_pos, attempt_len)) return std::nullopt;
  return std::stoll(name.substr(pos, kStampDigits));
}

// Any queue: the stamp sits between the last two underscores.
std::optional<int64_t> ParseAnyMessageFileName(const std::string& name) {
  const size_t last = name.rfind('_');
  if (last == std::string::npos || last < kStampDigits + 1) return std::nullopt;
  const size_t stamp_pos = last - kStampDigits;
  if (name[stamp_pos - 1] != '_') return std::nullopt;
  return ParseStampAndAttempt(name, stamp_pos);
}

std::string FormatStamp(int64_t utc_us) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%016lld", static_cast<long long>(utc_us));
  return buf;
}

}  // namespace

DataLossProtection::DataLossProtection(std::string backup_dir, int max_retries,
                                       std::shared_ptr<time::ITimeSource> time_source,
                                       bool fsync)
    : backup_dir_(std::move(backup_dir)),
      max_retries_(max_retries),
      time_source_(time_source ? std::move(time_source) : time::DefaultTimeSource()),
      writer_(std::make_shared<Sanitizer>(), fsync) {
  if (backup_dir_.empty()) {
    throw std::invalid_argument("DataLossProtection: backup_dir must not be empty");
  }
  if (max_retries_ < 1) {
    throw std::invalid_argument("DataLossProtection: max_retries must be >= 1");
  }
  std::error_code ec;
  std::filesystem::create_directories(backup_dir_, ec);
  if (ec) {
    throw std::runtime_error("DataLossProtection: cannot create directory " + backup_dir_ +
                             ": " + ec.message());
  }
}

std::optional<int64_t> DataLossProtection::ParseMessageFileName(const std::string& name,
                                                                const std::string& queue) {
  const std::string prefix = queue + "_";
  if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
  return ParseStampAndAttempt(name, prefix.size());
}

int64_t DataLossProtection::NextStampUs() {
  const int64_t now_us = time_source_->NowUtcMs() * 1000;
  last_stamp_us_ = std::max(now_us, last_stamp_us_ + 1);
  return last_stamp_us_;
}

bool DataLossProtection::CircuitOpenLocked() {
  if (!circuit_open_) return false;
  if (time_source_->NowUtcMs() - circuit_opened_at_ms_ > kCircuitOpenMs) {
    circuit_open_ = false;
    failure_count_ = 0;
    util::Logger::Info("[DataLossProtection] CIRCUIT_CLOSED dir=" + backup_dir_);
    return false;
  }
  return true;
}

bool DataLossProtection::CircuitOpen() {
  std::lock_guard<std::mutex> lock(mutex_);
  return CircuitOpenLocked();
}

// ---------------------------------------------------------------------------
// Backup
// ---------------------------------------------------------------------------

bool DataLossProtection::BackupMessage(const Value& message, const std::string& queue) {
  RequireQueue(queue);
  const Json sanitized = writer_.sanitizer()->SanitizeForJSON(message);

  std::unique_lock<std::mutex> lock(mutex_);
  stats_.backup_attempts++;

  if (CircuitOpenLocked()) {
    stats_.backup_failures++;
    return false;
  }

  std::string error;
  int attempts = 0;
  for (int attempt = 0; attempt < max_retries_; ++attempt) {
    if (attempt > 0) {
      // Backoff runs unlocked; the circuit may have opened meanwhile.
      const int64_t delay_ms = backoff_base_ms_ * (int64_t{1} << (attempt - 1));
      if (delay_ms > 0) {
        lock.unlock();
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        lock.lock();
      }
      if (CircuitOpenLocked()) break;
    }

    attempts++;
    const int64_t stamp_us = NextStampUs();
    Json document = Json::object();
    document["type"] = "message";
    document["queue"] = queue;
    document["timestamp_us"] = stamp_us;
    document["message"] = sanitized;

    const std::string path = backup_dir_ + "/" + queue + "_" + FormatStamp(stamp_us) + "_" +
                             std::to_string(attempt) + kExtension;
    if (writer_.WriteJSONDocumentAtomic(document, path, -1, &error)) {
      stats_.backup_successes++;
      stats_.messages_backed_up++;
      failure_count_ = 0;
      return true;
    }
    failure_count_++;
  }

  stats_.backup_failures++;
  util::Logger::Warn("[DataLossProtection] BACKUP_FAILED queue=" + queue +
                     " attempts=" + std::to_string(attempts) + " reason=" + error);
  if (failure_count_ >= kCircuitFailureThreshold && !circuit_open_) {
    circuit_open_ = true;
    circuit_opened_at_ms_ = time_source_->NowUtcMs();
    util::Logger::Error("[DataLossProtection] CIRCUIT_OPEN dir=" + backup_dir_ +
                        " failures=" + std::to_string(failure_count_));
  }
  return false;
}

// ---------------------------------------------------------------------------
// Restore / cleanup
// ---------------------------------------------------------------------------

std::vector<DataLossProtection::StoredFile> DataLossProtection::ListQueueFiles(
    const std::string& queue) const {
  std::vector<StoredFile> files;
  for (const auto& name : util::ListFileNames(backup_dir_)) {
    std::optional<int64_t> stamp = ParseMessageFileName(name, queue);
    if (!stamp.has_value()) continue;
    files.push_back(StoredFile{name, *stamp});
  }
  std::sort(files.begin(), files.end(), [](const StoredFile& a, const StoredFile& b) {
    if (a.timestamp_us != b.timestamp_us) return a.timestamp_us < b.timestamp_us;
    return a.name < b.name;
  });
  return files;
}

std::vector<Json> DataLossProtection::RestoreMessages(const std::string& queue) {
  RequireQueue(queue);

  std::lock_guard<std::mutex> lock(mutex_);
  stats_.restore_attempts++;

  std::vector<Json> messages;
  size_t skipped = 0;
  for (const auto& file : ListQueueFiles(queue)) {
    const std::string path = backup_dir_ + "/" + file.name;
    std::optional<std::string> bytes = util::ReadFileBytes(path);
    if (!bytes.has_value()) {
      skipped++;
      continue;
    }
    Json document = Json::parse(*bytes, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded() || !document.is_object() ||
        !document.contains("message") || !document.contains("type") ||
        document["type"] != "message") {
      util::Logger::Warn("[DataLossProtection] skipping corrupt backup=" + path);
      skipped++;
      continue;
    }
    messages.push_back(std::move(document["message"]));
    if (!util::RemoveFile(path)) {
      util::Logger::Warn("[DataLossProtection] cannot remove consumed backup=" + path);
    }
  }

  if (skipped > 0) {
    stats_.restore_failures++;
  } else {
    stats_.restore_successes++;
  }
  stats_.messages_restored += messages.size();
  if (!messages.empty()) {
    util::Logger::Info("[DataLossProtection] restored " + std::to_string(messages.size()) +
                       " messages queue=" + queue);
  }
  return messages;
}

size_t DataLossProtection::CleanupOldBackups(int64_t max_age_ms) {
  if (max_age_ms < 0) {
    throw std::invalid_argument("DataLossProtection: max_age_ms must be >= 0");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now_us = time_source_->NowUtcMs() * 1000;
  size_t removed = 0;
  for (const auto& name : util::ListFileNames(backup_dir_)) {
    std::optional<int64_t> stamp = ParseAnyMessageFileName(name);
    if (!stamp.has_value()) continue;
    if (now_us - *stamp <= max_age_ms * 1000) continue;
    if (util::RemoveFile(backup_dir_ + "/" + name)) {
      removed++;
    } else {
      util::Logger::Warn("[DataLossProtection] cannot remove backup=" + name);
    }
  }
  if (removed > 0) {
    util::Logger::Info("[DataLossProtection] removed " + std::to_string(removed) +
                       " expired message backups");
  }
  return removed;
}

size_t DataLossProtection::PendingCount(const std::string& queue) const {
  RequireQueue(queue);
  std::lock_guard<std::mutex> lock(mutex_);
  return ListQueueFiles(queue).size();
}

ProtectionStats DataLossProtection::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ProtectionStats copy = stats_;
  copy.circuit_open = circuit_open_;
  return copy;
}

}  // namespace logvault::fallback
