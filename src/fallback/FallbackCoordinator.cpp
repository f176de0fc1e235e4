// Repository: LogVault
// Component: Fallback Coordinator
// Copyright (c) 2026 LogVault

#include "logvault/fallback/FallbackCoordinator.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <utility>

#include "logvault/fallback/Csv.hpp"
#include "logvault/fallback/Recovery.hpp"
#include "logvault/time/SystemTimeSource.hpp"
#include "logvault/util/FileIo.hpp"
#include "logvault/util/Logger.hpp"

namespace logvault::fallback {

using logvault::util::Logger;

namespace {

using Counter = StatsRecorder::Counter;

int64_t ElapsedUs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now() - start).count();
}

FallbackConfig Validated(FallbackConfig config) {
  config.Validate();
  return config;
}

Json ToJsonArray(std::vector<Json> records) {
  Json arr = Json::array();
  for (auto& record : records) {
    arr.push_back(std::move(record));
  }
  return arr;
}

// A document's records: its elements if it is an array, else itself.
std::vector<Json> RecordsOf(const Json& document) {
  std::vector<Json> records;
  if (document.is_array()) {
    records.assign(document.begin(), document.end());
  } else {
    records.push_back(document);
  }
  return records;
}

size_t RecordCount(const Json& data) { return data.is_array() ? data.size() : 1; }

template <typename T>
size_t RecordCount(const std::vector<T>& data) { return data.size(); }

std::optional<Json> ParseJsonDocument(const std::string& content) {
  Json doc = Json::parse(content, nullptr, false);
  if (doc.is_discarded()) return std::nullopt;
  return doc;
}

std::optional<std::vector<Json>> ParseJsonLines(const std::string& content) {
  std::vector<Json> records;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    Json value = Json::parse(line, nullptr, false);
    if (value.is_discarded()) return std::nullopt;
    records.push_back(std::move(value));
  }
  return records;
}

std::optional<std::vector<CsvRecord>> ParseCsvRecords(const std::string& content) {
  if (content.empty()) return std::vector<CsvRecord>();
  if (content.find('\0') != std::string::npos) return std::nullopt;
  const std::vector<CsvRow> rows = ParseCsv(content, /*resync=*/false);
  if (rows.empty()) return std::nullopt;
  const std::vector<std::string>& header = rows.front().fields;
  std::vector<CsvRecord> records;
  for (size_t r = 0; r < rows.size(); ++r) {
    if (rows[r].malformed || rows[r].fields.size() != header.size()) return std::nullopt;
    if (r == 0) continue;
    CsvRecord record;
    record.reserve(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
      record.emplace_back(header[i], rows[r].fields[i]);
    }
    records.push_back(std::move(record));
  }
  return records;
}

// True when the fallback file was written no earlier than the target.
// Successful primary writes delete the fallback file, so one that is still
// this fresh holds the most recent accepted write.
bool FallbackSupersedesTarget(const std::string& fallback_path, const std::string& target) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(fallback_path, ec)) return false;
  const auto fallback_time = std::filesystem::last_write_time(fallback_path, ec);
  if (ec) return false;
  const auto target_time = std::filesystem::last_write_time(target, ec);
  if (ec) return false;
  return fallback_time >= target_time;
}

}  // namespace

const char* WriteStatusToString(WriteStatus status) {
  switch (status) {
    case WriteStatus::kWritten: return "WRITTEN";
    case WriteStatus::kWrittenToFallback: return "WRITTEN_TO_FALLBACK";
    case WriteStatus::kFailed: return "FAILED";
    case WriteStatus::kLockTimeout: return "LOCK_TIMEOUT";
    case WriteStatus::kCancelled: return "CANCELLED";
    default: return "UNKNOWN";
  }
}

const char* ReadStatusToString(ReadStatus status) {
  switch (status) {
    case ReadStatus::kClean: return "CLEAN";
    case ReadStatus::kRecovered: return "RECOVERED";
    case ReadStatus::kRestoredFromBackup: return "RESTORED_FROM_BACKUP";
    case ReadStatus::kFromFallbackFile: return "FROM_FALLBACK_FILE";
    case ReadStatus::kAbsent: return "ABSENT";
    case ReadStatus::kLockTimeout: return "LOCK_TIMEOUT";
    case ReadStatus::kCancelled: return "CANCELLED";
    default: return "UNKNOWN";
  }
}

FallbackCoordinator::FallbackCoordinator(FallbackConfig config,
                                         std::shared_ptr<PathLockTable> path_locks,
                                         std::shared_ptr<time::ITimeSource> time_source)
    : config_(Validated(std::move(config))),
      time_source_(time_source ? std::move(time_source) : time::DefaultTimeSource()),
      path_locks_(path_locks ? std::move(path_locks) : ProcessPathLockTable()),
      sanitizer_(std::make_shared<Sanitizer>(config_.sanitizer_cache_capacity)),
      detector_(time_source_, config_.validation_ttl_ms),
      writer_(sanitizer_, config_.fsync),
      backups_(config_.backup_dir, config_.fsync, time_source_),
      pool_(std::make_unique<WorkerPool>(config_.async_workers)) {}

FallbackCoordinator::~FallbackCoordinator() {
  pool_.reset();
}

std::string FallbackCoordinator::FallbackPathFor(const std::string& path) const {
  return util::NormalizePath(path) + config_.fallback_extension;
}

std::string FallbackCoordinator::ErrorLogPathFor(const std::string& path) const {
  return util::NormalizePath(path) + ".error";
}

PathLockTable::Guard FallbackCoordinator::LockPath(const std::string& key,
                                                   const std::atomic<bool>* cancel) {
  LockOptions options;
  options.timeout_ms = config_.lock_timeout_ms;
  options.cancel = cancel;
  options.interprocess = config_.interprocess_lock;
  PathLockTable::Guard guard = path_locks_->Acquire(key, options);
  if (!guard.owns_lock()) {
    switch (guard.status()) {
      case LockStatus::kCancelled:
        stats_.Increment(Counter::kCancelled);
        Logger::Debug("[FallbackCoordinator] CANCELLED path=" + key);
        break;
      case LockStatus::kTimedOut:
        stats_.Increment(Counter::kLockTimeout);
        Logger::Warn("[FallbackCoordinator] LOCK_TIMEOUT path=" + key + " timeout_ms=" +
                     std::to_string(config_.lock_timeout_ms));
        break;
      default:
        Logger::Warn("[FallbackCoordinator] LOCK_FAILED path=" + key + " status=" +
                     LockStatusToString(guard.status()));
        break;
    }
  }
  return guard;
}

void FallbackCoordinator::AppendErrorLog(const std::string& key, Operation op,
                                         const std::string& stage, const std::string& reason) {
  if (!config_.error_log_enabled) return;
  const std::string line = util::FormatIso8601Utc(time_source_->NowUtcMs()) +
                           " op=" + OperationToString(op) + " stage=" + stage +
                           " path=" + key + " reason=" + reason;
  std::string error;
  if (!util::AppendLine(key + ".error", line, &error)) {
    Logger::Warn("[FallbackCoordinator] error log unavailable: " + error);
  }
}

// ---------------------------------------------------------------------------
// Write path
// ---------------------------------------------------------------------------

WriteOutcome FallbackCoordinator::RunWrite(Operation op, const std::string& path,
                                           const PrimaryWriteFn& write_primary,
                                           const std::vector<Json>& fallback_records,
                                           const std::atomic<bool>* cancel) {
  const auto start = std::chrono::steady_clock::now();
  const std::string key = util::NormalizePath(path);

  WriteOutcome outcome;
  PathLockTable::Guard guard = LockPath(key, cancel);
  if (!guard.owns_lock()) {
    outcome.status = guard.status() == LockStatus::kCancelled ? WriteStatus::kCancelled
                   : guard.status() == LockStatus::kTimedOut  ? WriteStatus::kLockTimeout
                                                              : WriteStatus::kFailed;
    outcome.error = std::string("path lock ") + LockStatusToString(guard.status());
    if (outcome.status != WriteStatus::kCancelled) {
      AppendErrorLog(key, op, "lock", outcome.error);
    }
    stats_.RecordOperation(op, ElapsedUs(start), false);
    return outcome;
  }

  if (config_.backup_on_write && util::RegularFileExists(key)) {
    outcome.backup = backups_.CreateBackup(key, config_.backup_suffix);
    stats_.Increment(outcome.backup.has_value() ? Counter::kBackupCreated
                                                : Counter::kBackupFailure);
    if (!outcome.backup.has_value()) {
      AppendErrorLog(key, op, "backup", "backup could not be created");
    }
  }

  std::string error;
  if (write_primary(key, &error)) {
    outcome.status = WriteStatus::kWritten;
    outcome.written_path = key;
    detector_.Invalidate(key);
    // A successful write supersedes any earlier diverted copy.
    const std::string fallback_path = key + config_.fallback_extension;
    if (util::RegularFileExists(fallback_path) && util::RemoveFile(fallback_path)) {
      Logger::Debug("[FallbackCoordinator] removed superseded fallback " + fallback_path);
    }
  } else {
    outcome.error = error;
    Logger::Warn("[FallbackCoordinator] WRITE_FAILED path=" + key + " op=" +
                 OperationToString(op) + " reason=" + error);
    AppendErrorLog(key, op, "primary", error);

    outcome.status = WriteStatus::kFailed;
    if (config_.fallback_enabled) {
      const std::string fallback_path = key + config_.fallback_extension;
      std::string fallback_error;
      if (writer_.WriteJSONLinesDocumentAtomic(fallback_records, fallback_path,
                                               &fallback_error)) {
        outcome.status = WriteStatus::kWrittenToFallback;
        outcome.written_path = fallback_path;
        stats_.Increment(Counter::kFallbackWrite);
        Logger::Warn("[FallbackCoordinator] FALLBACK_WRITE path=" + key + " fallback=" +
                     fallback_path + " records=" + std::to_string(fallback_records.size()));
      } else {
        AppendErrorLog(key, op, "fallback", fallback_error);
      }
    }
    if (outcome.status == WriteStatus::kFailed) {
      stats_.Increment(Counter::kFailedWrite);
      Logger::Error("[FallbackCoordinator] WRITE_LOST path=" + key + " op=" +
                    OperationToString(op));
    }
  }

  guard.Release();
  stats_.RecordOperation(op, ElapsedUs(start), outcome.ok());
  return outcome;
}

WriteOutcome FallbackCoordinator::WriteJSON(const Value& data, const std::string& path,
                                            const std::atomic<bool>* cancel) {
  const Json document = sanitizer_->SanitizeForJSON(data);
  return RunWrite(
      Operation::kWriteJson, path,
      [this, &document](const std::string& target, std::string* error) {
        return writer_.WriteJSONDocumentAtomic(document, target, config_.json_indent, error);
      },
      RecordsOf(document), cancel);
}

WriteOutcome FallbackCoordinator::WriteJSONLines(const std::vector<Value>& records,
                                                 const std::string& path,
                                                 const std::atomic<bool>* cancel) {
  std::vector<Json> sanitized;
  sanitized.reserve(records.size());
  for (const auto& record : records) {
    sanitized.push_back(sanitizer_->SanitizeForJSON(record));
  }
  return RunWrite(
      Operation::kWriteJsonLines, path,
      [this, &sanitized](const std::string& target, std::string* error) {
        return writer_.WriteJSONLinesDocumentAtomic(sanitized, target, error);
      },
      sanitized, cancel);
}

WriteOutcome FallbackCoordinator::WriteCSV(const std::vector<Value>& records,
                                           const std::string& path,
                                           const std::atomic<bool>* cancel) {
  std::vector<Json> sanitized;
  std::vector<CsvRecord> rows;
  std::string prepare_error;
  sanitized.reserve(records.size());
  rows.reserve(records.size());
  for (size_t i = 0; i < records.size(); ++i) {
    const Value& record = records[i];
    sanitized.push_back(sanitizer_->SanitizeForJSON(record));
    const bool has_fields = record.kind() == Value::Kind::kMapping ||
                            (record.kind() == Value::Kind::kOpaque && record.HasAttributes());
    if (!has_fields) {
      if (prepare_error.empty()) {
        prepare_error = "record " + std::to_string(i) + " is a " +
                        KindToString(record.kind()) + ", not a mapping";
      }
      continue;
    }
    rows.push_back(sanitizer_->SanitizeRowForCSV(record));
  }
  return RunWrite(
      Operation::kWriteCsv, path,
      [this, &rows, &prepare_error](const std::string& target, std::string* error) {
        if (!prepare_error.empty()) {
          *error = prepare_error;
          return false;
        }
        return writer_.WriteCSVRecordsAtomic(rows, target, error);
      },
      sanitized, cancel);
}

bool FallbackCoordinator::SafeWriteJSON(const Value& data, const std::string& path) {
  return WriteJSON(data, path).ok();
}

bool FallbackCoordinator::SafeWriteJSONLines(const std::vector<Value>& records,
                                             const std::string& path) {
  return WriteJSONLines(records, path).ok();
}

bool FallbackCoordinator::SafeWriteCSV(const std::vector<Value>& records,
                                       const std::string& path) {
  return WriteCSV(records, path).ok();
}

// ---------------------------------------------------------------------------
// Read path
// ---------------------------------------------------------------------------

std::optional<std::vector<Json>> FallbackCoordinator::ReadFallbackFile(const std::string& key) {
  const std::string fallback_path = key + config_.fallback_extension;
  if (!util::RegularFileExists(fallback_path)) return std::nullopt;
  std::optional<std::string> content = util::ReadFileBytes(fallback_path);
  if (!content.has_value()) return std::nullopt;
  return Recovery::RecoverJSONLinesContent(*content);
}

template <typename T>
ReadOutcome<T> FallbackCoordinator::RunRead(
    Operation op, Format format, const std::string& path,
    const std::function<std::optional<T>(const std::string&)>& parse,
    const std::function<std::optional<T>(const std::string&)>& recover,
    const std::function<T(std::vector<Json>)>& from_fallback,
    const std::atomic<bool>* cancel) {
  const auto start = std::chrono::steady_clock::now();
  const std::string key = util::NormalizePath(path);

  ReadOutcome<T> outcome;
  PathLockTable::Guard guard = LockPath(key, cancel);
  if (!guard.owns_lock()) {
    outcome.status = guard.status() == LockStatus::kCancelled ? ReadStatus::kCancelled
                   : guard.status() == LockStatus::kTimedOut  ? ReadStatus::kLockTimeout
                                                              : ReadStatus::kAbsent;
    stats_.RecordOperation(op, ElapsedUs(start), false);
    return outcome;
  }

  auto finish = [&]() {
    guard.Release();
    stats_.RecordOperation(op, ElapsedUs(start), outcome.data.has_value());
    return outcome;
  };

  auto try_fallback_file = [&]() {
    if (!config_.read_fallback_file) return false;
    std::optional<std::vector<Json>> records = ReadFallbackFile(key);
    if (!records.has_value()) return false;
    outcome.status = ReadStatus::kFromFallbackFile;
    outcome.source_path = key + config_.fallback_extension;
    Logger::Warn("[FallbackCoordinator] FALLBACK_READ path=" + key + " fallback=" +
                 outcome.source_path + " records=" + std::to_string(records->size()));
    outcome.data = from_fallback(std::move(*records));
    stats_.Increment(Counter::kFallbackRead);
    return true;
  };

  std::optional<std::string> content;
  if (util::RegularFileExists(key)) {
    if (config_.read_fallback_file &&
        FallbackSupersedesTarget(key + config_.fallback_extension, key) &&
        try_fallback_file()) {
      return finish();
    }
    content = util::ReadFileBytes(key);
  }
  if (!content.has_value()) {
    if (!try_fallback_file()) {
      stats_.Increment(Counter::kAbsentRead);
    }
    return finish();
  }

  // Zero records leave a zero-byte CSV or JSON Lines file.
  if (content->empty() && format != Format::kJson) {
    outcome.status = ReadStatus::kClean;
    outcome.source_path = key;
    outcome.data = parse(*content);
    return finish();
  }

  ValidationResult validation = detector_.Check(key, format);
  if (!validation.valid && validation.from_cache) {
    validation = detector_.Check(key, format, CachePolicy::kBypass);
  }
  if (validation.valid) {
    std::optional<T> data = parse(*content);
    if (data.has_value()) {
      outcome.status = ReadStatus::kClean;
      outcome.source_path = key;
      outcome.data = std::move(data);
      return finish();
    }
    // Cached verdict is stale: the file changed inside the TTL window.
    detector_.Invalidate(key);
  }

  std::optional<T> recovered = recover(*content);
  if (recovered.has_value()) {
    Logger::Warn("[FallbackCoordinator] DEGRADED_READ path=" + key + " format=" +
                 FormatToString(format) + " records=" +
                 std::to_string(RecordCount(*recovered)));
    outcome.status = ReadStatus::kRecovered;
    outcome.source_path = key;
    outcome.data = std::move(recovered);
    stats_.Increment(Counter::kDegradedRead);
    return finish();
  }

  if (config_.restore_backup_on_read) {
    std::vector<std::string> backups = backups_.ListBackups(key, config_.backup_suffix);
    for (auto it = backups.rbegin(); it != backups.rend(); ++it) {
      std::optional<std::string> backup_content = util::ReadFileBytes(*it);
      if (!backup_content.has_value()) continue;
      std::optional<T> data = parse(*backup_content);
      if (!data.has_value()) continue;
      if (!backups_.RestoreFromBackup(key, *it)) continue;
      detector_.Invalidate(key);
      Logger::Warn("[FallbackCoordinator] RESTORED_FROM_BACKUP path=" + key + " backup=" + *it);
      outcome.status = ReadStatus::kRestoredFromBackup;
      outcome.source_path = *it;
      outcome.data = std::move(data);
      stats_.Increment(Counter::kBackupRestore);
      return finish();
    }
  }

  if (!try_fallback_file()) {
    Logger::Error("[FallbackCoordinator] RECOVERY_EXHAUSTED path=" + key + " format=" +
                  FormatToString(format));
    stats_.Increment(Counter::kAbsentRead);
  }
  return finish();
}

ReadOutcome<Json> FallbackCoordinator::ReadJSON(const std::string& path,
                                                const std::atomic<bool>* cancel) {
  return RunRead<Json>(
      Operation::kReadJson, Format::kJson, path, ParseJsonDocument,
      [](const std::string& content) -> std::optional<Json> {
        std::optional<std::vector<Json>> records = Recovery::RecoverJSONContent(content);
        if (!records.has_value()) return std::nullopt;
        return ToJsonArray(std::move(*records));
      },
      [](std::vector<Json> records) { return ToJsonArray(std::move(records)); }, cancel);
}

ReadOutcome<std::vector<Json>> FallbackCoordinator::ReadJSONLines(
    const std::string& path, const std::atomic<bool>* cancel) {
  return RunRead<std::vector<Json>>(
      Operation::kReadJsonLines, Format::kJsonLines, path, ParseJsonLines,
      Recovery::RecoverJSONLinesContent,
      [](std::vector<Json> records) { return records; }, cancel);
}

ReadOutcome<std::vector<CsvRecord>> FallbackCoordinator::ReadCSV(
    const std::string& path, const std::atomic<bool>* cancel) {
  return RunRead<std::vector<CsvRecord>>(
      Operation::kReadCsv, Format::kCsv, path, ParseCsvRecords, Recovery::RecoverCSVContent,
      [](std::vector<Json> records) {
        std::vector<CsvRecord> rows;
        rows.reserve(records.size());
        for (const auto& record : records) {
          rows.push_back(Sanitizer::JsonToCsvRecord(record));
        }
        return rows;
      },
      cancel);
}

std::optional<Json> FallbackCoordinator::SafeReadJSON(const std::string& path) {
  return ReadJSON(path).data;
}

std::optional<std::vector<Json>> FallbackCoordinator::SafeReadJSONLines(
    const std::string& path) {
  return ReadJSONLines(path).data;
}

std::optional<std::vector<CsvRecord>> FallbackCoordinator::SafeReadCSV(
    const std::string& path) {
  return ReadCSV(path).data;
}

// ---------------------------------------------------------------------------
// Async
// ---------------------------------------------------------------------------

template <typename T>
AsyncOperation<T> FallbackCoordinator::SubmitAsync(
    std::function<T(const std::atomic<bool>* cancel, bool* cancelled)> work,
    T failure_value) {
  auto state = std::make_shared<typename AsyncOperation<T>::State>();
  AsyncOperation<T> operation(state);

  const bool queued = pool_->Submit([this, state, work = std::move(work), failure_value]() {
    if (state->cancel_requested.load()) {
      stats_.Increment(Counter::kCancelled);
      AsyncOperation<T>::Complete(*state, failure_value, true);
      return;
    }
    bool cancelled = false;
    try {
      T result = work(&state->cancel_requested, &cancelled);
      AsyncOperation<T>::Complete(*state, std::move(result), cancelled);
    } catch (const std::exception& e) {
      Logger::Error(std::string("[FallbackCoordinator] async operation failed: ") + e.what());
      AsyncOperation<T>::Complete(*state, failure_value, false);
    }
  });
  if (!queued) {
    AsyncOperation<T>::Complete(*state, failure_value, true);
  }
  return operation;
}

AsyncOperation<bool> FallbackCoordinator::SafeWriteJSONAsync(Value data, std::string path) {
  const std::string key = util::NormalizePath(path);
  return SubmitAsync<bool>(
      [this, data = std::move(data), key](const std::atomic<bool>* cancel, bool* cancelled) {
        WriteOutcome outcome = WriteJSON(data, key, cancel);
        *cancelled = outcome.status == WriteStatus::kCancelled;
        return outcome.ok();
      },
      false);
}

AsyncOperation<bool> FallbackCoordinator::SafeWriteJSONLinesAsync(std::vector<Value> records,
                                                                  std::string path) {
  const std::string key = util::NormalizePath(path);
  return SubmitAsync<bool>(
      [this, records = std::move(records), key](const std::atomic<bool>* cancel,
                                                bool* cancelled) {
        WriteOutcome outcome = WriteJSONLines(records, key, cancel);
        *cancelled = outcome.status == WriteStatus::kCancelled;
        return outcome.ok();
      },
      false);
}

AsyncOperation<bool> FallbackCoordinator::SafeWriteCSVAsync(std::vector<Value> records,
                                                            std::string path) {
  const std::string key = util::NormalizePath(path);
  return SubmitAsync<bool>(
      [this, records = std::move(records), key](const std::atomic<bool>* cancel,
                                                bool* cancelled) {
        WriteOutcome outcome = WriteCSV(records, key, cancel);
        *cancelled = outcome.status == WriteStatus::kCancelled;
        return outcome.ok();
      },
      false);
}

AsyncOperation<std::optional<Json>> FallbackCoordinator::SafeReadJSONAsync(std::string path) {
  const std::string key = util::NormalizePath(path);
  return SubmitAsync<std::optional<Json>>(
      [this, key](const std::atomic<bool>* cancel, bool* cancelled) {
        ReadOutcome<Json> outcome = ReadJSON(key, cancel);
        *cancelled = outcome.status == ReadStatus::kCancelled;
        return outcome.data;
      },
      std::nullopt);
}

AsyncOperation<std::optional<std::vector<Json>>> FallbackCoordinator::SafeReadJSONLinesAsync(
    std::string path) {
  const std::string key = util::NormalizePath(path);
  return SubmitAsync<std::optional<std::vector<Json>>>(
      [this, key](const std::atomic<bool>* cancel, bool* cancelled) {
        ReadOutcome<std::vector<Json>> outcome = ReadJSONLines(key, cancel);
        *cancelled = outcome.status == ReadStatus::kCancelled;
        return outcome.data;
      },
      std::nullopt);
}

AsyncOperation<std::optional<std::vector<CsvRecord>>> FallbackCoordinator::SafeReadCSVAsync(
    std::string path) {
  const std::string key = util::NormalizePath(path);
  return SubmitAsync<std::optional<std::vector<CsvRecord>>>(
      [this, key](const std::atomic<bool>* cancel, bool* cancelled) {
        ReadOutcome<std::vector<CsvRecord>> outcome = ReadCSV(key, cancel);
        *cancelled = outcome.status == ReadStatus::kCancelled;
        return outcome.data;
      },
      std::nullopt);
}

// ---------------------------------------------------------------------------
// Management
// ---------------------------------------------------------------------------

void FallbackCoordinator::ClearAllCaches() {
  detector_.ClearCache();
  sanitizer_->ClearCache();
  Logger::Info("[FallbackCoordinator] caches cleared");
}

PerformanceStats FallbackCoordinator::GetPerformanceStats() const {
  PerformanceStats stats;
  stats_.FillSnapshot(&stats);
  stats.sanitizer_cache = sanitizer_->GetCacheStats();
  stats.validation_cache = detector_.GetCacheStats();
  stats.active_path_locks = path_locks_->ActivePaths();
  stats.lock_acquisitions = path_locks_->TotalAcquisitions();
  stats.lock_contended = path_locks_->ContendedAcquisitions();
  return stats;
}

void FallbackCoordinator::ResetStats() {
  stats_.Reset();
}

}  // namespace logvault::fallback
