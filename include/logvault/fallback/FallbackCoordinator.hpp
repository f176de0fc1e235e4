// Repository: LogVault
// Component: Fallback Coordinator
// Purpose: Safe read/write facade for structured log files. Serializes
//          access per path, backs up before replacing, diverts failed writes
//          to a JSON Lines fallback file, and recovers damaged files on read.
// Copyright (c) 2026 LogVault
//
// Boundary contract: apart from std::invalid_argument for programmer errors
// (empty path, invalid config), nothing throws out of this class. A false or
// empty result means the data was not delivered.

#ifndef LOGVAULT_FALLBACK_FALLBACK_COORDINATOR_HPP_
#define LOGVAULT_FALLBACK_FALLBACK_COORDINATOR_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "logvault/fallback/AsyncOperation.hpp"
#include "logvault/fallback/AtomicWriter.hpp"
#include "logvault/fallback/BackupManager.hpp"
#include "logvault/fallback/CorruptionDetector.hpp"
#include "logvault/fallback/FallbackConfig.hpp"
#include "logvault/fallback/FormatTypes.hpp"
#include "logvault/fallback/PathLockTable.hpp"
#include "logvault/fallback/PerformanceStats.hpp"
#include "logvault/fallback/Sanitizer.hpp"
#include "logvault/fallback/Value.hpp"
#include "logvault/fallback/WorkerPool.hpp"
#include "logvault/time/ITimeSource.hpp"

namespace logvault::fallback {

enum class WriteStatus {
  kWritten,            // target replaced
  kWrittenToFallback,  // target write failed, data is in <path><fallback_extension>
  kFailed,             // data lost; see <path>.error
  kLockTimeout,
  kCancelled,
};

enum class ReadStatus {
  kClean,               // file valid, parsed as-is
  kRecovered,           // partial data salvaged from a damaged file
  kRestoredFromBackup,  // damaged file replaced by its newest valid backup
  kFromFallbackFile,    // served from <path><fallback_extension>
  kAbsent,              // nothing to return
  kLockTimeout,
  kCancelled,
};

const char* WriteStatusToString(WriteStatus status);
const char* ReadStatusToString(ReadStatus status);

struct WriteOutcome {
  WriteStatus status = WriteStatus::kFailed;
  std::string written_path;             // target or fallback file
  std::optional<BackupRecord> backup;   // taken before the write, if any
  std::string error;                    // first failure reason

  bool ok() const {
    return status == WriteStatus::kWritten || status == WriteStatus::kWrittenToFallback;
  }
};

template <typename T>
struct ReadOutcome {
  ReadStatus status = ReadStatus::kAbsent;
  std::optional<T> data;
  std::string source_path;  // file the data came from

  bool degraded() const { return data.has_value() && status != ReadStatus::kClean; }
};

// FallbackCoordinator
//
// Construct one per process (or per subsystem) and share it. Coordinators
// handed the same PathLockTable serialize on the same paths. A coordinator
// built without a table uses ProcessPathLockTable().
//
// JSON reads return the parsed document when the file is clean. Recovered
// and fallback-file reads return a JSON array of the salvaged records.
class FallbackCoordinator {
 public:
  // Throws std::invalid_argument if config.Validate() does.
  explicit FallbackCoordinator(FallbackConfig config = FallbackConfig(),
                               std::shared_ptr<PathLockTable> path_locks = nullptr,
                               std::shared_ptr<time::ITimeSource> time_source = nullptr);
  ~FallbackCoordinator();

  FallbackCoordinator(const FallbackCoordinator&) = delete;
  FallbackCoordinator& operator=(const FallbackCoordinator&) = delete;

  // ---- Synchronous ----
  bool SafeWriteJSON(const Value& data, const std::string& path);
  bool SafeWriteJSONLines(const std::vector<Value>& records, const std::string& path);
  bool SafeWriteCSV(const std::vector<Value>& records, const std::string& path);

  std::optional<Json> SafeReadJSON(const std::string& path);
  std::optional<std::vector<Json>> SafeReadJSONLines(const std::string& path);
  std::optional<std::vector<CsvRecord>> SafeReadCSV(const std::string& path);

  // ---- Detailed (cancel is polled only while waiting for the path lock) ----
  WriteOutcome WriteJSON(const Value& data, const std::string& path,
                         const std::atomic<bool>* cancel = nullptr);
  WriteOutcome WriteJSONLines(const std::vector<Value>& records, const std::string& path,
                              const std::atomic<bool>* cancel = nullptr);
  WriteOutcome WriteCSV(const std::vector<Value>& records, const std::string& path,
                        const std::atomic<bool>* cancel = nullptr);

  ReadOutcome<Json> ReadJSON(const std::string& path,
                             const std::atomic<bool>* cancel = nullptr);
  ReadOutcome<std::vector<Json>> ReadJSONLines(const std::string& path,
                                               const std::atomic<bool>* cancel = nullptr);
  ReadOutcome<std::vector<CsvRecord>> ReadCSV(const std::string& path,
                                              const std::atomic<bool>* cancel = nullptr);

  // ---- Asynchronous (run on the coordinator's worker pool) ----
  AsyncOperation<bool> SafeWriteJSONAsync(Value data, std::string path);
  AsyncOperation<bool> SafeWriteJSONLinesAsync(std::vector<Value> records, std::string path);
  AsyncOperation<bool> SafeWriteCSVAsync(std::vector<Value> records, std::string path);

  AsyncOperation<std::optional<Json>> SafeReadJSONAsync(std::string path);
  AsyncOperation<std::optional<std::vector<Json>>> SafeReadJSONLinesAsync(std::string path);
  AsyncOperation<std::optional<std::vector<CsvRecord>>> SafeReadCSVAsync(std::string path);

  // ---- Management ----
  // Resets the validation and sanitizer caches.
  void ClearAllCaches();
  [[nodiscard]] PerformanceStats GetPerformanceStats() const;
  void ResetStats();

  std::string FallbackPathFor(const std::string& path) const;
  std::string ErrorLogPathFor(const std::string& path) const;

  const FallbackConfig& config() const { return config_; }
  CorruptionDetector& detector() { return detector_; }
  Sanitizer& sanitizer() { return *sanitizer_; }
  BackupManager& backups() { return backups_; }
  const std::shared_ptr<PathLockTable>& path_locks() const { return path_locks_; }

 private:
  using PrimaryWriteFn = std::function<bool(const std::string& target, std::string* error)>;

  WriteOutcome RunWrite(Operation op, const std::string& path,
                        const PrimaryWriteFn& write_primary,
                        const std::vector<Json>& fallback_records,
                        const std::atomic<bool>* cancel);

  template <typename T>
  ReadOutcome<T> RunRead(Operation op, Format format, const std::string& path,
                         const std::function<std::optional<T>(const std::string&)>& parse,
                         const std::function<std::optional<T>(const std::string&)>& recover,
                         const std::function<T(std::vector<Json>)>& from_fallback,
                         const std::atomic<bool>* cancel);

  template <typename T>
  AsyncOperation<T> SubmitAsync(
      std::function<T(const std::atomic<bool>* cancel, bool* cancelled)> work,
      T failure_value);

  PathLockTable::Guard LockPath(const std::string& key, const std::atomic<bool>* cancel);
  std::optional<std::vector<Json>> ReadFallbackFile(const std::string& key);
  void AppendErrorLog(const std::string& key, Operation op, const std::string& stage,
                      const std::string& reason);

  FallbackConfig config_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::shared_ptr<PathLockTable> path_locks_;
  std::shared_ptr<Sanitizer> sanitizer_;
  CorruptionDetector detector_;
  AtomicWriter writer_;
  BackupManager backups_;
  StatsRecorder stats_;

  // Declared last: destroyed (drained and joined) before everything above.
  std::unique_ptr<WorkerPool> pool_;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_FALLBACK_COORDINATOR_HPP_
