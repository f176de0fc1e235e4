// Repository: LogVault
// Component: Fallback Performance Stats
// Copyright (c) 2026 LogVault

#include "logvault/fallback/PerformanceStats.hpp"

#include <algorithm>
#include <sstream>

namespace logvault::fallback {

const char* OperationToString(Operation op) {
  switch (op) {
    case Operation::kWriteJson: return "write_json";
    case Operation::kWriteJsonLines: return "write_json_lines";
    case Operation::kWriteCsv: return "write_csv";
    case Operation::kReadJson: return "read_json";
    case Operation::kReadJsonLines: return "read_json_lines";
    case Operation::kReadCsv: return "read_csv";
    default: return "unknown";
  }
}

namespace {

void EmitCounter(std::ostringstream& oss, const char* name, const char* help,
                 uint64_t value) {
  oss << "# HELP " << name << " " << help << "\n";
  oss << "# TYPE " << name << " counter\n";
  oss << name << " " << value << "\n\n";
}

void EmitGauge(std::ostringstream& oss, const char* name, const char* help,
               double value) {
  oss << "# HELP " << name << " " << help << "\n";
  oss << "# TYPE " << name << " gauge\n";
  oss << name << " " << value << "\n\n";
}

void EmitCache(std::ostringstream& oss, const char* cache, const CacheStats& stats) {
  oss << "logvault_cache_entries{cache=\"" << cache << "\"} " << stats.size << "\n";
  oss << "logvault_cache_hits_total{cache=\"" << cache << "\"} " << stats.hits << "\n";
  oss << "logvault_cache_misses_total{cache=\"" << cache << "\"} " << stats.misses << "\n";
}

}  // namespace

std::string PerformanceStats::GeneratePrometheusText() const {
  std::ostringstream oss;

  oss << "# HELP logvault_cache_entries Current cache size\n";
  oss << "# TYPE logvault_cache_entries gauge\n";
  oss << "# HELP logvault_cache_hits_total Cache hits\n";
  oss << "# TYPE logvault_cache_hits_total counter\n";
  oss << "# HELP logvault_cache_misses_total Cache misses\n";
  oss << "# TYPE logvault_cache_misses_total counter\n";
  EmitCache(oss, "sanitizer", sanitizer_cache);
  EmitCache(oss, "validation", validation_cache);
  oss << "\n";

  EmitGauge(oss, "logvault_active_path_locks", "Path lock entries held or awaited",
            static_cast<double>(active_path_locks));
  EmitCounter(oss, "logvault_lock_acquisitions_total", "Path lock acquisitions",
              lock_acquisitions);
  EmitCounter(oss, "logvault_lock_contended_total", "Path lock acquisitions that waited",
              lock_contended);
  EmitCounter(oss, "logvault_lock_timeouts_total", "Path lock acquisitions that timed out",
              lock_timeouts);

  EmitCounter(oss, "logvault_backups_created_total", "Backups taken before writes",
              backups_created);
  EmitCounter(oss, "logvault_backup_failures_total", "Backups that could not be taken",
              backup_failures);
  EmitCounter(oss, "logvault_fallback_writes_total", "Writes diverted to the fallback file",
              fallback_writes);
  EmitCounter(oss, "logvault_failed_writes_total", "Writes that lost their data",
              failed_writes);
  EmitCounter(oss, "logvault_degraded_reads_total", "Reads served from recovery",
              degraded_reads);
  EmitCounter(oss, "logvault_backup_restores_total", "Reads served after a backup restore",
              backup_restores);
  EmitCounter(oss, "logvault_fallback_reads_total", "Reads served from the fallback file",
              fallback_reads);
  EmitCounter(oss, "logvault_absent_reads_total", "Reads with nothing salvageable",
              absent_reads);
  EmitCounter(oss, "logvault_cancelled_operations_total", "Async operations cancelled",
              cancelled_operations);

  oss << "# HELP logvault_operations_total Operations by kind\n";
  oss << "# TYPE logvault_operations_total counter\n";
  for (size_t i = 0; i < kOperationCount; ++i) {
    oss << "logvault_operations_total{op=\""
        << OperationToString(static_cast<Operation>(i)) << "\"} "
        << operations[i].count << "\n";
  }
  oss << "\n# HELP logvault_operation_failures_total Failed operations by kind\n";
  oss << "# TYPE logvault_operation_failures_total counter\n";
  for (size_t i = 0; i < kOperationCount; ++i) {
    oss << "logvault_operation_failures_total{op=\""
        << OperationToString(static_cast<Operation>(i)) << "\"} "
        << operations[i].failures << "\n";
  }
  oss << "\n# HELP logvault_operation_latency_us Operation latency (microseconds)\n";
  oss << "# TYPE logvault_operation_latency_us gauge\n";
  for (size_t i = 0; i < kOperationCount; ++i) {
    const char* op = OperationToString(static_cast<Operation>(i));
    oss << "logvault_operation_latency_mean_us{op=\"" << op << "\"} "
        << operations[i].MeanUs() << "\n";
    oss << "logvault_operation_latency_max_us{op=\"" << op << "\"} "
        << operations[i].max_us << "\n";
  }

  return oss.str();
}

void StatsRecorder::RecordOperation(Operation op, int64_t elapsed_us, bool ok) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& s = stats_.operations[static_cast<size_t>(op)];
  s.count++;
  if (!ok) s.failures++;
  s.total_us += elapsed_us;
  s.max_us = std::max(s.max_us, elapsed_us);
}

void StatsRecorder::Increment(Counter counter) {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (counter) {
    case Counter::kBackupCreated: stats_.backups_created++; break;
    case Counter::kBackupFailure: stats_.backup_failures++; break;
    case Counter::kFallbackWrite: stats_.fallback_writes++; break;
    case Counter::kFailedWrite: stats_.failed_writes++; break;
    case Counter::kDegradedRead: stats_.degraded_reads++; break;
    case Counter::kBackupRestore: stats_.backup_restores++; break;
    case Counter::kFallbackRead: stats_.fallback_reads++; break;
    case Counter::kAbsentRead: stats_.absent_reads++; break;
    case Counter::kCancelled: stats_.cancelled_operations++; break;
    case Counter::kLockTimeout: stats_.lock_timeouts++; break;
  }
}

void StatsRecorder::FillSnapshot(PerformanceStats* out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  out->backups_created = stats_.backups_created;
  out->backup_failures = stats_.backup_failures;
  out->fallback_writes = stats_.fallback_writes;
  out->failed_writes = stats_.failed_writes;
  out->degraded_reads = stats_.degraded_reads;
  out->backup_restores = stats_.backup_restores;
  out->fallback_reads = stats_.fallback_reads;
  out->absent_reads = stats_.absent_reads;
  out->cancelled_operations = stats_.cancelled_operations;
  out->lock_timeouts = stats_.lock_timeouts;
  out->operations = stats_.operations;
}

void StatsRecorder::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_ = PerformanceStats();
}

}  // namespace logvault::fallback
