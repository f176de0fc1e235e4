// Repository: LogVault
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission so lines from concurrent threads never interleave.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_UTIL_LOGGER_HPP_
#define LOGVAULT_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace logvault::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from coordinator threads, async workers and the
// data-loss protector never interleave.
//
// Info  → stdout (normal operational logs: backups created, restores)
// Debug → stdout only when LOGVAULT_DEBUG env is set (cache hits, lock waits)
// Warn  → stderr (degraded but recoverable: corruption detected, fallback write)
// Error → stderr (I/O failures, recovery exhausted)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that level (in addition to the stream). Tests use them to assert that a
// degraded read or a failed write was reported.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only: call with nullptr to clear.
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

  // True when LOGVAULT_DEBUG is set; lets callers skip building debug lines.
  static bool DebugEnabled();

 private:
  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace logvault::util

#endif  // LOGVAULT_UTIL_LOGGER_HPP_
