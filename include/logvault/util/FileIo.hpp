// Repository: LogVault
// Component: File I/O helpers
// Purpose: Thin POSIX wrappers shared by the writer, backup and coordinator
//          paths. None of these throw on I/O failure.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_UTIL_FILE_IO_HPP_
#define LOGVAULT_UTIL_FILE_IO_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace logvault::util {

// Whole-file read. nullopt if the file is missing or unreadable.
std::optional<std::string> ReadFileBytes(const std::string& path);

bool RegularFileExists(const std::string& path);

// Absolute, lexically normal form used as the key for locks and caches.
// Throws std::invalid_argument on an empty path.
std::string NormalizePath(const std::string& path);

// Parent directory ("." for a bare file name).
std::string DirectoryOf(const std::string& path);
std::string BaseName(const std::string& path);

// Names (not paths) of regular files directly inside `dir`. Empty on error.
std::vector<std::string> ListFileNames(const std::string& dir);

// Handles short writes and EINTR.
bool WriteAll(int fd, const char* data, size_t size);

// fsync of the directory entry table, making a completed rename durable.
bool SyncDirectory(const std::string& dir);

// Appends `line` plus '\n' with O_APPEND. Creates the file if needed.
bool AppendLine(const std::string& path, const std::string& line, std::string* error);

bool RemoveFile(const std::string& path);

// "2026-10-18T09:15:02.123Z"
std::string FormatIso8601Utc(int64_t utc_ms);

std::string ErrnoMessage(int err);

}  // namespace logvault::util

#endif  // LOGVAULT_UTIL_FILE_IO_HPP_
