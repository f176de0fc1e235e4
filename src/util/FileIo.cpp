// Repository: LogVault
// Component: File I/O helpers
// Copyright (c) 2026 LogVault

#include "logvault/util/FileIo.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace logvault::util {

namespace fs = std::filesystem;

std::optional<std::string> ReadFileBytes(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) return std::nullopt;
  return ss.str();
}

bool RegularFileExists(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode);
}

std::string NormalizePath(const std::string& path) {
  if (path.empty()) {
    throw std::invalid_argument("path must not be empty");
  }
  std::error_code ec;
  fs::path abs = fs::absolute(fs::path(path), ec);
  if (ec) abs = fs::path(path);
  return abs.lexically_normal().string();
}

std::string DirectoryOf(const std::string& path) {
  fs::path parent = fs::path(path).parent_path();
  return parent.empty() ? std::string(".") : parent.string();
}

std::string BaseName(const std::string& path) {
  return fs::path(path).filename().string();
}

std::vector<std::string> ListFileNames(const std::string& dir) {
  std::vector<std::string> names;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return names;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      names.push_back(it->path().filename().string());
    }
  }
  return names;
}

bool WriteAll(int fd, const char* data, size_t size) {
  size_t written = 0;
  while (written < size) {
    ssize_t n = ::write(fd, data + written, size - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

bool SyncDirectory(const std::string& dir) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0) return false;
  const bool ok = ::fsync(dir_fd) == 0;
  ::close(dir_fd);
  return ok;
}

bool AppendLine(const std::string& path, const std::string& line, std::string* error) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    if (error != nullptr) *error = "open " + path + ": " + ErrnoMessage(errno);
    return false;
  }
  std::string buf = line;
  buf.push_back('\n');
  const bool ok = WriteAll(fd, buf.data(), buf.size());
  const int write_errno = errno;
  ::close(fd);
  if (!ok && error != nullptr) {
    *error = "append " + path + ": " + ErrnoMessage(write_errno);
  }
  return ok;
}

bool RemoveFile(const std::string& path) {
  return ::unlink(path.c_str()) == 0;
}

std::string FormatIso8601Utc(int64_t utc_ms) {
  time_t s = static_cast<time_t>(utc_ms / 1000);
  int frac_ms = static_cast<int>(utc_ms % 1000);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return std::string();
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                        tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return std::string();
  return std::string(buf, static_cast<size_t>(n));
}

std::string ErrnoMessage(int err) {
  return std::system_category().message(err);
}

}  // namespace logvault::util
