// Repository: LogVault
// Component: Fallback Configuration
// Copyright (c) 2026 LogVault

#include "logvault/fallback/FallbackConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace logvault::fallback {

namespace {

const char* Env(const char* name) {
  const char* v = std::getenv(name);
  return (v != nullptr && v[0] != '\0') ? v : nullptr;
}

[[noreturn]] void BadValue(const char* name, const char* value) {
  throw std::invalid_argument(std::string(name) + ": cannot parse '" + value + "'");
}

void ReadBool(const char* name, bool* out) {
  const char* v = Env(name);
  if (v == nullptr) return;
  std::string s(v);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "1" || s == "true" || s == "yes" || s == "on") {
    *out = true;
  } else if (s == "0" || s == "false" || s == "no" || s == "off") {
    *out = false;
  } else {
    BadValue(name, v);
  }
}

template <typename T>
void ReadInt(const char* name, T* out) {
  const char* v = Env(name);
  if (v == nullptr) return;
  char* end = nullptr;
  errno = 0;
  const long long parsed = std::strtoll(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0') BadValue(name, v);
  *out = static_cast<T>(parsed);
}

void ReadSize(const char* name, size_t* out) {
  const char* v = Env(name);
  if (v == nullptr) return;
  char* end = nullptr;
  errno = 0;
  const long long parsed = std::strtoll(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0' || parsed < 0) BadValue(name, v);
  *out = static_cast<size_t>(parsed);
}

void ReadString(const char* name, std::string* out) {
  const char* v = Env(name);
  if (v != nullptr) *out = v;
}

}  // namespace

FallbackConfig FallbackConfig::FromEnvironment() {
  FallbackConfig config;
  ReadInt("LOGVAULT_VALIDATION_TTL_MS", &config.validation_ttl_ms);
  ReadSize("LOGVAULT_SANITIZER_CACHE", &config.sanitizer_cache_capacity);
  ReadBool("LOGVAULT_BACKUP_ON_WRITE", &config.backup_on_write);
  ReadString("LOGVAULT_BACKUP_SUFFIX", &config.backup_suffix);
  ReadString("LOGVAULT_BACKUP_DIR", &config.backup_dir);
  ReadBool("LOGVAULT_RESTORE_BACKUP_ON_READ", &config.restore_backup_on_read);
  ReadBool("LOGVAULT_FALLBACK_ENABLED", &config.fallback_enabled);
  ReadString("LOGVAULT_FALLBACK_EXTENSION", &config.fallback_extension);
  ReadBool("LOGVAULT_READ_FALLBACK_FILE", &config.read_fallback_file);
  ReadBool("LOGVAULT_ERROR_LOG", &config.error_log_enabled);
  ReadInt("LOGVAULT_LOCK_TIMEOUT_MS", &config.lock_timeout_ms);
  ReadBool("LOGVAULT_INTERPROCESS_LOCK", &config.interprocess_lock);
  ReadSize("LOGVAULT_ASYNC_WORKERS", &config.async_workers);
  ReadBool("LOGVAULT_FSYNC", &config.fsync);
  ReadInt("LOGVAULT_JSON_INDENT", &config.json_indent);
  return config;
}

void FallbackConfig::Validate() const {
  if (validation_ttl_ms < 0) {
    throw std::invalid_argument("validation_ttl_ms must be >= 0");
  }
  if (sanitizer_cache_capacity == 0) {
    throw std::invalid_argument("sanitizer_cache_capacity must be > 0");
  }
  if (backup_suffix.empty()) {
    throw std::invalid_argument("backup_suffix must not be empty");
  }
  if (fallback_extension.empty()) {
    throw std::invalid_argument("fallback_extension must not be empty");
  }
  if (lock_timeout_ms < 0) {
    throw std::invalid_argument("lock_timeout_ms must be >= 0");
  }
  if (async_workers == 0) {
    throw std::invalid_argument("async_workers must be > 0");
  }
  if (json_indent < -1) {
    throw std::invalid_argument("json_indent must be >= -1");
  }
}

}  // namespace logvault::fallback
