// Repository: LogVault
// Component: Fallback Configuration unit tests
// Copyright (c) 2026 LogVault

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "logvault/fallback/FallbackConfig.hpp"

namespace logvault::fallback {
namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() { ::unsetenv(name_); }

 private:
  const char* name_;
};

TEST(FallbackConfigTest, Defaults) {
  FallbackConfig config;
  EXPECT_EQ(config.validation_ttl_ms, 60000);
  EXPECT_EQ(config.sanitizer_cache_capacity, 1000u);
  EXPECT_TRUE(config.backup_on_write);
  EXPECT_EQ(config.backup_suffix, ".backup");
  EXPECT_FALSE(config.restore_backup_on_read);
  EXPECT_TRUE(config.fallback_enabled);
  EXPECT_EQ(config.lock_timeout_ms, 0);
  EXPECT_NO_THROW(config.Validate());
}

TEST(FallbackConfigTest, EnvironmentOverrides) {
  ScopedEnv ttl("LOGVAULT_VALIDATION_TTL_MS", "250");
  ScopedEnv backup("LOGVAULT_BACKUP_ON_WRITE", "off");
  ScopedEnv restore("LOGVAULT_RESTORE_BACKUP_ON_READ", "Yes");
  ScopedEnv ext("LOGVAULT_FALLBACK_EXTENSION", ".rescue");
  ScopedEnv workers("LOGVAULT_ASYNC_WORKERS", "4");

  FallbackConfig config = FallbackConfig::FromEnvironment();
  EXPECT_EQ(config.validation_ttl_ms, 250);
  EXPECT_FALSE(config.backup_on_write);
  EXPECT_TRUE(config.restore_backup_on_read);
  EXPECT_EQ(config.fallback_extension, ".rescue");
  EXPECT_EQ(config.async_workers, 4u);
  // Untouched fields keep their defaults.
  EXPECT_EQ(config.backup_suffix, ".backup");
}

TEST(FallbackConfigTest, EmptyVariableIgnored) {
  ScopedEnv suffix("LOGVAULT_BACKUP_SUFFIX", "");
  EXPECT_EQ(FallbackConfig::FromEnvironment().backup_suffix, ".backup");
}

TEST(FallbackConfigTest, UnparseableVariableNamed) {
  ScopedEnv bad("LOGVAULT_LOCK_TIMEOUT_MS", "soon");
  try {
    FallbackConfig::FromEnvironment();
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    EXPECT_NE(std::string(e.what()).find("LOGVAULT_LOCK_TIMEOUT_MS"), std::string::npos);
  }
}

TEST(FallbackConfigTest, BadBoolRejected) {
  ScopedEnv bad("LOGVAULT_FSYNC", "maybe");
  EXPECT_THROW(FallbackConfig::FromEnvironment(), std::invalid_argument);
}

TEST(FallbackConfigTest, NegativeSizeRejected) {
  ScopedEnv bad("LOGVAULT_SANITIZER_CACHE", "-3");
  EXPECT_THROW(FallbackConfig::FromEnvironment(), std::invalid_argument);
}

TEST(FallbackConfigTest, ValidateRejectsBadFields) {
  FallbackConfig config;
  config.validation_ttl_ms = -1;
  EXPECT_THROW(config.Validate(), std::invalid_argument);

  config = FallbackConfig();
  config.backup_suffix.clear();
  EXPECT_THROW(config.Validate(), std::invalid_argument);

  config = FallbackConfig();
  config.fallback_extension.clear();
  EXPECT_THROW(config.Validate(), std::invalid_argument);

  config = FallbackConfig();
  config.async_workers = 0;
  EXPECT_THROW(config.Validate(), std::invalid_argument);

  config = FallbackConfig();
  config.lock_timeout_ms = -5;
  EXPECT_THROW(config.Validate(), std::invalid_argument);
}

}  // namespace
}  // namespace logvault::fallback
