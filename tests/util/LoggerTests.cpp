// Repository: LogVault
// Component: Logger tests
// Copyright (c) 2026 LogVault

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "logvault/fallback/FallbackCoordinator.hpp"
#include "logvault/util/Logger.hpp"
#include "../support/ScratchDir.hpp"

namespace logvault::util {
namespace {

class LoggerSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::SetWarnSink([this](const std::string& line) { warnings_.push_back(line); });
    Logger::SetErrorSink([this](const std::string& line) { errors_.push_back(line); });
  }

  void TearDown() override {
    Logger::SetWarnSink(nullptr);
    Logger::SetErrorSink(nullptr);
  }

  bool SawWarning(const std::string& needle) const {
    for (const auto& line : warnings_) {
      if (line.find(needle) != std::string::npos) return true;
    }
    return false;
  }

  std::vector<std::string> warnings_;
  std::vector<std::string> errors_;
};

TEST_F(LoggerSinkTest, SinksReceiveLines) {
  Logger::Warn("[Test] warn line");
  Logger::Error("[Test] error line");
  ASSERT_EQ(warnings_.size(), 1u);
  EXPECT_EQ(warnings_[0], "[Test] warn line");
  ASSERT_EQ(errors_.size(), 1u);
}

TEST_F(LoggerSinkTest, CoordinatorReportsDegradedPaths) {
  test_support::ScratchDir dir("logger_coordinator");
  const std::string path = dir.File("occupied");
  std::filesystem::create_directory(path);

  fallback::FallbackConfig config;
  config.fsync = false;
  config.fallback_enabled = false;
  fallback::FallbackCoordinator coordinator(config);
  EXPECT_FALSE(coordinator.SafeWriteJSON(fallback::Value::Map({{"a", 1}}), path));

  EXPECT_TRUE(SawWarning("[FallbackCoordinator] WRITE_FAILED"));
  ASSERT_FALSE(errors_.empty());
  EXPECT_NE(errors_.back().find("WRITE_LOST"), std::string::npos);
}

}  // namespace
}  // namespace logvault::util
