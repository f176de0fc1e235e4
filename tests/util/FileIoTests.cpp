// Repository: LogVault
// Component: File I/O helper tests
// Copyright (c) 2026 LogVault

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "logvault/util/FileIo.hpp"
#include "../support/ScratchDir.hpp"

namespace logvault::util {
namespace {

using test_support::ReadText;
using test_support::ScratchDir;
using test_support::WriteText;

TEST(FileIoTest, NormalizePathIsAbsoluteAndLexical) {
  EXPECT_EQ(NormalizePath("/var/log/../log/./app.json"), "/var/log/app.json");
  EXPECT_EQ(NormalizePath("relative.json").front(), '/');
  EXPECT_THROW(NormalizePath(""), std::invalid_argument);
}

TEST(FileIoTest, DirectoryAndBaseName) {
  EXPECT_EQ(DirectoryOf("/a/b/c.json"), "/a/b");
  EXPECT_EQ(DirectoryOf("c.json"), ".");
  EXPECT_EQ(BaseName("/a/b/c.json"), "c.json");
}

TEST(FileIoTest, AppendLineCreatesAndAppends) {
  ScratchDir dir("fileio_append");
  const std::string path = dir.File("x.error");
  std::string error;
  ASSERT_TRUE(AppendLine(path, "one", &error)) << error;
  ASSERT_TRUE(AppendLine(path, "two", &error)) << error;
  EXPECT_EQ(ReadText(path), "one\ntwo\n");

  EXPECT_FALSE(AppendLine(dir.File("missing/x.error"), "three", &error));
  EXPECT_FALSE(error.empty());
}

TEST(FileIoTest, ReadAndListFiles) {
  ScratchDir dir("fileio_list");
  WriteText(dir.File("b.json"), "B");
  WriteText(dir.File("a.json"), "A");
  EXPECT_EQ(ReadFileBytes(dir.File("a.json")).value_or(""), "A");
  EXPECT_FALSE(ReadFileBytes(dir.File("zzz")).has_value());
  EXPECT_TRUE(RegularFileExists(dir.File("a.json")));
  EXPECT_FALSE(RegularFileExists(dir.path()));

  std::vector<std::string> names = ListFileNames(dir.path());
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"a.json", "b.json"}));
  EXPECT_TRUE(ListFileNames(dir.File("nope")).empty());
}

TEST(FileIoTest, Iso8601Utc) {
  EXPECT_EQ(FormatIso8601Utc(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(FormatIso8601Utc(1792314902123), "2026-10-18T09:15:02.123Z");
}

}  // namespace
}  // namespace logvault::util
