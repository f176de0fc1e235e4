// Repository: LogVault
// Component: Recovery unit tests
// Copyright (c) 2026 LogVault

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "logvault/fallback/Recovery.hpp"
#include "../support/ScratchDir.hpp"

namespace logvault::fallback {
namespace {

using test_support::ScratchDir;
using test_support::WriteText;

size_t CountOrZero(const std::optional<std::vector<Json>>& records) {
  return records.has_value() ? records->size() : 0;
}

// -----------------------------------------------------------------------------
// JSON
// -----------------------------------------------------------------------------
TEST(RecoveryTest, ValidArrayYieldsElements) {
  auto records = Recovery::RecoverJSONContent("[{\"a\":1},{\"b\":2}]");
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 2u);
  EXPECT_EQ((*records)[1]["b"], 2);
}

TEST(RecoveryTest, ValidObjectYieldsItself) {
  auto records = Recovery::RecoverJSONContent("{\"a\":1}");
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 1u);
  EXPECT_EQ((*records)[0]["a"], 1);
}

TEST(RecoveryTest, CorruptAppendKeepsLeadingDocument) {
  auto records = Recovery::RecoverJSONContent("{\"a\":1}{\"b\":2");
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 1u);
  EXPECT_EQ((*records)[0], Json({{"a", 1}}));
}

TEST(RecoveryTest, ConcatenatedDocumentsAllKept) {
  auto records = Recovery::RecoverJSONContent("{\"a\":1}\n{\"b\":2}\n{\"c\":");
  ASSERT_TRUE(records.has_value());
  EXPECT_EQ(records->size(), 2u);
}

TEST(RecoveryTest, TruncatedArrayKeepsCompleteElements) {
  auto records = Recovery::RecoverJSONContent("[{\"a\":1},{\"b\":\"x]}\"},{\"c\":");
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 2u);
  EXPECT_EQ((*records)[1]["b"], "x]}");
}

TEST(RecoveryTest, TruncatedScalarArrayDropsCutTail) {
  auto records = Recovery::RecoverJSONContent("[1, 2, 3");
  ASSERT_TRUE(records.has_value());
  EXPECT_EQ(*records, (std::vector<Json>{1, 2}));
}

TEST(RecoveryTest, FallsBackToValidLines) {
  auto records = Recovery::RecoverJSONContent("garbage\n{\"a\":1}\nmore garbage\n[2]\n");
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 2u);
  EXPECT_EQ((*records)[1], Json::array({2}));
}

TEST(RecoveryTest, NothingSalvageableIsNullopt) {
  EXPECT_FALSE(Recovery::RecoverJSONContent("").has_value());
  EXPECT_FALSE(Recovery::RecoverJSONContent("{{{{").has_value());
  EXPECT_FALSE(Recovery::RecoverJSONContent("\x01\x02\x03").has_value());
}

TEST(RecoveryTest, TruncatedJsonArrayKeepsCompleteElements) {
  const std::string damaged = "[{\"i\":0},{\"i\":1},{\"i\":";
  EXPECT_EQ(CountOrZero(Recovery::RecoverJSONContent(damaged)), 2u);
  EXPECT_EQ(CountOrZero(Recovery::RecoverJSONContent("{\"i\":0}{\"i\":1}")), 2u);
}

TEST(RecoveryTest, JsonLinesTruncatedAtEveryBoundaryKeepsExactPrefix) {
  constexpr int kLines = 8;
  std::vector<Json> records;
  std::vector<std::string> lines;
  for (int i = 0; i < kLines; ++i) {
    records.push_back(Json({{"i", i}, {"msg", "line " + std::to_string(i)}}));
    lines.push_back(records.back().dump() + "\n");
  }

  std::string prefix;
  for (int k = 0; k <= kLines; ++k) {
    std::optional<std::vector<Json>> whole = Recovery::RecoverJSONLinesContent(prefix);
    if (k == 0) {
      EXPECT_FALSE(whole.has_value());
    } else {
      ASSERT_TRUE(whole.has_value()) << "k=" << k;
      EXPECT_EQ(*whole, std::vector<Json>(records.begin(), records.begin() + k)) << "k=" << k;
    }

    if (k < kLines) {
      // Cut inside the next line: the partial line is dropped.
      const std::string cut = prefix + lines[k].substr(0, lines[k].size() / 2);
      EXPECT_EQ(CountOrZero(Recovery::RecoverJSONLinesContent(cut)), static_cast<size_t>(k))
          << "k=" << k;
      prefix += lines[k];
    }
  }
}

// -----------------------------------------------------------------------------
// JSON Lines
// -----------------------------------------------------------------------------
TEST(RecoveryTest, JsonLinesSkipsBadLines) {
  auto records = Recovery::RecoverJSONLinesContent("{\"a\":1}\n{\"b\":\n\n{\"c\":3}\r\n");
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 2u);
  EXPECT_EQ((*records)[1]["c"], 3);
}

TEST(RecoveryTest, JsonLinesAllBadIsNullopt) {
  EXPECT_FALSE(Recovery::RecoverJSONLinesContent("x\ny\n").has_value());
}

// -----------------------------------------------------------------------------
// CSV
// -----------------------------------------------------------------------------
TEST(RecoveryTest, CsvResyncsAfterStrayQuote) {
  auto records = Recovery::RecoverCSVContent("a,b\n1,2\n\"bad,3\n4,5\n");
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 2u);
  const std::string* b = FindField((*records)[1], "b");
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(*b, "5");
}

TEST(RecoveryTest, CsvSkipsWrongWidthRows) {
  auto records = Recovery::RecoverCSVContent("a,b\n1\n2,3\n4,5,6\n");
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 1u);
  EXPECT_EQ(*FindField((*records)[0], "a"), "2");
}

TEST(RecoveryTest, CsvHeaderOnlyIsNullopt) {
  EXPECT_FALSE(Recovery::RecoverCSVContent("a,b\n").has_value());
  EXPECT_FALSE(Recovery::RecoverCSVContent("").has_value());
}

// -----------------------------------------------------------------------------
// Files
// -----------------------------------------------------------------------------
TEST(RecoveryTest, FileEntryPoints) {
  ScratchDir dir("recovery_files");
  WriteText(dir.File("a.json"), "[{\"x\":1},");
  WriteText(dir.File("a.jsonl"), "{\"x\":1}\n{oops\n");
  WriteText(dir.File("a.csv"), "x\n1\n");

  EXPECT_EQ(CountOrZero(Recovery::RecoverJSONFile(dir.File("a.json"))), 1u);
  EXPECT_EQ(CountOrZero(Recovery::RecoverJSONLinesFile(dir.File("a.jsonl"))), 1u);
  auto csv = Recovery::RecoverCSVFile(dir.File("a.csv"));
  ASSERT_TRUE(csv.has_value());
  EXPECT_EQ(csv->size(), 1u);
  EXPECT_FALSE(Recovery::RecoverJSONFile(dir.File("missing.json")).has_value());
}

}  // namespace
}  // namespace logvault::fallback
