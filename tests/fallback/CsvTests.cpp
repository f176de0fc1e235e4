// Repository: LogVault
// Component: CSV codec unit tests
// Copyright (c) 2026 LogVault

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "logvault/fallback/Csv.hpp"

namespace logvault::fallback {
namespace {

TEST(CsvTest, QuotedFieldsSpanLinesAndEscapeQuotes) {
  const std::string content = "a,b\n\"multi\nline\",\"say \"\"hi\"\"\"\n";
  std::vector<CsvRow> rows = ParseCsv(content, false);
  ASSERT_EQ(rows.size(), 2u);
  ASSERT_EQ(rows[1].fields.size(), 2u);
  EXPECT_EQ(rows[1].fields[0], "multi\nline");
  EXPECT_EQ(rows[1].fields[1], "say \"hi\"");
  EXPECT_FALSE(rows[1].malformed);
  EXPECT_EQ(rows[1].line, 2u);
}

TEST(CsvTest, BlankLinesAndCrlf) {
  std::vector<CsvRow> rows = ParseCsv("x,y\r\n\r\n1,2\r\n", false);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1].fields, (std::vector<std::string>{"1", "2"}));
  EXPECT_EQ(rows[1].line, 3u);
}

TEST(CsvTest, NoTrailingNewlineRequired) {
  std::vector<CsvRow> rows = ParseCsv("a\n1", false);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1].fields[0], "1");
}

TEST(CsvTest, UnterminatedQuoteIsMalformed) {
  std::vector<CsvRow> rows = ParseCsv("a,b\n\"open,1\n2,3\n", false);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_TRUE(rows.back().malformed);
}

TEST(CsvTest, ResyncContinuesAfterStrayQuote) {
  std::vector<CsvRow> rows = ParseCsv("a,b\n\"open,1\n2,3\n", true);
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_TRUE(rows[1].malformed);
  EXPECT_EQ(rows[1].line, 2u);
  EXPECT_FALSE(rows[2].malformed);
  EXPECT_EQ(rows[2].fields, (std::vector<std::string>{"2", "3"}));
  EXPECT_EQ(rows[2].line, 3u);
}

TEST(CsvTest, NulByteMarksRowMalformed) {
  std::vector<CsvRow> rows = ParseCsv(std::string("a\nb\0c\n", 6), false);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_FALSE(rows[0].malformed);
  EXPECT_TRUE(rows[1].malformed);
}

TEST(CsvTest, EncodeQuotesOnlyWhenNeeded) {
  EXPECT_EQ(EncodeCsvField("plain"), "plain");
  EXPECT_EQ(EncodeCsvField("a,b"), "\"a,b\"");
  EXPECT_EQ(EncodeCsvField("say \"x\""), "\"say \"\"x\"\"\"");
  EXPECT_EQ(EncodeCsvField("two\nlines"), "\"two\nlines\"");
  EXPECT_EQ(EncodeCsvRow({""}), "\"\"\n");
  EXPECT_EQ(EncodeCsvRow({"a", "", "c"}), "a,,c\n");
}

TEST(CsvTest, EncodeRecordsUsesFirstRecordHeader) {
  std::vector<CsvRecord> records = {
      {{"ts", "1"}, {"msg", "hello, world"}},
      {{"msg", "second"}},
  };
  std::string out;
  std::string error;
  ASSERT_TRUE(EncodeCsvRecords(records, &out, &error)) << error;
  EXPECT_EQ(out, "ts,msg\n1,\"hello, world\"\n,second\n");
}

TEST(CsvTest, EncodeRecordsRejectsUnknownKey) {
  std::vector<CsvRecord> records = {
      {{"ts", "1"}},
      {{"ts", "2"}, {"extra", "x"}},
  };
  std::string out = "stale";
  std::string error;
  EXPECT_FALSE(EncodeCsvRecords(records, &out, &error));
  EXPECT_TRUE(out.empty());
  EXPECT_NE(error.find("extra"), std::string::npos);
}

TEST(CsvTest, EncodedRowsParseBack) {
  std::vector<CsvRecord> records = {
      {{"k", "a\"b"}, {"v", "line1\r\nline2"}},
  };
  std::string out;
  ASSERT_TRUE(EncodeCsvRecords(records, &out, nullptr));
  std::vector<CsvRow> rows = ParseCsv(out, false);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[1].fields[0], "a\"b");
  EXPECT_EQ(rows[1].fields[1], "line1\r\nline2");
}

}  // namespace
}  // namespace logvault::fallback
