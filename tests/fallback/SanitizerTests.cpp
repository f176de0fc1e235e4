// Repository: LogVault
// Component: Sanitizer unit tests
// Copyright (c) 2026 LogVault

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "logvault/fallback/Sanitizer.hpp"
#include "logvault/fallback/Value.hpp"

namespace logvault::fallback {
namespace {

Value NestedRecord() {
  return Value::Map({
      {"level", "ERROR"},
      {"count", 3},
      {"ratio", std::numeric_limits<double>::quiet_NaN()},
      {"payload", Value::Bytes(std::string("ok\xff", 3))},
      {"tags", Value::Set({"a", "b"})},
      {"z", Value::Complex(1.0, 2.0)},
  });
}

// -----------------------------------------------------------------------------
// JSON conversion
// -----------------------------------------------------------------------------
TEST(SanitizerTest, PrimitivesPassThrough) {
  Sanitizer sanitizer;
  EXPECT_TRUE(sanitizer.SanitizeForJSON(Value()).is_null());
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value(true)), Json(true));
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value(-7)), Json(-7));
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value(2.5)), Json(2.5));
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value("text")), Json("text"));
}

TEST(SanitizerTest, NonFiniteRealsBecomeStrings) {
  Sanitizer sanitizer;
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value(std::nan(""))), Json("nan"));
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value(std::numeric_limits<double>::infinity())),
            Json("inf"));
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value(-std::numeric_limits<double>::infinity())),
            Json("-inf"));
}

TEST(SanitizerTest, BytesDecodeOrEscape) {
  Sanitizer sanitizer;
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value::Bytes("hello")), Json("hello"));
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value::Bytes(std::string("\xff" "A", 2))),
            Json("\\xffA"));
  // Truncated multi-byte sequence.
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value::Bytes(std::string("\xc3", 1))), Json("\\xc3"));
  // Valid two-byte sequence survives.
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value::Bytes("caf\xc3\xa9")), Json("caf\xc3\xa9"));
}

TEST(SanitizerTest, InvalidUtf8StringIsEscaped) {
  Sanitizer sanitizer;
  Json out = sanitizer.SanitizeForJSON(Value(std::string("a\x80z", 3)));
  EXPECT_EQ(out, Json("a\\x80z"));
  EXPECT_NO_THROW(out.dump());
}

TEST(SanitizerTest, ComplexUsesCanonicalForm) {
  EXPECT_EQ(Sanitizer::FormatComplex(1.0, 2.0), "(1+2j)");
  EXPECT_EQ(Sanitizer::FormatComplex(1.5, -2.0), "(1.5-2j)");
  EXPECT_EQ(Sanitizer::FormatComplex(0.0, 0.0), "(0+0j)");
}

TEST(SanitizerTest, ContainersConvertRecursively) {
  Sanitizer sanitizer;
  Json out = sanitizer.SanitizeForJSON(NestedRecord());
  ASSERT_TRUE(out.is_object());
  EXPECT_EQ(out["level"], "ERROR");
  EXPECT_EQ(out["count"], 3);
  EXPECT_EQ(out["ratio"], "nan");
  EXPECT_EQ(out["payload"], "ok\\xff");
  EXPECT_EQ(out["tags"], Json::array({"a", "b"}));
  EXPECT_EQ(out["z"], "(1+2j)");
}

TEST(SanitizerTest, MappingKeysRenderedAsStrings) {
  Sanitizer sanitizer;
  Value mapping = Value::Mapping({{Value(1), Value("one")}, {Value(true), Value(2)}});
  Json out = sanitizer.SanitizeForJSON(mapping);
  ASSERT_TRUE(out.is_object());
  EXPECT_EQ(out["1"], "one");
  EXPECT_EQ(out["true"], 2);
}

TEST(SanitizerTest, OpaqueObjects) {
  Sanitizer sanitizer;
  EXPECT_EQ(sanitizer.SanitizeForJSON(Value::Opaque("Widget", "<Widget 7>")),
            Json("<Widget 7>"));

  Value with_fields =
      Value::Opaque("Point", "Point(1, 2)", {{Value("x"), Value(1)}, {Value("y"), Value(2)}});
  Json out = sanitizer.SanitizeForJSON(with_fields);
  EXPECT_EQ(out, Json({{"x", 1}, {"y", 2}}));
}

TEST(SanitizerTest, SanitizationIsIdempotent) {
  Sanitizer sanitizer;
  Json once = sanitizer.SanitizeForJSON(NestedRecord());
  Json twice = sanitizer.SanitizeForJSON(Value::FromJson(once));
  EXPECT_EQ(once, twice);
}

// -----------------------------------------------------------------------------
// CSV conversion
// -----------------------------------------------------------------------------
TEST(SanitizerTest, CsvScalars) {
  Sanitizer sanitizer;
  EXPECT_EQ(sanitizer.SanitizeForCSV(Value()), "");
  EXPECT_EQ(sanitizer.SanitizeForCSV(Value(false)), "false");
  EXPECT_EQ(sanitizer.SanitizeForCSV(Value(42)), "42");
  EXPECT_EQ(sanitizer.SanitizeForCSV(Value(std::nan(""))), "nan");
  EXPECT_EQ(sanitizer.SanitizeForCSV(Value("plain")), "plain");
  EXPECT_EQ(sanitizer.SanitizeForCSV(Value::Complex(3.0, -1.0)), "(3-1j)");
}

TEST(SanitizerTest, CsvContainersRenderAsCompactJson) {
  Sanitizer sanitizer;
  EXPECT_EQ(sanitizer.SanitizeForCSV(Value::Sequence({1, 2, 3})), "[1,2,3]");
  EXPECT_EQ(sanitizer.SanitizeForCSV(Value::Map({{"k", "v"}})), "{\"k\":\"v\"}");
}

TEST(SanitizerTest, CsvRowKeepsFieldOrder) {
  Sanitizer sanitizer;
  CsvRecord row = sanitizer.SanitizeRowForCSV(
      Value::Map({{"ts", "2026-10-18"}, {"level", "WARN"}, {"n", 5}}));
  ASSERT_EQ(row.size(), 3u);
  EXPECT_EQ(row[0].first, "ts");
  EXPECT_EQ(row[1].first, "level");
  EXPECT_EQ(row[2].first, "n");
  EXPECT_EQ(row[2].second, "5");
}

TEST(SanitizerTest, CsvRowRejectsNonMapping) {
  Sanitizer sanitizer;
  EXPECT_THROW(sanitizer.SanitizeRowForCSV(Value(3)), std::invalid_argument);
  EXPECT_THROW(sanitizer.SanitizeRowForCSV(Value::Sequence({1})), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Cache
// -----------------------------------------------------------------------------
TEST(SanitizerTest, RepeatedContainerHitsCache) {
  Sanitizer sanitizer(10);
  Value record = NestedRecord();
  Json first = sanitizer.SanitizeForJSON(record);
  Json second = sanitizer.SanitizeForJSON(record);
  EXPECT_EQ(first, second);

  CacheStats stats = sanitizer.GetCacheStats();
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_EQ(stats.misses, 1u);
  EXPECT_EQ(stats.size, 1u);
  EXPECT_DOUBLE_EQ(stats.HitRate(), 0.5);
}

TEST(SanitizerTest, ScalarsBypassCache) {
  Sanitizer sanitizer(10);
  sanitizer.SanitizeForJSON(Value(1));
  sanitizer.SanitizeForJSON(Value("x"));
  CacheStats stats = sanitizer.GetCacheStats();
  EXPECT_EQ(stats.size, 0u);
  EXPECT_EQ(stats.hits + stats.misses, 0u);
}

TEST(SanitizerTest, CacheEvictsOldestAtCapacity) {
  Sanitizer sanitizer(2);
  Value a = Value::Map({{"id", 1}});
  Value b = Value::Map({{"id", 2}});
  Value c = Value::Map({{"id", 3}});
  sanitizer.SanitizeForJSON(a);
  sanitizer.SanitizeForJSON(b);
  sanitizer.SanitizeForJSON(c);
  EXPECT_EQ(sanitizer.GetCacheStats().size, 2u);

  // `a` was evicted, `c` is still cached.
  sanitizer.SanitizeForJSON(c);
  EXPECT_EQ(sanitizer.GetCacheStats().hits, 1u);
  sanitizer.SanitizeForJSON(a);
  EXPECT_EQ(sanitizer.GetCacheStats().hits, 1u);
}

TEST(SanitizerTest, EqualContentSharesEntryDistinctContentDoesNot) {
  Sanitizer sanitizer(10);
  sanitizer.SanitizeForJSON(Value::Map({{"k", 1}}));
  sanitizer.SanitizeForJSON(Value::Map({{"k", 1}}));
  sanitizer.SanitizeForJSON(Value::Map({{"k", 2}}));
  CacheStats stats = sanitizer.GetCacheStats();
  EXPECT_EQ(stats.hits, 1u);
  EXPECT_EQ(stats.size, 2u);
}

TEST(SanitizerTest, ZeroCapacityDisablesCache) {
  Sanitizer sanitizer(0);
  sanitizer.SanitizeForJSON(NestedRecord());
  sanitizer.SanitizeForJSON(NestedRecord());
  EXPECT_EQ(sanitizer.GetCacheStats().hits, 0u);
  EXPECT_EQ(sanitizer.GetCacheStats().size, 0u);
}

TEST(SanitizerTest, ClearCacheResetsCounters) {
  Sanitizer sanitizer(10);
  sanitizer.SanitizeForJSON(NestedRecord());
  sanitizer.SanitizeForJSON(NestedRecord());
  sanitizer.ClearCache();
  CacheStats stats = sanitizer.GetCacheStats();
  EXPECT_EQ(stats.size, 0u);
  EXPECT_EQ(stats.hits, 0u);
  EXPECT_EQ(stats.misses, 0u);
}

}  // namespace
}  // namespace logvault::fallback
