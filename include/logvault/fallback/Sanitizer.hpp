// Repository: LogVault
// Component: Sanitizer
// Purpose: Converts record values into JSON-safe and CSV-safe forms. Never
//          fails; lossy conversions degrade to a string rendering.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_SANITIZER_HPP_
#define LOGVAULT_FALLBACK_SANITIZER_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

#include "logvault/fallback/FormatTypes.hpp"
#include "logvault/fallback/PerformanceStats.hpp"
#include "logvault/fallback/Value.hpp"

namespace logvault::fallback {

// Sanitizer
//
// Output of SanitizeForJSON contains only null, bool, numbers, valid UTF-8
// strings, arrays and objects, and feeding it back through Value::FromJson
// and SanitizeForJSON yields the same tree.
//
// Results for composite inputs (sequence, set, mapping, opaque) are memoized
// in a bounded FIFO cache keyed by CRC-32 of the value's canonical encoding.
// A hit is only used when the stored input compares equal to the new one.
//
// Thread-safe. Inputs must not be mutated by other threads during a call.
class Sanitizer {
 public:
  static constexpr size_t kDefaultCacheCapacity = 1000;

  // capacity 0 disables memoization.
  explicit Sanitizer(size_t cache_capacity = kDefaultCacheCapacity);

  Json SanitizeForJSON(const Value& value);
  std::string SanitizeForCSV(const Value& value);

  // Flattens a mapping (or an opaque object with attributes) into CSV fields.
  // Throws std::invalid_argument for any other kind.
  CsvRecord SanitizeRowForCSV(const Value& row);

  void ClearCache();
  [[nodiscard]] CacheStats GetCacheStats() const;

  // Uncached conversion.
  static Json ToJson(const Value& value);

  // CSV rendering of an already-sanitized JSON value: strings verbatim,
  // null empty, everything else compact JSON.
  static std::string JsonToCsvField(const Json& json);
  // Flattens a JSON object into a CSV record; non-objects yield {"value": ...}.
  static CsvRecord JsonToCsvRecord(const Json& json);

  // Decodes UTF-8, replacing each byte that is not part of a valid sequence
  // with the four characters \xHH.
  static std::string EscapeInvalidUtf8(const std::string& raw);
  static bool IsValidUtf8(const std::string& raw);

  static std::string FormatComplex(double real, double imag);
  // Shortest round-trip text; non-finite values as "nan", "inf", "-inf".
  static std::string FormatReal(double value);

 private:
  struct CacheEntry {
    Value input;
    Json output;
  };

  static uint64_t ContentKey(const Value& value);
  static std::string KeyToString(const Value& key);

  size_t capacity_;
  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, CacheEntry> cache_;
  std::deque<uint64_t> insertion_order_;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_SANITIZER_HPP_
