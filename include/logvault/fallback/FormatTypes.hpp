// Repository: LogVault
// Component: Structured format types
// Purpose: Shared JSON/CSV record types and the format tag used across the
//          fallback layer.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_FORMAT_TYPES_HPP_
#define LOGVAULT_FALLBACK_FORMAT_TYPES_HPP_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace logvault::fallback {

// Insertion-ordered JSON: object keys keep the order they were produced in,
// so a CSV header derived from the first record matches what the caller built.
using Json = nlohmann::ordered_json;

// One CSV row keyed by header name, in header order.
using CsvRecord = std::vector<std::pair<std::string, std::string>>;

enum class Format {
  kJson,       // single JSON document
  kJsonLines,  // one JSON value per line
  kCsv,        // header row + data rows
};

const char* FormatToString(Format format);

// Accepts "json", "json_array", "json_lines", "jsonl", "csv" (case-insensitive).
// Unknown names return nullopt.
std::optional<Format> ParseFormatName(const std::string& name);

// Returns the field value for `key`, or nullptr if the record has no such column.
const std::string* FindField(const CsvRecord& record, const std::string& key);

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_FORMAT_TYPES_HPP_
