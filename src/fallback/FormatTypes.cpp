// Repository: LogVault
// Component: Structured format types
// Copyright (c) 2026 LogVault

#include "logvault/fallback/FormatTypes.hpp"

#include <algorithm>
#include <cctype>

namespace logvault::fallback {

const char* FormatToString(Format format) {
  switch (format) {
    case Format::kJson: return "json";
    case Format::kJsonLines: return "json_lines";
    case Format::kCsv: return "csv";
    default: return "unknown";
  }
}

std::optional<Format> ParseFormatName(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "json" || lower == "json_array") return Format::kJson;
  if (lower == "json_lines" || lower == "jsonl") return Format::kJsonLines;
  if (lower == "csv") return Format::kCsv;
  return std::nullopt;
}

const std::string* FindField(const CsvRecord& record, const std::string& key) {
  for (const auto& field : record) {
    if (field.first == key) return &field.second;
  }
  return nullptr;
}

}  // namespace logvault::fallback
