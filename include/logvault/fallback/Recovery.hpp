// Repository: LogVault
// Component: Recovery
// Purpose: Extracts the largest salvageable prefix of records from a
//          corrupted JSON, JSON Lines or CSV file.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_RECOVERY_HPP_
#define LOGVAULT_FALLBACK_RECOVERY_HPP_

#include <optional>
#include <string>
#include <vector>

#include "logvault/fallback/FormatTypes.hpp"

namespace logvault::fallback {

// Recovery
//
// Every entry point returns nullopt when zero records could be salvaged, and
// never throws on malformed input. Results are not cached. Appending valid
// records to a file never shrinks what is recovered from it.
//
// JSON strategy, in order:
//   1. whole-document parse (an array yields its elements);
//   2. scan balanced top-level objects/arrays from the start and keep the
//      leading run that parses, descending into a truncated top-level array
//      to keep its complete leading elements;
//   3. per-line parse, keeping every line that is itself valid JSON.
class Recovery {
 public:
  static std::optional<std::vector<Json>> RecoverJSONFile(const std::string& path);
  static std::optional<std::vector<Json>> RecoverJSONLinesFile(const std::string& path);
  static std::optional<std::vector<CsvRecord>> RecoverCSVFile(const std::string& path);

  static std::optional<std::vector<Json>> RecoverJSONContent(const std::string& content);
  static std::optional<std::vector<Json>> RecoverJSONLinesContent(const std::string& content);
  static std::optional<std::vector<CsvRecord>> RecoverCSVContent(const std::string& content);
};

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_RECOVERY_HPP_
