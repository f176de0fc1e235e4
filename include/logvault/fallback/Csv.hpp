// Repository: LogVault
// Component: CSV codec
// Purpose: RFC 4180 row reader/writer used by validation, recovery and the
//          atomic writer.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_CSV_HPP_
#define LOGVAULT_FALLBACK_CSV_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "logvault/fallback/FormatTypes.hpp"

namespace logvault::fallback {

struct CsvRow {
  std::vector<std::string> fields;
  size_t line = 0;         // 1-based physical line where the row starts
  bool malformed = false;  // NUL byte or unterminated quoted field
};

// Splits `content` into rows. Quoted fields may span lines; "" inside quotes
// is a literal quote. Blank lines produce no row. LF and CRLF both end a row.
//
// A quoted field still open at end of input makes the row malformed. With
// `resync`, that row is reported as a single malformed row covering its first
// physical line, and parsing restarts on the next line, so rows after a stray
// quote are still seen.
std::vector<CsvRow> ParseCsv(const std::string& content, bool resync);

// Quotes the field when it contains a comma, quote, CR or LF.
std::string EncodeCsvField(const std::string& field);

// Joins encoded fields with commas and terminates with '\n'.
std::string EncodeCsvRow(const std::vector<std::string>& fields);

// Serializes records with the header taken from the first record's keys.
// Missing keys are written empty. Returns false (and fills `error`) if a
// later record carries a key the header does not have. Zero records produce
// an empty string.
bool EncodeCsvRecords(const std::vector<CsvRecord>& records, std::string* out,
                      std::string* error);

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_CSV_HPP_
