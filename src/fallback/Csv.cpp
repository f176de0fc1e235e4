// Repository: LogVault
// Component: CSV codec
// Copyright (c) 2026 LogVault

#include "logvault/fallback/Csv.hpp"

#include <utility>

namespace logvault::fallback {

std::vector<CsvRow> ParseCsv(const std::string& content, bool resync) {
  std::vector<CsvRow> rows;
  const size_t n = content.size();
  size_t pos = 0;
  size_t line = 1;

  while (pos < n) {
    const size_t row_start = pos;
    const size_t row_line = line;

    CsvRow row;
    row.line = row_line;
    std::string field;
    bool in_quotes = false;
    bool field_quoted = false;
    bool row_has_content = false;
    bool row_done = false;

    while (pos < n && !row_done) {
      const char c = content[pos];
      if (c == '\0') row.malformed = true;

      if (in_quotes) {
        if (c == '"') {
          if (pos + 1 < n && content[pos + 1] == '"') {
            field.push_back('"');
            pos += 2;
          } else {
            in_quotes = false;
            ++pos;
          }
          continue;
        }
        if (c == '\n') ++line;
        field.push_back(c);
        ++pos;
        continue;
      }

      switch (c) {
        case ',':
          row.fields.push_back(std::move(field));
          field.clear();
          field_quoted = false;
          row_has_content = true;
          ++pos;
          break;
        case '\r':
          pos += (pos + 1 < n && content[pos + 1] == '\n') ? 2 : 1;
          ++line;
          row_done = true;
          break;
        case '\n':
          ++pos;
          ++line;
          row_done = true;
          break;
        case '"':
          if (field.empty() && !field_quoted) {
            in_quotes = true;
            field_quoted = true;
          } else {
            field.push_back(c);
          }
          row_has_content = true;
          ++pos;
          break;
        default:
          field.push_back(c);
          row_has_content = true;
          ++pos;
          break;
      }
    }

    if (in_quotes) {
      if (!resync) {
        row.malformed = true;
        row.fields.push_back(std::move(field));
        rows.push_back(std::move(row));
        break;
      }
      const size_t nl = content.find('\n', row_start);
      CsvRow bad;
      bad.line = row_line;
      bad.malformed = true;
      bad.fields.push_back(content.substr(
          row_start, nl == std::string::npos ? std::string::npos : nl - row_start));
      rows.push_back(std::move(bad));
      if (nl == std::string::npos) break;
      pos = nl + 1;
      line = row_line + 1;
      continue;
    }

    if (!row_has_content) continue;  // blank line
    row.fields.push_back(std::move(field));
    rows.push_back(std::move(row));
  }
  return rows;
}

std::string EncodeCsvField(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string EncodeCsvRow(const std::vector<std::string>& fields) {
  // A lone empty field would otherwise read back as a blank line.
  if (fields.size() == 1 && fields[0].empty()) {
    return "\"\"\n";
  }
  std::string out;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) out.push_back(',');
    out += EncodeCsvField(fields[i]);
  }
  out.push_back('\n');
  return out;
}

bool EncodeCsvRecords(const std::vector<CsvRecord>& records, std::string* out,
                      std::string* error) {
  out->clear();
  if (records.empty()) return true;

  std::vector<std::string> header;
  header.reserve(records.front().size());
  for (const auto& field : records.front()) {
    header.push_back(field.first);
  }
  *out += EncodeCsvRow(header);

  for (size_t r = 0; r < records.size(); ++r) {
    const CsvRecord& record = records[r];
    for (const auto& field : record) {
      bool known = false;
      for (const auto& name : header) {
        if (name == field.first) {
          known = true;
          break;
        }
      }
      if (!known) {
        if (error != nullptr) {
          *error = "record " + std::to_string(r) + " has field '" + field.first +
                   "' not present in header";
        }
        out->clear();
        return false;
      }
    }
    std::vector<std::string> values;
    values.reserve(header.size());
    for (const auto& name : header) {
      const std::string* v = FindField(record, name);
      values.push_back(v != nullptr ? *v : std::string());
    }
    *out += EncodeCsvRow(values);
  }
  return true;
}

}  // namespace logvault::fallback
