// Repository: LogVault
// Component: Recovery
// Copyright (c) 2026 LogVault

#include "logvault/fallback/Recovery.hpp"

#include <cstring>
#include <sstream>

#include "logvault/fallback/Csv.hpp"
#include "logvault/util/FileIo.hpp"
#include "logvault/util/Logger.hpp"

namespace logvault::fallback {

namespace {

size_t SkipSeparators(const std::string& s, size_t pos) {
  while (pos < s.size() && std::strchr(" \t\r\n,", s[pos]) != nullptr && s[pos] != '\0') {
    ++pos;
  }
  return pos;
}

size_t SkipSpace(const std::string& s, size_t pos) {
  while (pos < s.size() && std::strchr(" \t\r\n", s[pos]) != nullptr && s[pos] != '\0') {
    ++pos;
  }
  return pos;
}

// One past the closing quote of the string starting at s[start], or npos.
size_t FindStringEnd(const std::string& s, size_t start) {
  for (size_t i = start + 1; i < s.size(); ++i) {
    if (s[i] == '\\') {
      ++i;
    } else if (s[i] == '"') {
      return i + 1;
    }
  }
  return std::string::npos;
}

// One past the bracket that closes the object/array opened at s[start], or
// npos if input ends first or the brackets do not pair up.
size_t FindValueEnd(const std::string& s, size_t start) {
  std::string expected;
  for (size_t i = start; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') {
      const size_t end = FindStringEnd(s, i);
      if (end == std::string::npos) return std::string::npos;
      i = end - 1;
    } else if (c == '{') {
      expected.push_back('}');
    } else if (c == '[') {
      expected.push_back(']');
    } else if (c == '}' || c == ']') {
      if (expected.empty() || expected.back() != c) return std::string::npos;
      expected.pop_back();
      if (expected.empty()) return i + 1;
    }
  }
  return std::string::npos;
}

bool ParseSlice(const std::string& s, size_t begin, size_t end, Json* out) {
  Json v = Json::parse(s.begin() + static_cast<std::ptrdiff_t>(begin),
                       s.begin() + static_cast<std::ptrdiff_t>(end), nullptr, false);
  if (v.is_discarded()) return false;
  *out = std::move(v);
  return true;
}

void AppendRecords(Json value, std::vector<Json>* out) {
  if (value.is_array()) {
    for (auto& element : value) {
      out->push_back(std::move(element));
    }
  } else {
    out->push_back(std::move(value));
  }
}

// Keeps the complete leading elements of an array whose closing bracket is
// missing. Scalars running into end of input are dropped as possibly cut.
void RecoverArrayPrefix(const std::string& s, size_t open_pos, std::vector<Json>* out) {
  size_t pos = open_pos + 1;
  while (true) {
    pos = SkipSpace(s, pos);
    if (pos >= s.size() || s[pos] == ']') return;

    size_t end = std::string::npos;
    const char c = s[pos];
    if (c == '{' || c == '[') {
      end = FindValueEnd(s, pos);
    } else if (c == '"') {
      end = FindStringEnd(s, pos);
    } else {
      end = pos;
      while (end < s.size() && std::strchr(",]} \t\r\n", s[end]) == nullptr) {
        ++end;
      }
      if (end >= s.size()) return;
    }
    if (end == std::string::npos) return;

    Json element;
    if (!ParseSlice(s, pos, end, &element)) return;
    out->push_back(std::move(element));

    pos = SkipSpace(s, end);
    if (pos >= s.size() || s[pos] != ',') return;
    ++pos;
  }
}

std::vector<Json> ScanLeadingValues(const std::string& s) {
  std::vector<Json> out;
  size_t pos = 0;
  while (true) {
    pos = SkipSeparators(s, pos);
    if (pos >= s.size()) break;
    const char c = s[pos];
    if (c != '{' && c != '[') break;

    const size_t end = FindValueEnd(s, pos);
    if (end == std::string::npos) {
      if (c == '[') RecoverArrayPrefix(s, pos, &out);
      break;
    }
    Json value;
    if (!ParseSlice(s, pos, end, &value)) break;
    AppendRecords(std::move(value), &out);
    pos = end;
  }
  return out;
}

std::vector<Json> ParseValidLines(const std::string& content) {
  std::vector<Json> out;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    Json value = Json::parse(line, nullptr, false);
    if (value.is_discarded()) continue;
    out.push_back(std::move(value));
  }
  return out;
}

}  // namespace

std::optional<std::vector<Json>> Recovery::RecoverJSONContent(const std::string& content) {
  std::vector<Json> records;

  Json whole = Json::parse(content, nullptr, false);
  if (!whole.is_discarded()) {
    AppendRecords(std::move(whole), &records);
  } else {
    records = ScanLeadingValues(content);
    if (records.empty()) {
      records = ParseValidLines(content);
    }
  }

  if (records.empty()) return std::nullopt;
  return records;
}

std::optional<std::vector<Json>> Recovery::RecoverJSONLinesContent(const std::string& content) {
  std::vector<Json> records = ParseValidLines(content);
  if (records.empty()) return std::nullopt;
  return records;
}

std::optional<std::vector<CsvRecord>> Recovery::RecoverCSVContent(const std::string& content) {
  const std::vector<CsvRow> rows = ParseCsv(content, /*resync=*/true);
  if (rows.empty() || rows.front().malformed) return std::nullopt;

  const std::vector<std::string>& header = rows.front().fields;
  std::vector<CsvRecord> records;
  for (size_t r = 1; r < rows.size(); ++r) {
    const CsvRow& row = rows[r];
    if (row.malformed || row.fields.size() != header.size()) {
      util::Logger::Debug("[Recovery] skipping CSV row at line " + std::to_string(row.line));
      continue;
    }
    CsvRecord record;
    record.reserve(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
      record.emplace_back(header[i], row.fields[i]);
    }
    records.push_back(std::move(record));
  }

  if (records.empty()) return std::nullopt;
  return records;
}

std::optional<std::vector<Json>> Recovery::RecoverJSONFile(const std::string& path) {
  std::optional<std::string> content = util::ReadFileBytes(path);
  if (!content.has_value()) return std::nullopt;
  return RecoverJSONContent(*content);
}

std::optional<std::vector<Json>> Recovery::RecoverJSONLinesFile(const std::string& path) {
  std::optional<std::string> content = util::ReadFileBytes(path);
  if (!content.has_value()) return std::nullopt;
  return RecoverJSONLinesContent(*content);
}

std::optional<std::vector<CsvRecord>> Recovery::RecoverCSVFile(const std::string& path) {
  std::optional<std::string> content = util::ReadFileBytes(path);
  if (!content.has_value()) return std::nullopt;
  return RecoverCSVContent(*content);
}

}  // namespace logvault::fallback
