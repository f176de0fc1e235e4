// Repository: LogVault
// Component: Sanitizer
// Copyright (c) 2026 LogVault

#include "logvault/fallback/Sanitizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

#include <zlib.h>

namespace logvault::fallback {

namespace {

// Dump settings shared by every compact rendering in this file.
std::string CompactDump(const Json& json) {
  return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// Length of the UTF-8 sequence starting at data[i], or 0 if it is invalid.
size_t Utf8SequenceLength(const unsigned char* data, size_t size, size_t i) {
  const unsigned char c = data[i];
  if (c < 0x80) return 1;

  size_t len = 0;
  uint32_t cp = 0;
  if ((c & 0xE0) == 0xC0) {
    len = 2;
    cp = c & 0x1F;
  } else if ((c & 0xF0) == 0xE0) {
    len = 3;
    cp = c & 0x0F;
  } else if ((c & 0xF8) == 0xF0) {
    len = 4;
    cp = c & 0x07;
  } else {
    return 0;
  }
  if (i + len > size) return 0;
  for (size_t k = 1; k < len; ++k) {
    const unsigned char cc = data[i + k];
    if ((cc & 0xC0) != 0x80) return 0;
    cp = (cp << 6) | (cc & 0x3F);
  }
  // Overlong forms, UTF-16 surrogates, beyond U+10FFFF.
  if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
    return 0;
  }
  if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
  if (cp > 0x10FFFF) return 0;
  return len;
}

std::string NumberText(double d) {
  if (std::isnan(d)) return "nan";
  if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
  if (d == std::floor(d) && std::fabs(d) < 1e16) {
    return std::to_string(static_cast<long long>(d));
  }
  return CompactDump(Json(d));
}

// CSV text for every kind that is not rendered through JSON.
std::string ScalarCsvText(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::kNull:
      return "";
    case Value::Kind::kBool:
      return value.AsBool() ? "true" : "false";
    case Value::Kind::kInteger:
      return std::to_string(value.AsInteger());
    case Value::Kind::kUnsigned:
      return std::to_string(value.AsUnsigned());
    case Value::Kind::kReal:
      return Sanitizer::FormatReal(value.AsReal());
    case Value::Kind::kString:
    case Value::Kind::kBytes:
    case Value::Kind::kOpaque:
      return Sanitizer::EscapeInvalidUtf8(value.Text());
    case Value::Kind::kComplex:
      return Sanitizer::FormatComplex(value.AsReal(), value.Imag());
    default:
      return CompactDump(Sanitizer::ToJson(value));
  }
}

}  // namespace

Sanitizer::Sanitizer(size_t cache_capacity) : capacity_(cache_capacity) {}

// ---------------------------------------------------------------------------
// Static conversions
// ---------------------------------------------------------------------------

bool Sanitizer::IsValidUtf8(const std::string& raw) {
  const auto* data = reinterpret_cast<const unsigned char*>(raw.data());
  size_t i = 0;
  while (i < raw.size()) {
    const size_t len = Utf8SequenceLength(data, raw.size(), i);
    if (len == 0) return false;
    i += len;
  }
  return true;
}

std::string Sanitizer::EscapeInvalidUtf8(const std::string& raw) {
  if (IsValidUtf8(raw)) return raw;

  const auto* data = reinterpret_cast<const unsigned char*>(raw.data());
  std::string out;
  out.reserve(raw.size() + 16);
  size_t i = 0;
  while (i < raw.size()) {
    const size_t len = Utf8SequenceLength(data, raw.size(), i);
    if (len == 0) {
      char buf[5];
      std::snprintf(buf, sizeof(buf), "\\x%02x", data[i]);
      out.append(buf, 4);
      ++i;
    } else {
      out.append(raw, i, len);
      i += len;
    }
  }
  return out;
}

std::string Sanitizer::FormatReal(double value) {
  if (std::isnan(value)) return "nan";
  if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
  return CompactDump(Json(value));
}

std::string Sanitizer::FormatComplex(double real, double imag) {
  const bool negative_imag = std::signbit(imag) && !std::isnan(imag);
  std::string out = "(";
  out += NumberText(real);
  out += negative_imag ? "-" : "+";
  out += NumberText(negative_imag ? -imag : imag);
  out += "j)";
  return out;
}

std::string Sanitizer::KeyToString(const Value& key) {
  if (key.IsNull()) return "null";
  if (key.kind() == Value::Kind::kOpaque && key.HasAttributes()) {
    return CompactDump(ToJson(key));
  }
  return ScalarCsvText(key);
}

Json Sanitizer::ToJson(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::kNull:
      return nullptr;
    case Value::Kind::kBool:
      return value.AsBool();
    case Value::Kind::kInteger:
      return value.AsInteger();
    case Value::Kind::kUnsigned:
      return value.AsUnsigned();
    case Value::Kind::kReal:
      if (!std::isfinite(value.AsReal())) return FormatReal(value.AsReal());
      return value.AsReal();
    case Value::Kind::kString:
    case Value::Kind::kBytes:
      return EscapeInvalidUtf8(value.Text());
    case Value::Kind::kComplex:
      return FormatComplex(value.AsReal(), value.Imag());
    case Value::Kind::kSequence:
    case Value::Kind::kSet: {
      Json arr = Json::array();
      for (const auto& item : value.Items()) {
        arr.push_back(ToJson(item));
      }
      return arr;
    }
    case Value::Kind::kMapping: {
      Json obj = Json::object();
      for (const auto& entry : value.Entries()) {
        obj[KeyToString(entry.first)] = ToJson(entry.second);
      }
      return obj;
    }
    case Value::Kind::kOpaque: {
      if (!value.HasAttributes()) return EscapeInvalidUtf8(value.Text());
      Json obj = Json::object();
      for (const auto& entry : value.Entries()) {
        obj[KeyToString(entry.first)] = ToJson(entry.second);
      }
      return obj;
    }
  }
  return nullptr;
}

std::string Sanitizer::JsonToCsvField(const Json& json) {
  if (json.is_null()) return "";
  if (json.is_string()) return json.get<std::string>();
  if (json.is_boolean()) return json.get<bool>() ? "true" : "false";
  return CompactDump(json);
}

CsvRecord Sanitizer::JsonToCsvRecord(const Json& json) {
  CsvRecord record;
  if (!json.is_object()) {
    record.emplace_back("value", JsonToCsvField(json));
    return record;
  }
  for (auto it = json.begin(); it != json.end(); ++it) {
    record.emplace_back(it.key(), JsonToCsvField(it.value()));
  }
  return record;
}

uint64_t Sanitizer::ContentKey(const Value& value) {
  std::string canonical;
  value.AppendCanonical(&canonical);

  uLong crc = crc32(0L, Z_NULL, 0);
  const auto* data = reinterpret_cast<const Bytef*>(canonical.data());
  size_t remaining = canonical.size();
  while (remaining > 0) {
    const uInt chunk = static_cast<uInt>(std::min<size_t>(remaining, 1u << 30));
    crc = crc32(crc, data, chunk);
    data += chunk;
    remaining -= chunk;
  }
  return (static_cast<uint64_t>(canonical.size()) << 32) ^ static_cast<uint64_t>(crc);
}

// ---------------------------------------------------------------------------
// Cached entry points
// ---------------------------------------------------------------------------

Json Sanitizer::SanitizeForJSON(const Value& value) {
  if (capacity_ == 0 || !value.IsContainer()) {
    return ToJson(value);
  }

  const uint64_t key = ContentKey(value);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end() && it->second.input == value) {
      hits_++;
      return it->second.output;
    }
    misses_++;
  }

  Json result = ToJson(value);

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(key);
  if (it != cache_.end()) {
    // Collision or concurrent fill: newest result wins, FIFO slot unchanged.
    it->second.input = value;
    it->second.output = result;
    return result;
  }
  while (cache_.size() >= capacity_ && !insertion_order_.empty()) {
    cache_.erase(insertion_order_.front());
    insertion_order_.pop_front();
  }
  cache_.emplace(key, CacheEntry{value, result});
  insertion_order_.push_back(key);
  return result;
}

std::string Sanitizer::SanitizeForCSV(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::kSequence:
    case Value::Kind::kSet:
    case Value::Kind::kMapping:
      return CompactDump(SanitizeForJSON(value));
    default:
      return ScalarCsvText(value);
  }
}

CsvRecord Sanitizer::SanitizeRowForCSV(const Value& row) {
  const bool has_fields = row.kind() == Value::Kind::kMapping ||
                          (row.kind() == Value::Kind::kOpaque && row.HasAttributes());
  if (!has_fields) {
    throw std::invalid_argument(std::string("CSV row must be a mapping, got ") +
                                KindToString(row.kind()));
  }
  CsvRecord record;
  record.reserve(row.Entries().size());
  for (const auto& entry : row.Entries()) {
    record.emplace_back(KeyToString(entry.first), SanitizeForCSV(entry.second));
  }
  return record;
}

void Sanitizer::ClearCache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
  insertion_order_.clear();
  hits_ = 0;
  misses_ = 0;
}

CacheStats Sanitizer::GetCacheStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats;
  stats.size = cache_.size();
  stats.capacity = capacity_;
  stats.hits = hits_;
  stats.misses = misses_;
  return stats;
}

}  // namespace logvault::fallback
