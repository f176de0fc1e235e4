// Repository: LogVault
// Component: Record value model
// Copyright (c) 2026 LogVault

#include "logvault/fallback/Value.hpp"

#include <cstring>

namespace logvault::fallback {

namespace {

void AppendLength(std::string* out, size_t n) {
  out->append(std::to_string(n));
  out->push_back(':');
}

void AppendText(std::string* out, const std::string& s) {
  AppendLength(out, s.size());
  out->append(s);
}

void AppendBits(std::string* out, double d) {
  uint64_t bits = 0;
  std::memcpy(&bits, &d, sizeof(bits));
  out->append(std::to_string(bits));
  out->push_back(';');
}

bool SameBits(double a, double b) {
  return std::memcmp(&a, &b, sizeof(double)) == 0;
}

}  // namespace

Value Value::Bytes(std::string raw) {
  Value v;
  v.kind_ = Kind::kBytes;
  v.text_ = std::move(raw);
  return v;
}

Value Value::Complex(double real, double imag) {
  Value v;
  v.kind_ = Kind::kComplex;
  v.real_ = real;
  v.imag_ = imag;
  return v;
}

Value Value::Sequence(ValueList items) {
  Value v;
  v.kind_ = Kind::kSequence;
  v.items_ = std::move(items);
  return v;
}

Value Value::Set(ValueList items) {
  Value v;
  v.kind_ = Kind::kSet;
  v.items_ = std::move(items);
  return v;
}

Value Value::Mapping(ValueEntries entries) {
  Value v;
  v.kind_ = Kind::kMapping;
  v.entries_ = std::move(entries);
  return v;
}

Value Value::Map(std::initializer_list<std::pair<std::string, Value>> fields) {
  ValueEntries entries;
  entries.reserve(fields.size());
  for (const auto& f : fields) {
    entries.emplace_back(Value(f.first), f.second);
  }
  return Mapping(std::move(entries));
}

Value Value::Map(const std::vector<std::pair<std::string, Value>>& fields) {
  ValueEntries entries;
  entries.reserve(fields.size());
  for (const auto& f : fields) {
    entries.emplace_back(Value(f.first), f.second);
  }
  return Mapping(std::move(entries));
}

Value Value::Opaque(std::string type_name, std::string repr) {
  Value v;
  v.kind_ = Kind::kOpaque;
  v.type_name_ = std::move(type_name);
  v.text_ = std::move(repr);
  return v;
}

Value Value::Opaque(std::string type_name, std::string repr, ValueEntries attributes) {
  Value v = Opaque(std::move(type_name), std::move(repr));
  v.has_attributes_ = true;
  v.entries_ = std::move(attributes);
  return v;
}

Value Value::FromJson(const Json& json) {
  switch (json.type()) {
    case Json::value_t::null:
      return Value();
    case Json::value_t::boolean:
      return Value(json.get<bool>());
    case Json::value_t::number_integer:
      return Value(json.get<int64_t>());
    case Json::value_t::number_unsigned:
      return Value(json.get<uint64_t>());
    case Json::value_t::number_float:
      return Value(json.get<double>());
    case Json::value_t::string:
      return Value(json.get<std::string>());
    case Json::value_t::array: {
      ValueList items;
      items.reserve(json.size());
      for (const auto& element : json) {
        items.push_back(FromJson(element));
      }
      return Sequence(std::move(items));
    }
    case Json::value_t::object: {
      ValueEntries entries;
      entries.reserve(json.size());
      for (auto it = json.begin(); it != json.end(); ++it) {
        entries.emplace_back(Value(it.key()), FromJson(it.value()));
      }
      return Mapping(std::move(entries));
    }
    case Json::value_t::binary: {
      const auto& bin = json.get_binary();
      return Bytes(std::string(bin.begin(), bin.end()));
    }
    default:
      return Value();
  }
}

bool Value::operator==(const Value& other) const {
  if (kind_ != other.kind_) return false;
  switch (kind_) {
    case Kind::kNull:
      return true;
    case Kind::kBool:
      return bool_ == other.bool_;
    case Kind::kInteger:
      return int_ == other.int_;
    case Kind::kUnsigned:
      return uint_ == other.uint_;
    case Kind::kReal:
      return SameBits(real_, other.real_);
    case Kind::kComplex:
      return SameBits(real_, other.real_) && SameBits(imag_, other.imag_);
    case Kind::kString:
    case Kind::kBytes:
      return text_ == other.text_;
    case Kind::kSequence:
    case Kind::kSet:
      return items_ == other.items_;
    case Kind::kMapping:
      return entries_ == other.entries_;
    case Kind::kOpaque:
      return type_name_ == other.type_name_ && text_ == other.text_ &&
             has_attributes_ == other.has_attributes_ && entries_ == other.entries_;
  }
  return false;
}

void Value::AppendCanonical(std::string* out) const {
  switch (kind_) {
    case Kind::kNull:
      out->push_back('n');
      break;
    case Kind::kBool:
      out->push_back(bool_ ? 't' : 'f');
      break;
    case Kind::kInteger:
      out->push_back('i');
      out->append(std::to_string(int_));
      out->push_back(';');
      break;
    case Kind::kUnsigned:
      out->push_back('u');
      out->append(std::to_string(uint_));
      out->push_back(';');
      break;
    case Kind::kReal:
      out->push_back('r');
      AppendBits(out, real_);
      break;
    case Kind::kComplex:
      out->push_back('c');
      AppendBits(out, real_);
      AppendBits(out, imag_);
      break;
    case Kind::kString:
      out->push_back('s');
      AppendText(out, text_);
      break;
    case Kind::kBytes:
      out->push_back('b');
      AppendText(out, text_);
      break;
    case Kind::kSequence:
    case Kind::kSet:
      out->push_back(kind_ == Kind::kSet ? 'S' : 'L');
      AppendLength(out, items_.size());
      for (const auto& item : items_) {
        item.AppendCanonical(out);
      }
      break;
    case Kind::kMapping:
      out->push_back('M');
      AppendLength(out, entries_.size());
      for (const auto& entry : entries_) {
        entry.first.AppendCanonical(out);
        entry.second.AppendCanonical(out);
      }
      break;
    case Kind::kOpaque:
      out->push_back(has_attributes_ ? 'O' : 'o');
      AppendText(out, type_name_);
      AppendText(out, text_);
      AppendLength(out, entries_.size());
      for (const auto& entry : entries_) {
        entry.first.AppendCanonical(out);
        entry.second.AppendCanonical(out);
      }
      break;
  }
}

const char* KindToString(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::kNull: return "null";
    case Value::Kind::kBool: return "bool";
    case Value::Kind::kInteger: return "integer";
    case Value::Kind::kUnsigned: return "unsigned";
    case Value::Kind::kReal: return "real";
    case Value::Kind::kString: return "string";
    case Value::Kind::kBytes: return "bytes";
    case Value::Kind::kComplex: return "complex";
    case Value::Kind::kSequence: return "sequence";
    case Value::Kind::kSet: return "set";
    case Value::Kind::kMapping: return "mapping";
    case Value::Kind::kOpaque: return "opaque";
    default: return "unknown";
  }
}

}  // namespace logvault::fallback
