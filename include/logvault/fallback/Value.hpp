// Repository: LogVault
// Component: Record value model
// Purpose: Closed set of value kinds a log record can carry, plus an opaque
//          escape hatch for foreign objects (type name + text rendering).
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_FALLBACK_VALUE_HPP_
#define LOGVAULT_FALLBACK_VALUE_HPP_

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "logvault/fallback/FormatTypes.hpp"

namespace logvault::fallback {

class Value;

using ValueList = std::vector<Value>;
using ValueEntries = std::vector<std::pair<Value, Value>>;

// Value
//
// Tagged value. Constructors are implicit for scalars so record literals read
// naturally:
//
//   Value row = Value::Map({{"level", "INFO"}, {"count", 3}, {"ratio", 0.5}});
//
// Sequences, sets, mappings, byte strings, complex numbers and opaque objects
// are built through the named factories.
class Value {
 public:
  enum class Kind {
    kNull,
    kBool,
    kInteger,
    kUnsigned,
    kReal,
    kString,
    kBytes,
    kComplex,
    kSequence,
    kSet,
    kMapping,
    kOpaque,
  };

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : kind_(Kind::kBool), bool_(b) {}

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T> &&
                                 !std::is_same_v<T, bool> && !std::is_same_v<T, char>,
                             int> = 0>
  Value(T v) : kind_(Kind::kInteger), int_(static_cast<int64_t>(v)) {}

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                                 !std::is_same_v<T, bool>,
                             int> = 0>
  Value(T v) : kind_(Kind::kUnsigned), uint_(static_cast<uint64_t>(v)) {}

  Value(double v) : kind_(Kind::kReal), real_(v) {}
  Value(float v) : kind_(Kind::kReal), real_(static_cast<double>(v)) {}
  Value(const char* s) : kind_(Kind::kString), text_(s != nullptr ? s : "") {}
  Value(std::string s) : kind_(Kind::kString), text_(std::move(s)) {}

  static Value Bytes(std::string raw);
  static Value Complex(double real, double imag);
  static Value Sequence(ValueList items);
  static Value Set(ValueList items);
  static Value Mapping(ValueEntries entries);
  // Mapping with string keys, the common record shape.
  static Value Map(std::initializer_list<std::pair<std::string, Value>> fields);
  static Value Map(const std::vector<std::pair<std::string, Value>>& fields);
  // Foreign object with no attribute table; serialized via its repr.
  static Value Opaque(std::string type_name, std::string repr);
  // Foreign object exposing attributes; serialized as a mapping of them.
  static Value Opaque(std::string type_name, std::string repr, ValueEntries attributes);
  // Lossless import of an already-parsed JSON tree.
  static Value FromJson(const Json& json);

  Kind kind() const { return kind_; }
  bool IsNull() const { return kind_ == Kind::kNull; }
  bool IsContainer() const {
    return kind_ == Kind::kSequence || kind_ == Kind::kSet || kind_ == Kind::kMapping ||
           kind_ == Kind::kOpaque;
  }

  bool AsBool() const { return bool_; }
  int64_t AsInteger() const { return int_; }
  uint64_t AsUnsigned() const { return uint_; }
  double AsReal() const { return real_; }
  double Imag() const { return imag_; }
  // String payload for kString and kBytes; repr for kOpaque.
  const std::string& Text() const { return text_; }
  const std::string& TypeName() const { return type_name_; }
  bool HasAttributes() const { return has_attributes_; }
  // Elements of kSequence and kSet.
  const ValueList& Items() const { return items_; }
  // Entries of kMapping; attributes of kOpaque.
  const ValueEntries& Entries() const { return entries_; }

  // Structural equality. Reals compare bitwise so NaN payloads match themselves.
  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

  // Appends an unambiguous, self-delimiting encoding of this value. Two values
  // with equal encodings are structurally equal.
  void AppendCanonical(std::string* out) const;

 private:
  Kind kind_ = Kind::kNull;
  bool bool_ = false;
  bool has_attributes_ = false;
  int64_t int_ = 0;
  uint64_t uint_ = 0;
  double real_ = 0.0;
  double imag_ = 0.0;
  std::string text_;
  std::string type_name_;
  ValueList items_;
  ValueEntries entries_;
};

const char* KindToString(Value::Kind kind);

}  // namespace logvault::fallback

#endif  // LOGVAULT_FALLBACK_VALUE_HPP_
