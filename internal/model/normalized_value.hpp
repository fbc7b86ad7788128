#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace relaynorm::model {

enum class ValueType {
  kEmpty,
  kNumeric,
  kText,
  kBoolean,
};

inline std::string_view ToString(ValueType type) {
  switch (type) {
    case ValueType::kNumeric:
      return "numeric";
    case ValueType::kText:
      return "text";
    case ValueType::kBoolean:
      return "boolean";
    case ValueType::kEmpty:
      break;
  }
  return "empty";
}

inline std::optional<ValueType> ValueTypeFromString(std::string_view name) {
  if (name == "numeric") return ValueType::kNumeric;
  if (name == "text") return ValueType::kText;
  if (name == "boolean") return ValueType::kBoolean;
  if (name == "empty") return ValueType::kEmpty;
  return std::nullopt;
}

/*
  Atomized cell value.

  numeric_text is the canonical spelling of the number ('.' decimal,
  no thousands separators, no leading '+'). For booleans it is "1"/"0"
  and text keeps the marker as written. raw is the untouched input and
  takes no part in equality.
*/
struct NormalizedValue {
  ValueType                  type = ValueType::kEmpty;
  std::optional<double>      numeric;
  std::string                numeric_text;
  std::string                text;
  std::optional<std::string> unit;
  std::string                raw;

  bool operator==(const NormalizedValue& other) const {
    return type == other.type && numeric_text == other.numeric_text && text == other.text && unit == other.unit;
  }
};

} // namespace relaynorm::model
