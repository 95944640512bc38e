#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace graphdoc::model {

enum class ValueType : std::uint8_t {
  kString   = 0,
  kNumber   = 1,
  kDatetime = 2,
  kBoolean  = 3,
  kVector   = 4,
};

constexpr std::string_view ToString(ValueType type) {
  switch (type) {
    case ValueType::kNumber:
      return "number";
    case ValueType::kDatetime:
      return "datetime";
    case ValueType::kBoolean:
      return "boolean";
    case ValueType::kVector:
      return "vector";
    case ValueType::kString:
    default:
      return "string";
  }
}

constexpr std::optional<ValueType> ParseValueType(std::string_view text) {
  if (text == "string") return ValueType::kString;
  if (text == "number") return ValueType::kNumber;
  if (text == "datetime") return ValueType::kDatetime;
  if (text == "boolean") return ValueType::kBoolean;
  if (text == "vector") return ValueType::kVector;
  return std::nullopt;
}

} // namespace graphdoc::model
