#include "internal/model/attribute_value.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace graphdoc::model {

ValueType TypeOf(const AttributeValue& value) {
  return std::visit(
      [](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return ValueType::kString;
        } else if constexpr (std::is_same_v<T, double>) {
          return ValueType::kNumber;
        } else if constexpr (std::is_same_v<T, util::TimePoint>) {
          return ValueType::kDatetime;
        } else if constexpr (std::is_same_v<T, bool>) {
          return ValueType::kBoolean;
        } else {
          return ValueType::kVector;
        }
      },
      value);
}

TypedColumns ToColumns(const AttributeValue& value) {
  TypedColumns columns;
  std::visit(
      [&columns](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          columns.text = v;
        } else if constexpr (std::is_same_v<T, double>) {
          // -0.0 and 0.0 are one value
          columns.number = v == 0.0 ? 0.0 : v;
        } else if constexpr (std::is_same_v<T, util::TimePoint>) {
          columns.time_ms = static_cast<int64_t>(util::ToUnixMillis(v));
        } else if constexpr (std::is_same_v<T, bool>) {
          columns.boolean = v;
        } else {
          columns.vector = v.data;
        }
      },
      value);
  return columns;
}

std::size_t PopulatedColumnCount(const TypedColumns& columns) {
  return static_cast<std::size_t>(columns.text.has_value()) + static_cast<std::size_t>(columns.number.has_value()) +
         static_cast<std::size_t>(columns.time_ms.has_value()) + static_cast<std::size_t>(columns.boolean.has_value()) +
         static_cast<std::size_t>(columns.vector.has_value());
}

std::optional<AttributeValue> FromColumns(const TypedColumns& columns) {
  if (PopulatedColumnCount(columns) != 1) {
    return std::nullopt;
  }

  if (columns.text) return AttributeValue{std::in_place_type<std::string>, *columns.text};
  if (columns.number) return AttributeValue{std::in_place_type<double>, *columns.number};
  if (columns.time_ms) return AttributeValue{std::in_place_type<util::TimePoint>, util::FromUnixMillis(static_cast<uint64_t>(*columns.time_ms))};
  if (columns.boolean) return AttributeValue{std::in_place_type<bool>, *columns.boolean};
  return AttributeValue{std::in_place_type<VectorValue>, VectorValue{*columns.vector}};
}

std::string ValueKey(const TypedColumns& columns) {
  if (columns.text) return "s:" + *columns.text;
  // %.17g round-trips every double, so equal keys mean equal numbers
  if (columns.number) return fmt::format("n:{:.17g}", *columns.number);
  if (columns.time_ms) return fmt::format("t:{}", *columns.time_ms);
  if (columns.boolean) return *columns.boolean ? "b:1" : "b:0";
  if (columns.vector) return "v:" + *columns.vector;
  return "";
}

google::protobuf::Value ToProtoValue(const AttributeValue& value) {
  google::protobuf::Value out;
  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          out.set_string_value(v);
        } else if constexpr (std::is_same_v<T, double>) {
          out.set_number_value(v);
        } else if constexpr (std::is_same_v<T, util::TimePoint>) {
          out.set_string_value(util::ToRfc3339(v));
        } else if constexpr (std::is_same_v<T, bool>) {
          out.set_bool_value(v);
        } else {
          out.set_string_value(v.data);
        }
      },
      value);
  return out;
}

std::string DebugString(const AttributeValue& value) {
  return fmt::format("{}:{}", ToString(TypeOf(value)), ValueKey(ToColumns(value)).substr(2));
}

} // namespace graphdoc::model
