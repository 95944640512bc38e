#include "internal/model/constraints.hpp"

#include <google/protobuf/util/json_util.h>

#include <fmt/format.h>

#include <cmath>

#include "internal/util/errors.hpp"

namespace graphdoc::model {

namespace {

bool SameScalar(const google::protobuf::Value& a, const google::protobuf::Value& b) {
  if (a.kind_case() != b.kind_case()) return false;
  switch (a.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return a.string_value() == b.string_value();
    case google::protobuf::Value::kNumberValue:
      return a.number_value() == b.number_value();
    case google::protobuf::Value::kBoolValue:
      return a.bool_value() == b.bool_value();
    default:
      return false;
  }
}

double RequireNumber(const google::protobuf::Value& value, const std::string& key) {
  if (value.kind_case() != google::protobuf::Value::kNumberValue) {
    throw util::InvalidArgument("attribute constraint '" + key + "' must be a number");
  }
  return value.number_value();
}

} // namespace

AttributeConstraints AttributeConstraints::Parse(const std::string& json) {
  AttributeConstraints constraints;
  if (json.empty()) {
    return constraints;
  }

  google::protobuf::Struct document;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid attribute constraints: " + std::string(status.message()));
  }

  for (const auto& [key, value] : document.fields()) {
    if (key == "min") {
      constraints.min_ = RequireNumber(value, key);
    } else if (key == "max") {
      constraints.max_ = RequireNumber(value, key);
    } else if (key == "max_length") {
      const double length = RequireNumber(value, key);
      if (length < 0 || std::floor(length) != length) {
        throw util::InvalidArgument("attribute constraint 'max_length' must be a non-negative integer");
      }
      constraints.max_length_ = static_cast<std::size_t>(length);
    } else if (key == "enum") {
      if (value.kind_case() != google::protobuf::Value::kListValue) {
        throw util::InvalidArgument("attribute constraint 'enum' must be a list");
      }
      for (const auto& allowed : value.list_value().values()) {
        constraints.allowed_.push_back(allowed);
      }
    } else {
      throw util::InvalidArgument("unknown attribute constraint '" + key + "'");
    }
  }

  return constraints;
}

bool AttributeConstraints::Empty() const {
  return !min_ && !max_ && !max_length_ && allowed_.empty();
}

std::optional<std::string> AttributeConstraints::Check(const AttributeValue& value) const {
  if (const auto* number = std::get_if<double>(&value)) {
    if (min_ && *number < *min_) return fmt::format("value {} is below minimum {}", *number, *min_);
    if (max_ && *number > *max_) return fmt::format("value {} is above maximum {}", *number, *max_);
  }

  if (max_length_) {
    std::optional<std::size_t> length;
    if (const auto* text = std::get_if<std::string>(&value)) length = text->size();
    if (const auto* vec = std::get_if<VectorValue>(&value)) length = vec->data.size();
    if (length && *length > *max_length_) {
      return fmt::format("length {} exceeds max_length {}", *length, *max_length_);
    }
  }

  if (!allowed_.empty()) {
    const auto encoded = ToProtoValue(value);
    for (const auto& allowed : allowed_) {
      if (SameScalar(encoded, allowed)) {
        return std::nullopt;
      }
    }
    return "value " + DebugString(value) + " is not one of the allowed values";
  }

  return std::nullopt;
}

} // namespace graphdoc::model
