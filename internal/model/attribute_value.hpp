#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "internal/model/value_type.hpp"
#include "internal/util/time.hpp"

namespace graphdoc::model {

// Opaque vector payload. Carried verbatim; no similarity semantics.
struct VectorValue {
  std::string data;

  bool operator==(const VectorValue&) const = default;
};

/*
  One typed attribute value.

  The alternative index is the value type; it is mapped onto nullable
  typed columns only at the storage boundary (see TypedColumns).
*/
using AttributeValue = std::variant<std::string, double, util::TimePoint, bool, VectorValue>;

ValueType TypeOf(const AttributeValue& value);

/*
  Storage form of an AttributeValue: one nullable column per value type.
  A well-formed row has exactly one populated column, and that column is
  the type discriminant.
*/
struct TypedColumns {
  std::optional<std::string> text;
  std::optional<double>      number;
  std::optional<int64_t>     time_ms;
  std::optional<bool>        boolean;
  std::optional<std::string> vector;

  bool operator==(const TypedColumns&) const = default;
};

TypedColumns ToColumns(const AttributeValue& value);

// nullopt when zero or more than one column is populated.
std::optional<AttributeValue> FromColumns(const TypedColumns& columns);

std::size_t PopulatedColumnCount(const TypedColumns& columns);

// Type-tagged canonical text of the populated column. Backs the
// (owner, definition, value) uniqueness constraint, which plain SQL
// UNIQUE cannot express over nullable columns.
std::string ValueKey(const TypedColumns& columns);

google::protobuf::Value ToProtoValue(const AttributeValue& value);

std::string DebugString(const AttributeValue& value);

} // namespace graphdoc::model
