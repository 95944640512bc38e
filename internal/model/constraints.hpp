#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/attribute_value.hpp"

namespace graphdoc::model {

/*
  Structural constraints attached to an attribute definition.

  Stored as a JSON object. Recognised keys:
    min, max     numeric bounds (number values)
    max_length   length bound (string and vector values)
    enum         list of allowed scalar values

  An empty document means "no constraints".
*/
class AttributeConstraints {
 public:
  // Throws util::InvalidArgument on malformed JSON or unknown keys.
  static AttributeConstraints Parse(const std::string& json);

  bool Empty() const;

  // Description of the first violated constraint, or nullopt.
  std::optional<std::string> Check(const AttributeValue& value) const;

 private:
  std::optional<double>                min_;
  std::optional<double>                max_;
  std::optional<std::size_t>           max_length_;
  std::vector<google::protobuf::Value> allowed_;
};

} // namespace graphdoc::model
