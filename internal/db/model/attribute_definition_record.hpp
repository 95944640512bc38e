#pragma once

#include <cstdint>
#include <string>

#include "internal/model/value_type.hpp"

namespace graphdoc::db::model {

struct AttributeDefinitionRecord {
  uint64_t                   id            = 0;
  uint64_t                   model_type_id = 0;
  std::string                key;
  graphdoc::model::ValueType value_type = graphdoc::model::ValueType::kString;
  bool                       required   = false;

  // JSON object, empty when unconstrained (see model::AttributeConstraints)
  std::string constraints;
};

} // namespace graphdoc::db::model
