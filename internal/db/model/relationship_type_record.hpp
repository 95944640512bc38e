#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/value_type.hpp"

namespace graphdoc::db::model {

inline constexpr const char* kMultiplicityMany = "many";
inline constexpr const char* kMultiplicityOne  = "one";

// (from_model_type_id, to_model_type_id, relation_name) is unique.
struct RelationshipTypeRecord {
  uint64_t                   id                 = 0;
  uint64_t                   from_model_type_id = 0;
  uint64_t                   to_model_type_id   = 0;
  std::string                relation_name;
  std::string                multiplicity = kMultiplicityMany;
  std::optional<std::string> description;
};

struct RelationAttributeDefinitionRecord {
  uint64_t                   id                   = 0;
  uint64_t                   relationship_type_id = 0;
  std::string                key;
  graphdoc::model::ValueType value_type = graphdoc::model::ValueType::kString;
  bool                       required   = false;
};

} // namespace graphdoc::db::model
