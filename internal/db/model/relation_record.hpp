#pragma once

#include <cstdint>

#include "internal/model/attribute_value.hpp"

namespace graphdoc::db::model {

/*
  Directed edge.

  from ---[relationship type]---> to
*/

struct RelationRecord {
  uint64_t id                   = 0;
  uint64_t from_id              = 0;
  uint64_t to_id                = 0;
  uint64_t relationship_type_id = 0;

  // epoch ms
  uint64_t created_at_ms = 0;
};

struct RelationAttributeRecord {
  uint64_t                      id                               = 0;
  uint64_t                      relation_id                      = 0;
  uint64_t                      relation_attribute_definition_id = 0;
  graphdoc::model::TypedColumns columns;
};

} // namespace graphdoc::db::model
