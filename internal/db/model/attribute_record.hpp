#pragma once

#include <cstdint>

#include "internal/model/attribute_value.hpp"

namespace graphdoc::db::model {

/*
  One EAV row. Several rows may share (entity, definition) as long as
  their values differ; ids grow with insertion order.
*/

struct AttributeRecord {
  uint64_t                     id                      = 0;
  uint64_t                     entity_id               = 0;
  uint64_t                     attribute_definition_id = 0;
  graphdoc::model::TypedColumns columns;
};

} // namespace graphdoc::db::model
