#pragma once

#include <cstdint>

namespace graphdoc::db::model {

// (entity_id, trait_type_id) is unique.
struct TraitAssignmentRecord {
  uint64_t id            = 0;
  uint64_t entity_id     = 0;
  uint64_t trait_type_id = 0;
  uint64_t applied_at_ms = 0;
};

} // namespace graphdoc::db::model
