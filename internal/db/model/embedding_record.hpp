#pragma once

#include <cstdint>
#include <string>

namespace graphdoc::db::model {

// Opaque per-entity payload (at most one per entity).
struct EmbeddingRecord {
  uint64_t    entity_id = 0;
  std::string embedding;
};

} // namespace graphdoc::db::model
