#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace graphdoc::db::model {

struct EntityRecord {
  uint64_t                   id            = 0;
  uint64_t                   model_type_id = 0; // base type
  std::string                title;
  std::optional<std::string> body;

  // epoch ms
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

// All set fields must match. Results are ordered by id.
struct EntityFilter {
  std::optional<uint64_t>    base_type_id;
  std::optional<uint64_t>    trait_type_id;
  std::optional<std::string> title;
};

} // namespace graphdoc::db::model
