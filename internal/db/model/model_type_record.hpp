#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/type_kind.hpp"

namespace graphdoc::db::model {

/*
  A named classification. Base types classify entities; trait types are
  composed onto entities after creation.

  parent_id is single-level categorisation only; attribute definitions
  are not inherited through it.
*/

struct ModelTypeRecord {
  uint64_t                   id = 0;
  std::string                name;
  graphdoc::model::TypeKind  kind = graphdoc::model::TypeKind::kBase;
  std::optional<uint64_t>    parent_id;
  bool                       is_action = false;
  std::optional<std::string> description;
};

} // namespace graphdoc::db::model
