#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/materialize/materialized_model.hpp"

namespace graphdoc::materialize {

/*
  GraphMaterializer

  Assembles the full view of one entity: its base type and traits, one
  value per attribute key, and every incident relation with a one-hop
  view of the entity on the other end. All reads happen inside a single
  read-only transaction, so the result reflects one consistent state.

  Multi-valued keys collapse to the most recently stored value.
*/
class GraphMaterializer {
 public:
  struct Options {
    bool use_stored_function = false;
    bool validate_output     = false;
  };

  explicit GraphMaterializer(std::shared_ptr<db::Repository> repository);
  GraphMaterializer(std::shared_ptr<db::Repository> repository, Options options);

  // nullopt when the entity does not exist
  std::optional<MaterializedModel> Build(uint64_t entity_id);

  // Canonical model_full shape, always passed through the standardizer.
  std::optional<google::protobuf::Value> Materialize(uint64_t entity_id);

 private:
  std::optional<google::protobuf::Value> MaterializeStored(uint64_t entity_id);

  std::shared_ptr<db::Repository> repository_;
  Options                         options_;
};

} // namespace graphdoc::materialize
