#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/materialize/graph_materializer.hpp"
#include "internal/registry/type_registry.hpp"
#include "internal/relation/relationship_store.hpp"
#include "internal/service/graph_service.hpp"

namespace graphdoc::factory {

/*
  RuntimeDependencies

  Owns all long-lived singletons of one store instance.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<registry::TypeRegistry>         registry;
  std::shared_ptr<entity::EntityStore>            entities;
  std::shared_ptr<relation::RelationshipStore>    relations;
  std::shared_ptr<materialize::GraphMaterializer> materializer;
  std::shared_ptr<service::GraphService>          graph_service;
};

/*
  BuildRuntime

  Constructs the backend selected by the database config (memory when
  none is set) and wires every component on top of it.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const graphdoc::runtime::config::RuntimeConfig& config);

} // namespace graphdoc::factory
