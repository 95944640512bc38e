#pragma once

#include <memory>

namespace graphdoc::db { class Repository; }
namespace graphdoc::registry { class TypeRegistry; }
namespace graphdoc::entity { class EntityStore; }
namespace graphdoc::relation { class RelationshipStore; }
namespace graphdoc::materialize { class GraphMaterializer; }

namespace graphdoc::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<graphdoc::db::Repository>                 repository;
  std::shared_ptr<graphdoc::registry::TypeRegistry>         registry;
  std::shared_ptr<graphdoc::entity::EntityStore>            entities;
  std::shared_ptr<graphdoc::relation::RelationshipStore>    relations;
  std::shared_ptr<graphdoc::materialize::GraphMaterializer> materializer;
};

} // namespace graphdoc::service
