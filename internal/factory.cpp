#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#if GRAPHDOC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if GRAPHDOC_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace graphdoc::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const graphdoc::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if GRAPHDOC_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw util::InvalidArgument("database.sqlite.path must be set");
    }

    db::sqlite::SqliteOptions options;
    options.wal_mode = sqlite.wal_mode();
    if (sqlite.busy_timeout_ms() > 0) {
      options.busy_timeout_ms = sqlite.busy_timeout_ms();
    }

    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options));
    if (database.bootstrap_schema()) {
      repository->BootstrapSchema();
    }
    GRAPHDOC_LOG_INFO("sqlite repository ready", {observability::StringField("path", sqlite.path()),
                                                  observability::BoolField("wal_mode", options.wal_mode)});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if GRAPHDOC_DB_POSTGRES
    const auto& postgres = database.postgres();
    if (postgres.connection_uri().empty()) {
      throw util::InvalidArgument("database.postgres.connection_uri must be set");
    }

    auto pool = postgres.max_connections() > 0 ? std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections())
                                               : std::make_shared<db::postgres::PgPool>(postgres.connection_uri());
    // pooled connections prepare statements against the tables
    if (database.bootstrap_schema()) {
      pool->BootstrapSchema();
    }
    GRAPHDOC_LOG_INFO("postgres repository ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  GRAPHDOC_LOG_INFO("memory repository ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

RuntimeDependencies BuildRuntime(const graphdoc::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  deps.repository = BuildRepository(config.database());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  deps.registry  = std::make_shared<registry::TypeRegistry>(deps.repository);
  deps.entities  = std::make_shared<entity::EntityStore>(deps.repository);
  deps.relations = std::make_shared<relation::RelationshipStore>(deps.repository);

  materialize::GraphMaterializer::Options options;
  options.use_stored_function = config.materializer().use_stored_function();
  options.validate_output     = config.materializer().validate_output();
  deps.materializer           = std::make_shared<materialize::GraphMaterializer>(deps.repository, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = deps.repository;
  ctx.registry     = deps.registry;
  ctx.entities     = deps.entities;
  ctx.relations    = deps.relations;
  ctx.materializer = deps.materializer;

  deps.graph_service = std::make_shared<service::GraphService>(std::move(ctx));
  return deps;
}

} // namespace graphdoc::factory
