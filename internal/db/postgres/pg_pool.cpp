#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace graphdoc::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::BootstrapSchema() {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const auto& statement : sql::PostgresSchema()) {
    tx.exec(statement);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // type registry
  conn.prepare("insert_model_type",
               "INSERT INTO model_types(name,type_kind,parent_id,is_action,description) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("get_model_type", "SELECT id,name,type_kind,parent_id,is_action,description FROM model_types WHERE id=$1");
  conn.prepare("get_model_type_by_name", "SELECT id,name,type_kind,parent_id,is_action,description FROM model_types WHERE name=$1");
  conn.prepare("list_model_types", "SELECT id,name,type_kind,parent_id,is_action,description FROM model_types ORDER BY id");

  conn.prepare("insert_attribute_definition",
               "INSERT INTO attribute_definitions(model_type_id,key,value_type,required,constraints) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("get_attribute_definition",
               "SELECT id,model_type_id,key,value_type,required,constraints FROM attribute_definitions "
               "WHERE model_type_id=$1 AND key=$2");
  conn.prepare("list_attribute_definitions",
               "SELECT id,model_type_id,key,value_type,required,constraints FROM attribute_definitions "
               "WHERE model_type_id=$1 ORDER BY id");

  conn.prepare("insert_relationship_type",
               "INSERT INTO relationship_types(from_model_type_id,to_model_type_id,relation_name,multiplicity,description) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("get_relationship_type",
               "SELECT id,from_model_type_id,to_model_type_id,relation_name,multiplicity,description FROM relationship_types WHERE id=$1");
  conn.prepare("find_relationship_type",
               "SELECT id,from_model_type_id,to_model_type_id,relation_name,multiplicity,description FROM relationship_types "
               "WHERE from_model_type_id=$1 AND to_model_type_id=$2 AND relation_name=$3");
  conn.prepare("list_relationship_types_by_name",
               "SELECT id,from_model_type_id,to_model_type_id,relation_name,multiplicity,description FROM relationship_types "
               "WHERE relation_name=$1 ORDER BY id");

  conn.prepare("insert_relation_attribute_definition",
               "INSERT INTO relation_attribute_definitions(relationship_type_id,key,value_type,required) "
               "VALUES($1,$2,$3,$4) RETURNING id");
  conn.prepare("get_relation_attribute_definition",
               "SELECT id,relationship_type_id,key,value_type,required FROM relation_attribute_definitions "
               "WHERE relationship_type_id=$1 AND key=$2");
  conn.prepare("list_relation_attribute_definitions",
               "SELECT id,relationship_type_id,key,value_type,required FROM relation_attribute_definitions "
               "WHERE relationship_type_id=$1 ORDER BY id");

  // entities
  conn.prepare("insert_entity",
               "INSERT INTO entities(model_type_id,title,body,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("get_entity", "SELECT id,model_type_id,title,body,created_at_ms,updated_at_ms FROM entities WHERE id=$1");
  conn.prepare("lock_entity", "SELECT id FROM entities WHERE id=$1 FOR UPDATE");
  conn.prepare("list_entities",
               "SELECT e.id,e.model_type_id,e.title,e.body,e.created_at_ms,e.updated_at_ms FROM entities e "
               "WHERE ($1::bigint IS NULL OR e.model_type_id=$1) "
               "AND ($2::bigint IS NULL OR EXISTS (SELECT 1 FROM trait_assignments ta WHERE ta.entity_id=e.id AND ta.trait_type_id=$2)) "
               "AND ($3::text IS NULL OR e.title=$3) "
               "ORDER BY e.id");
  conn.prepare("update_entity",
               "UPDATE entities SET model_type_id=$2,title=$3,body=$4,created_at_ms=$5,updated_at_ms=$6 WHERE id=$1");
  conn.prepare("delete_entity", "DELETE FROM entities WHERE id=$1");

  conn.prepare("insert_trait_assignment",
               "INSERT INTO trait_assignments(entity_id,trait_type_id,applied_at_ms) VALUES($1,$2,$3) RETURNING id");
  conn.prepare("list_trait_assignments",
               "SELECT id,entity_id,trait_type_id,applied_at_ms FROM trait_assignments WHERE entity_id=$1 ORDER BY id");

  conn.prepare("insert_attribute",
               "INSERT INTO attributes(entity_id,attribute_definition_id,value_text,value_number,value_time_ms,value_bool,value_vector,value_key) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");
  conn.prepare("list_attributes",
               "SELECT id,entity_id,attribute_definition_id,value_text,value_number,value_time_ms,value_bool,value_vector "
               "FROM attributes WHERE entity_id=$1 ORDER BY id");

  conn.prepare("upsert_embedding",
               "INSERT INTO embeddings(entity_id,embedding) VALUES($1,$2) "
               "ON CONFLICT(entity_id) DO UPDATE SET embedding=EXCLUDED.embedding");
  conn.prepare("get_embedding", "SELECT entity_id,embedding FROM embeddings WHERE entity_id=$1");

  // relations
  conn.prepare("insert_relation",
               "INSERT INTO relations(from_id,to_id,relationship_type_id,created_at_ms) VALUES($1,$2,$3,$4) RETURNING id");
  conn.prepare("get_relation", "SELECT id,from_id,to_id,relationship_type_id,created_at_ms FROM relations WHERE id=$1");
  conn.prepare("list_relations",
               "SELECT id,from_id,to_id,relationship_type_id,created_at_ms FROM relations WHERE from_id=$1 OR to_id=$1 ORDER BY id");
  conn.prepare("delete_relation", "DELETE FROM relations WHERE id=$1");

  conn.prepare("insert_relation_attribute",
               "INSERT INTO relation_attributes(relation_id,relation_attribute_definition_id,value_text,value_number,value_time_ms,"
               "value_bool,value_vector,value_key) VALUES($1,$2,$3,$4,$5,$6,$7,$8) RETURNING id");
  conn.prepare("list_relation_attributes",
               "SELECT id,relation_id,relation_attribute_definition_id,value_text,value_number,value_time_ms,value_bool,value_vector "
               "FROM relation_attributes WHERE relation_id=$1 ORDER BY id");

  // stored materialization
  conn.prepare("get_model_full", "SELECT graphdoc_get_model_full($1)::text");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace graphdoc::db::postgres
