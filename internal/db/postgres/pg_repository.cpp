#include "pg_repository.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace graphdoc::db::postgres {

using graphdoc::model::TypedColumns;

namespace {

// Reads cannot report a Result; backend failures surface as StoreUnavailable.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("postgres read failed: ") + e.what());
  }
}

template <typename T>
std::optional<T> Opt(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<T>();
}

model::ModelTypeRecord ReadModelType(const pqxx::row& row) {
  model::ModelTypeRecord r;
  r.id          = row[0].as<uint64_t>();
  r.name        = row[1].as<std::string>();
  r.kind        = graphdoc::model::ParseTypeKind(row[2].as<std::string>()).value_or(graphdoc::model::TypeKind::kBase);
  r.parent_id   = Opt<uint64_t>(row[3]);
  r.is_action   = row[4].as<bool>();
  r.description = Opt<std::string>(row[5]);
  return r;
}

model::AttributeDefinitionRecord ReadAttributeDefinition(const pqxx::row& row) {
  model::AttributeDefinitionRecord r;
  r.id            = row[0].as<uint64_t>();
  r.model_type_id = row[1].as<uint64_t>();
  r.key           = row[2].as<std::string>();
  r.value_type    = graphdoc::model::ParseValueType(row[3].as<std::string>()).value_or(graphdoc::model::ValueType::kString);
  r.required      = row[4].as<bool>();
  r.constraints   = Opt<std::string>(row[5]).value_or("");
  return r;
}

model::RelationshipTypeRecord ReadRelationshipType(const pqxx::row& row) {
  model::RelationshipTypeRecord r;
  r.id                 = row[0].as<uint64_t>();
  r.from_model_type_id = row[1].as<uint64_t>();
  r.to_model_type_id   = row[2].as<uint64_t>();
  r.relation_name      = row[3].as<std::string>();
  r.multiplicity       = row[4].as<std::string>();
  r.description        = Opt<std::string>(row[5]);
  return r;
}

model::RelationAttributeDefinitionRecord ReadRelationAttributeDefinition(const pqxx::row& row) {
  model::RelationAttributeDefinitionRecord r;
  r.id                   = row[0].as<uint64_t>();
  r.relationship_type_id = row[1].as<uint64_t>();
  r.key                  = row[2].as<std::string>();
  r.value_type           = graphdoc::model::ParseValueType(row[3].as<std::string>()).value_or(graphdoc::model::ValueType::kString);
  r.required             = row[4].as<bool>();
  return r;
}

model::EntityRecord ReadEntity(const pqxx::row& row) {
  model::EntityRecord r;
  r.id            = row[0].as<uint64_t>();
  r.model_type_id = row[1].as<uint64_t>();
  r.title         = row[2].as<std::string>();
  r.body          = Opt<std::string>(row[3]);
  r.created_at_ms = row[4].as<uint64_t>();
  r.updated_at_ms = row[5].as<uint64_t>();
  return r;
}

model::RelationRecord ReadRelation(const pqxx::row& row) {
  model::RelationRecord r;
  r.id                   = row[0].as<uint64_t>();
  r.from_id              = row[1].as<uint64_t>();
  r.to_id                = row[2].as<uint64_t>();
  r.relationship_type_id = row[3].as<uint64_t>();
  r.created_at_ms        = row[4].as<uint64_t>();
  return r;
}

// value_text..value_vector starting at col
TypedColumns ReadColumns(const pqxx::row& row, int col) {
  TypedColumns c;
  c.text    = Opt<std::string>(row[col]);
  c.number  = Opt<double>(row[col + 1]);
  c.time_ms = Opt<int64_t>(row[col + 2]);
  c.boolean = Opt<bool>(row[col + 3]);
  c.vector  = Opt<std::string>(row[col + 4]);
  return c;
}

template <typename Record, typename ReadFn>
std::vector<Record> ReadAll(const pqxx::result& res, ReadFn read) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

template <typename Record, typename ReadFn>
std::optional<Record> ReadFirst(const pqxx::result& res, ReadFn read) {
  if (res.empty()) return std::nullopt;
  return read(res[0]);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(TxMode mode) {
  return std::make_unique<PgTransaction>(pool_, mode);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Type registry
// ------------------------------------------------------------------

Result PgRepository::InsertModelType(Transaction& t, model::ModelTypeRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_model_type", r.name, std::string(graphdoc::model::ToString(r.kind)), r.parent_id,
                                          r.is_action, r.description);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ModelTypeRecord> PgRepository::GetModelType(Transaction& t, uint64_t id) {
  return Read([&] { return ReadFirst<model::ModelTypeRecord>(TX(t).Work().exec_prepared("get_model_type", id), ReadModelType); });
}

std::optional<model::ModelTypeRecord> PgRepository::GetModelTypeByName(Transaction& t, const std::string& name) {
  return Read([&] { return ReadFirst<model::ModelTypeRecord>(TX(t).Work().exec_prepared("get_model_type_by_name", name), ReadModelType); });
}

std::vector<model::ModelTypeRecord> PgRepository::ListModelTypes(Transaction& t) {
  return Read([&] { return ReadAll<model::ModelTypeRecord>(TX(t).Work().exec_prepared("list_model_types"), ReadModelType); });
}

Result PgRepository::InsertAttributeDefinition(Transaction& t, model::AttributeDefinitionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_attribute_definition", r.model_type_id, r.key,
                                          std::string(graphdoc::model::ToString(r.value_type)), r.required, r.constraints);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AttributeDefinitionRecord> PgRepository::GetAttributeDefinition(Transaction& t, uint64_t model_type_id,
                                                                                     const std::string& key) {
  return Read([&] {
    return ReadFirst<model::AttributeDefinitionRecord>(TX(t).Work().exec_prepared("get_attribute_definition", model_type_id, key),
                                                       ReadAttributeDefinition);
  });
}

std::vector<model::AttributeDefinitionRecord> PgRepository::ListAttributeDefinitions(Transaction& t, uint64_t model_type_id) {
  return Read([&] {
    return ReadAll<model::AttributeDefinitionRecord>(TX(t).Work().exec_prepared("list_attribute_definitions", model_type_id),
                                                     ReadAttributeDefinition);
  });
}

Result PgRepository::InsertRelationshipType(Transaction& t, model::RelationshipTypeRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_relationship_type", r.from_model_type_id, r.to_model_type_id, r.relation_name,
                                          r.multiplicity, r.description);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RelationshipTypeRecord> PgRepository::GetRelationshipType(Transaction& t, uint64_t id) {
  return Read([&] {
    return ReadFirst<model::RelationshipTypeRecord>(TX(t).Work().exec_prepared("get_relationship_type", id), ReadRelationshipType);
  });
}

std::optional<model::RelationshipTypeRecord> PgRepository::FindRelationshipType(Transaction& t, uint64_t from_model_type_id,
                                                                                uint64_t to_model_type_id, const std::string& relation_name) {
  return Read([&] {
    return ReadFirst<model::RelationshipTypeRecord>(
        TX(t).Work().exec_prepared("find_relationship_type", from_model_type_id, to_model_type_id, relation_name), ReadRelationshipType);
  });
}

std::vector<model::RelationshipTypeRecord> PgRepository::ListRelationshipTypesByName(Transaction& t, const std::string& relation_name) {
  return Read([&] {
    return ReadAll<model::RelationshipTypeRecord>(TX(t).Work().exec_prepared("list_relationship_types_by_name", relation_name),
                                                  ReadRelationshipType);
  });
}

Result PgRepository::InsertRelationAttributeDefinition(Transaction& t, model::RelationAttributeDefinitionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_relation_attribute_definition", r.relationship_type_id, r.key,
                                          std::string(graphdoc::model::ToString(r.value_type)), r.required);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RelationAttributeDefinitionRecord> PgRepository::GetRelationAttributeDefinition(Transaction& t,
                                                                                                     uint64_t relationship_type_id,
                                                                                                     const std::string& key) {
  return Read([&] {
    return ReadFirst<model::RelationAttributeDefinitionRecord>(
        TX(t).Work().exec_prepared("get_relation_attribute_definition", relationship_type_id, key), ReadRelationAttributeDefinition);
  });
}

std::vector<model::RelationAttributeDefinitionRecord> PgRepository::ListRelationAttributeDefinitions(Transaction& t,
                                                                                                     uint64_t relationship_type_id) {
  return Read([&] {
    return ReadAll<model::RelationAttributeDefinitionRecord>(
        TX(t).Work().exec_prepared("list_relation_attribute_definitions", relationship_type_id), ReadRelationAttributeDefinition);
  });
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result PgRepository::InsertEntity(Transaction& t, model::EntityRecord& r) {
  try {
    if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
    if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

    auto res = TX(t).Work().exec_prepared("insert_entity", r.model_type_id, r.title, r.body, r.created_at_ms, r.updated_at_ms);
    r.id     = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EntityRecord> PgRepository::GetEntity(Transaction& t, uint64_t id) {
  return Read([&] { return ReadFirst<model::EntityRecord>(TX(t).Work().exec_prepared("get_entity", id), ReadEntity); });
}

std::vector<model::EntityRecord> PgRepository::ListEntities(Transaction& t, const model::EntityFilter& filter) {
  return Read([&] {
    return ReadAll<model::EntityRecord>(
        TX(t).Work().exec_prepared("list_entities", filter.base_type_id, filter.trait_type_id, filter.title), ReadEntity);
  });
}

Result PgRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r) {
  try {
    auto res =
        TX(t).Work().exec_prepared("update_entity", r.id, r.model_type_id, r.title, r.body, r.created_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteEntity(Transaction& t, uint64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_entity", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::LockEntity(Transaction& t, uint64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("lock_entity", id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertTraitAssignment(Transaction& t, model::TraitAssignmentRecord& r) {
  try {
    if (r.applied_at_ms == 0) r.applied_at_ms = util::NowMillis();
    auto res = TX(t).Work().exec_prepared("insert_trait_assignment", r.entity_id, r.trait_type_id, r.applied_at_ms);
    r.id     = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TraitAssignmentRecord> PgRepository::ListTraitAssignments(Transaction& t, uint64_t entity_id) {
  return Read([&] {
    return ReadAll<model::TraitAssignmentRecord>(TX(t).Work().exec_prepared("list_trait_assignments", entity_id), [](const pqxx::row& row) {
      model::TraitAssignmentRecord r;
      r.id            = row[0].as<uint64_t>();
      r.entity_id     = row[1].as<uint64_t>();
      r.trait_type_id = row[2].as<uint64_t>();
      r.applied_at_ms = row[3].as<uint64_t>();
      return r;
    });
  });
}

Result PgRepository::InsertAttribute(Transaction& t, model::AttributeRecord& r) {
  try {
    const auto& c   = r.columns;
    auto        res = TX(t).Work().exec_prepared("insert_attribute", r.entity_id, r.attribute_definition_id, c.text, c.number, c.time_ms,
                                                 c.boolean, c.vector, graphdoc::model::ValueKey(c));
    r.id            = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AttributeRecord> PgRepository::ListAttributes(Transaction& t, uint64_t entity_id) {
  return Read([&] {
    return ReadAll<model::AttributeRecord>(TX(t).Work().exec_prepared("list_attributes", entity_id), [](const pqxx::row& row) {
      model::AttributeRecord r;
      r.id                      = row[0].as<uint64_t>();
      r.entity_id               = row[1].as<uint64_t>();
      r.attribute_definition_id = row[2].as<uint64_t>();
      r.columns                 = ReadColumns(row, 3);
      return r;
    });
  });
}

Result PgRepository::UpsertEmbedding(Transaction& t, const model::EmbeddingRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_embedding", r.entity_id, r.embedding);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EmbeddingRecord> PgRepository::GetEmbedding(Transaction& t, uint64_t entity_id) {
  return Read([&] {
    return ReadFirst<model::EmbeddingRecord>(TX(t).Work().exec_prepared("get_embedding", entity_id), [](const pqxx::row& row) {
      model::EmbeddingRecord r;
      r.entity_id = row[0].as<uint64_t>();
      r.embedding = row[1].as<std::string>();
      return r;
    });
  });
}

// ------------------------------------------------------------------
// Relations
// ------------------------------------------------------------------

Result PgRepository::InsertRelation(Transaction& t, model::RelationRecord& r) {
  try {
    if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
    auto res = TX(t).Work().exec_prepared("insert_relation", r.from_id, r.to_id, r.relationship_type_id, r.created_at_ms);
    r.id     = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RelationRecord> PgRepository::GetRelation(Transaction& t, uint64_t id) {
  return Read([&] { return ReadFirst<model::RelationRecord>(TX(t).Work().exec_prepared("get_relation", id), ReadRelation); });
}

std::vector<model::RelationRecord> PgRepository::ListRelations(Transaction& t, uint64_t entity_id) {
  return Read([&] { return ReadAll<model::RelationRecord>(TX(t).Work().exec_prepared("list_relations", entity_id), ReadRelation); });
}

Result PgRepository::DeleteRelation(Transaction& t, uint64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_relation", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertRelationAttribute(Transaction& t, model::RelationAttributeRecord& r) {
  try {
    const auto& c   = r.columns;
    auto        res = TX(t).Work().exec_prepared("insert_relation_attribute", r.relation_id, r.relation_attribute_definition_id, c.text,
                                                 c.number, c.time_ms, c.boolean, c.vector, graphdoc::model::ValueKey(c));
    r.id            = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RelationAttributeRecord> PgRepository::ListRelationAttributes(Transaction& t, uint64_t relation_id) {
  return Read([&] {
    return ReadAll<model::RelationAttributeRecord>(TX(t).Work().exec_prepared("list_relation_attributes", relation_id),
                                                   [](const pqxx::row& row) {
                                                     model::RelationAttributeRecord r;
                                                     r.id                               = row[0].as<uint64_t>();
                                                     r.relation_id                      = row[1].as<uint64_t>();
                                                     r.relation_attribute_definition_id = row[2].as<uint64_t>();
                                                     r.columns                          = ReadColumns(row, 3);
                                                     return r;
                                                   });
  });
}

// ------------------------------------------------------------------
// Stored materialization
// ------------------------------------------------------------------

std::optional<std::string> PgRepository::LoadMaterializedJson(Transaction& t, uint64_t entity_id) {
  return Read([&]() -> std::optional<std::string> {
    auto res = TX(t).Work().exec_prepared("get_model_full", entity_id);
    if (res.empty() || res[0][0].is_null()) return std::nullopt;
    return res[0][0].as<std::string>();
  });
}

}
