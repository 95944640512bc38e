#include "relationship_store.hpp"

#include "internal/entity/entity_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace graphdoc::relation {

using db::TxMode;
using db::model::EntityRecord;
using db::model::RelationRecord;

namespace {

EntityRecord RequireEndpoint(db::Repository& repository, db::Transaction& tx, uint64_t entity_id) {
  auto entity = repository.GetEntity(tx, entity_id);
  if (!entity) {
    throw util::EntityNotFound("entity " + std::to_string(entity_id) + " not found");
  }
  return std::move(*entity);
}

} // namespace

RelationshipStore::RelationshipStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t RelationshipStore::CreateRelation(uint64_t from_id, uint64_t to_id, uint64_t relationship_type_id) {
  auto tx = util::BeginOrThrow(*repository_);

  // serializes multiplicity checks for the same source entity
  auto lock = repository_->LockEntity(*tx, from_id);
  if (lock.code == db::ErrorCode::NotFound) {
    throw util::EntityNotFound("entity " + std::to_string(from_id) + " not found");
  }
  util::ThrowIfDbError(lock, "lock entity " + std::to_string(from_id));

  const auto from = RequireEndpoint(*repository_, *tx, from_id);
  const auto to   = RequireEndpoint(*repository_, *tx, to_id);

  auto type = repository_->GetRelationshipType(*tx, relationship_type_id);
  if (!type) {
    throw util::NotFound("relationship type " + std::to_string(relationship_type_id) + " not found");
  }

  if (from.model_type_id != type->from_model_type_id || to.model_type_id != type->to_model_type_id) {
    throw util::EndpointTypeMismatch("relationship type '" + type->relation_name + "' expects types " +
                                     std::to_string(type->from_model_type_id) + " -> " + std::to_string(type->to_model_type_id) +
                                     ", got " + std::to_string(from.model_type_id) + " -> " + std::to_string(to.model_type_id));
  }

  if (type->multiplicity == db::model::kMultiplicityOne) {
    for (const auto& existing : repository_->ListRelations(*tx, from_id)) {
      if (existing.from_id == from_id && existing.relationship_type_id == relationship_type_id) {
        throw util::MultiplicityExceeded("entity " + std::to_string(from_id) + " already has a '" + type->relation_name + "' relation");
      }
    }
  }

  RelationRecord record;
  record.from_id              = from_id;
  record.to_id                = to_id;
  record.relationship_type_id = relationship_type_id;
  util::ThrowIfDbError(repository_->InsertRelation(*tx, record), "create relation '" + type->relation_name + "'");

  util::CommitOrThrow(*tx);

  GRAPHDOC_LOG_DEBUG("relation created", {observability::UintField("relation_id", record.id),
                                          observability::StringField("relation_name", type->relation_name),
                                          observability::UintField("from_id", from_id), observability::UintField("to_id", to_id)});
  return record.id;
}

uint64_t RelationshipStore::SetRelationAttribute(uint64_t relation_id, const std::string& key, const model::AttributeValue& value) {
  entity::ValidateStorable(value);

  auto tx = util::BeginOrThrow(*repository_);

  auto relation = repository_->GetRelation(*tx, relation_id);
  if (!relation) {
    throw util::NotFound("relation " + std::to_string(relation_id) + " not found");
  }

  auto definition = repository_->GetRelationAttributeDefinition(*tx, relation->relationship_type_id, key);
  if (!definition) {
    throw util::UnknownAttributeKey("relation attribute '" + key + "' is not declared by relationship type " +
                                    std::to_string(relation->relationship_type_id));
  }
  if (model::TypeOf(value) != definition->value_type) {
    throw util::TypeMismatch("relation attribute '" + key + "' expects " + std::string(model::ToString(definition->value_type)) +
                             ", got " + std::string(model::ToString(model::TypeOf(value))));
  }

  db::model::RelationAttributeRecord record;
  record.relation_id                      = relation_id;
  record.relation_attribute_definition_id = definition->id;
  record.columns                          = model::ToColumns(value);

  const auto value_key = model::ValueKey(record.columns);
  for (const auto& existing : repository_->ListRelationAttributes(*tx, relation_id)) {
    if (existing.relation_attribute_definition_id == definition->id && model::ValueKey(existing.columns) == value_key) {
      throw util::DuplicateValue("relation attribute '" + key + "' already holds " + model::DebugString(value));
    }
  }

  util::ThrowIfDbError<util::DuplicateValue>(repository_->InsertRelationAttribute(*tx, record), "set relation attribute '" + key + "'");

  util::CommitOrThrow(*tx);
  return record.id;
}

void RelationshipStore::DeleteRelation(uint64_t relation_id) {
  auto tx = util::BeginOrThrow(*repository_);
  util::ThrowIfDbError(repository_->DeleteRelation(*tx, relation_id), "delete relation " + std::to_string(relation_id));
  util::CommitOrThrow(*tx);
}

std::optional<RelationRecord> RelationshipStore::GetRelation(uint64_t relation_id) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return repository_->GetRelation(*tx, relation_id);
}

std::vector<RelationRecord> RelationshipStore::ListRelations(uint64_t entity_id) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  RequireEndpoint(*repository_, *tx, entity_id);
  return repository_->ListRelations(*tx, entity_id);
}

} // namespace graphdoc::relation
