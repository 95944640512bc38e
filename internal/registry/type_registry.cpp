#include "type_registry.hpp"

#include "internal/model/constraints.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace graphdoc::registry {

using db::TxMode;
using db::model::AttributeDefinitionRecord;
using db::model::ModelTypeRecord;
using db::model::RelationAttributeDefinitionRecord;
using db::model::RelationshipTypeRecord;

namespace {

void RequireNonEmpty(const std::string& value, const char* what) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(what) + " must not be empty");
  }
}

template <typename T>
T OrNotFound(std::optional<T> value, const std::string& what) {
  if (!value) {
    throw util::NotFound(what + " not found");
  }
  return std::move(*value);
}

} // namespace

TypeRegistry::TypeRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t TypeRegistry::DefineType(const std::string& name, model::TypeKind kind, std::optional<uint64_t> parent_id,
                                  std::optional<std::string> description, bool is_action) {
  RequireNonEmpty(name, "type name");

  auto tx = util::BeginOrThrow(*repository_);

  if (repository_->GetModelTypeByName(*tx, name)) {
    throw util::DuplicateName("model type '" + name + "' already exists");
  }
  if (parent_id && !repository_->GetModelType(*tx, *parent_id)) {
    throw util::UnknownType("parent model type " + std::to_string(*parent_id) + " does not exist");
  }

  ModelTypeRecord record;
  record.name        = name;
  record.kind        = kind;
  record.parent_id   = parent_id;
  record.is_action   = is_action;
  record.description = std::move(description);
  util::ThrowIfDbError<util::DuplicateName>(repository_->InsertModelType(*tx, record), "define type '" + name + "'");

  util::CommitOrThrow(*tx);

  GRAPHDOC_LOG_INFO("model type defined", {observability::StringField("name", name),
                                           observability::StringField("kind", model::ToString(kind)),
                                           observability::UintField("type_id", record.id)});
  return record.id;
}

uint64_t TypeRegistry::DefineAttribute(uint64_t model_type_id, const std::string& key, model::ValueType value_type, bool required,
                                       const std::string& constraints) {
  RequireNonEmpty(key, "attribute key");

  // rejects malformed documents before anything is written
  (void)model::AttributeConstraints::Parse(constraints);

  auto tx = util::BeginOrThrow(*repository_);

  if (!repository_->GetModelType(*tx, model_type_id)) {
    throw util::UnknownType("model type " + std::to_string(model_type_id) + " does not exist");
  }
  if (repository_->GetAttributeDefinition(*tx, model_type_id, key)) {
    throw util::DuplicateKey("attribute '" + key + "' already defined on type " + std::to_string(model_type_id));
  }

  AttributeDefinitionRecord record;
  record.model_type_id = model_type_id;
  record.key           = key;
  record.value_type    = value_type;
  record.required      = required;
  record.constraints   = constraints;
  util::ThrowIfDbError<util::DuplicateKey>(repository_->InsertAttributeDefinition(*tx, record), "define attribute '" + key + "'");

  util::CommitOrThrow(*tx);
  return record.id;
}

uint64_t TypeRegistry::DefineRelationshipType(uint64_t from_model_type_id, uint64_t to_model_type_id, const std::string& relation_name,
                                              const std::string& multiplicity, std::optional<std::string> description) {
  RequireNonEmpty(relation_name, "relation name");
  if (multiplicity != db::model::kMultiplicityMany && multiplicity != db::model::kMultiplicityOne) {
    throw util::InvalidArgument("multiplicity must be 'many' or 'one', got '" + multiplicity + "'");
  }

  auto tx = util::BeginOrThrow(*repository_);

  for (const uint64_t endpoint : {from_model_type_id, to_model_type_id}) {
    auto type = repository_->GetModelType(*tx, endpoint);
    if (!type) {
      throw util::UnknownType("model type " + std::to_string(endpoint) + " does not exist");
    }
    if (type->kind != model::TypeKind::kBase) {
      throw util::InvalidBaseType("relationship endpoint '" + type->name + "' is not a base type");
    }
  }

  if (repository_->FindRelationshipType(*tx, from_model_type_id, to_model_type_id, relation_name)) {
    throw util::DuplicateName("relationship type '" + relation_name + "' already exists for these endpoints");
  }

  RelationshipTypeRecord record;
  record.from_model_type_id = from_model_type_id;
  record.to_model_type_id   = to_model_type_id;
  record.relation_name      = relation_name;
  record.multiplicity       = multiplicity;
  record.description        = std::move(description);
  util::ThrowIfDbError<util::DuplicateName>(repository_->InsertRelationshipType(*tx, record),
                                            "define relationship type '" + relation_name + "'");

  util::CommitOrThrow(*tx);

  GRAPHDOC_LOG_INFO("relationship type defined", {observability::StringField("relation_name", relation_name),
                                                  observability::UintField("from_type_id", from_model_type_id),
                                                  observability::UintField("to_type_id", to_model_type_id)});
  return record.id;
}

uint64_t TypeRegistry::DefineRelationAttribute(uint64_t relationship_type_id, const std::string& key, model::ValueType value_type,
                                               bool required) {
  RequireNonEmpty(key, "relation attribute key");

  auto tx = util::BeginOrThrow(*repository_);

  if (!repository_->GetRelationshipType(*tx, relationship_type_id)) {
    throw util::UnknownType("relationship type " + std::to_string(relationship_type_id) + " does not exist");
  }
  if (repository_->GetRelationAttributeDefinition(*tx, relationship_type_id, key)) {
    throw util::DuplicateKey("relation attribute '" + key + "' already defined");
  }

  RelationAttributeDefinitionRecord record;
  record.relationship_type_id = relationship_type_id;
  record.key                  = key;
  record.value_type           = value_type;
  record.required             = required;
  util::ThrowIfDbError<util::DuplicateKey>(repository_->InsertRelationAttributeDefinition(*tx, record),
                                           "define relation attribute '" + key + "'");

  util::CommitOrThrow(*tx);
  return record.id;
}

// ------------------------------------------------------------------
// Lookups
// ------------------------------------------------------------------

ModelTypeRecord TypeRegistry::GetType(uint64_t id) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return OrNotFound(repository_->GetModelType(*tx, id), "model type " + std::to_string(id));
}

ModelTypeRecord TypeRegistry::GetTypeByName(const std::string& name) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return OrNotFound(repository_->GetModelTypeByName(*tx, name), "model type '" + name + "'");
}

std::vector<ModelTypeRecord> TypeRegistry::ListTypes() {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return repository_->ListModelTypes(*tx);
}

AttributeDefinitionRecord TypeRegistry::GetAttributeDefinition(uint64_t model_type_id, const std::string& key) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return OrNotFound(repository_->GetAttributeDefinition(*tx, model_type_id, key), "attribute '" + key + "'");
}

std::vector<AttributeDefinitionRecord> TypeRegistry::ListAttributeDefinitions(uint64_t model_type_id) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return repository_->ListAttributeDefinitions(*tx, model_type_id);
}

RelationshipTypeRecord TypeRegistry::GetRelationshipType(uint64_t id) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return OrNotFound(repository_->GetRelationshipType(*tx, id), "relationship type " + std::to_string(id));
}

RelationshipTypeRecord TypeRegistry::GetRelationshipType(uint64_t from_model_type_id, uint64_t to_model_type_id,
                                                         const std::string& relation_name) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return OrNotFound(repository_->FindRelationshipType(*tx, from_model_type_id, to_model_type_id, relation_name),
                    "relationship type '" + relation_name + "'");
}

std::vector<RelationshipTypeRecord> TypeRegistry::ListRelationshipTypesByName(const std::string& relation_name) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return repository_->ListRelationshipTypesByName(*tx, relation_name);
}

RelationAttributeDefinitionRecord TypeRegistry::GetRelationAttributeDefinition(uint64_t relationship_type_id, const std::string& key) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return OrNotFound(repository_->GetRelationAttributeDefinition(*tx, relationship_type_id, key), "relation attribute '" + key + "'");
}

std::vector<RelationAttributeDefinitionRecord> TypeRegistry::ListRelationAttributeDefinitions(uint64_t relationship_type_id) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return repository_->ListRelationAttributeDefinitions(*tx, relationship_type_id);
}

} // namespace graphdoc::registry
