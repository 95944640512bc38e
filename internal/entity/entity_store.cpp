#include "entity_store.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <unordered_set>

#include "internal/model/constraints.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/db_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace graphdoc::entity {

using db::TxMode;
using db::model::AttributeDefinitionRecord;
using db::model::EntityRecord;

namespace {

EntityRecord RequireEntity(db::Repository& repository, db::Transaction& tx, uint64_t entity_id) {
  auto entity = repository.GetEntity(tx, entity_id);
  if (!entity) {
    throw util::EntityNotFound("entity " + std::to_string(entity_id) + " not found");
  }
  return std::move(*entity);
}

std::optional<AttributeDefinitionRecord> ResolveKey(const std::vector<AttributeDefinitionRecord>& definitions, const std::string& key) {
  auto it = std::find_if(definitions.begin(), definitions.end(), [&](const auto& d) { return d.key == key; });
  if (it == definitions.end()) return std::nullopt;
  return *it;
}

// Any mutation of an entity's content moves updated_at forward.
void Touch(db::Repository& repository, db::Transaction& tx, EntityRecord entity) {
  entity.updated_at_ms = std::max(util::NowMillis(), entity.updated_at_ms);
  util::ThrowIfDbError(repository.UpdateEntity(tx, entity), "touch entity " + std::to_string(entity.id));
}

} // namespace

std::vector<AttributeDefinitionRecord> EffectiveDefinitions(db::Repository& repository, db::Transaction& tx, const EntityRecord& entity) {
  auto definitions = repository.ListAttributeDefinitions(tx, entity.model_type_id);

  std::vector<uint64_t> trait_ids;
  for (const auto& assignment : repository.ListTraitAssignments(tx, entity.id)) {
    trait_ids.push_back(assignment.trait_type_id);
  }
  std::sort(trait_ids.begin(), trait_ids.end());

  for (const uint64_t trait_id : trait_ids) {
    auto trait_definitions = repository.ListAttributeDefinitions(tx, trait_id);
    definitions.insert(definitions.end(), trait_definitions.begin(), trait_definitions.end());
  }
  return definitions;
}

void ValidateStorable(const model::AttributeValue& value) {
  if (const auto* number = std::get_if<double>(&value); number && !std::isfinite(*number)) {
    throw util::InvalidArgument("number attribute values must be finite");
  }
  // datetimes are stored as epoch milliseconds
  if (const auto* when = std::get_if<util::TimePoint>(&value);
      when && std::chrono::floor<std::chrono::milliseconds>(*when) != *when) {
    throw util::InvalidArgument("datetime attribute values must be whole milliseconds");
  }
}

EntityStore::EntityStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t EntityStore::CreateEntity(uint64_t base_type_id, const std::string& title, std::optional<std::string> body) {
  if (title.empty()) {
    throw util::InvalidArgument("entity title must not be empty");
  }

  auto tx = util::BeginOrThrow(*repository_);

  auto type = repository_->GetModelType(*tx, base_type_id);
  if (!type) {
    throw util::UnknownType("model type " + std::to_string(base_type_id) + " does not exist");
  }
  if (type->kind != model::TypeKind::kBase) {
    throw util::InvalidBaseType("model type '" + type->name + "' is a trait, not a base type");
  }

  EntityRecord record;
  record.model_type_id = base_type_id;
  record.title         = title;
  record.body          = std::move(body);
  util::ThrowIfDbError(repository_->InsertEntity(*tx, record), "create entity");

  util::CommitOrThrow(*tx);

  GRAPHDOC_LOG_DEBUG("entity created", {observability::UintField("entity_id", record.id),
                                        observability::StringField("base_type", type->name)});
  return record.id;
}

std::optional<EntityRecord> EntityStore::GetEntity(uint64_t entity_id) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return repository_->GetEntity(*tx, entity_id);
}

void EntityStore::UpdateEntity(uint64_t entity_id, std::optional<std::string> title, std::optional<std::string> body) {
  if (title && title->empty()) {
    throw util::InvalidArgument("entity title must not be empty");
  }

  auto tx     = util::BeginOrThrow(*repository_);
  auto entity = RequireEntity(*repository_, *tx, entity_id);

  if (title) entity.title = std::move(*title);
  if (body) entity.body = std::move(*body);
  Touch(*repository_, *tx, std::move(entity));

  util::CommitOrThrow(*tx);
}

std::vector<EntityRecord> EntityStore::ListEntities(const db::model::EntityFilter& filter) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  return repository_->ListEntities(*tx, filter);
}

void EntityStore::AssignTrait(uint64_t entity_id, uint64_t trait_type_id) {
  auto tx     = util::BeginOrThrow(*repository_);
  auto entity = RequireEntity(*repository_, *tx, entity_id);

  auto trait = repository_->GetModelType(*tx, trait_type_id);
  if (!trait) {
    throw util::UnknownType("model type " + std::to_string(trait_type_id) + " does not exist");
  }
  if (trait->kind != model::TypeKind::kTrait) {
    throw util::InvalidTraitType("model type '" + trait->name + "' is not a trait type");
  }

  for (const auto& assignment : repository_->ListTraitAssignments(*tx, entity_id)) {
    if (assignment.trait_type_id == trait_type_id) {
      throw util::DuplicateTraitAssignment("trait '" + trait->name + "' already assigned to entity " + std::to_string(entity_id));
    }
  }

  db::model::TraitAssignmentRecord record;
  record.entity_id     = entity_id;
  record.trait_type_id = trait_type_id;
  util::ThrowIfDbError<util::DuplicateTraitAssignment>(repository_->InsertTraitAssignment(*tx, record), "assign trait '" + trait->name + "'");

  util::CommitOrThrow(*tx);
}

uint64_t EntityStore::SetAttribute(uint64_t entity_id, const std::string& key, const model::AttributeValue& value) {
  ValidateStorable(value);

  auto tx     = util::BeginOrThrow(*repository_);
  auto entity = RequireEntity(*repository_, *tx, entity_id);

  auto definition = ResolveKey(EffectiveDefinitions(*repository_, *tx, entity), key);
  if (!definition) {
    throw util::UnknownAttributeKey("attribute '" + key + "' is not declared by the type composition of entity " + std::to_string(entity_id));
  }
  if (model::TypeOf(value) != definition->value_type) {
    throw util::TypeMismatch("attribute '" + key + "' expects " + std::string(model::ToString(definition->value_type)) + ", got " +
                             std::string(model::ToString(model::TypeOf(value))));
  }
  if (auto violation = model::AttributeConstraints::Parse(definition->constraints).Check(value)) {
    throw util::ConstraintViolation("attribute '" + key + "': " + *violation);
  }

  db::model::AttributeRecord record;
  record.entity_id               = entity_id;
  record.attribute_definition_id = definition->id;
  record.columns                 = model::ToColumns(value);

  const auto value_key = model::ValueKey(record.columns);
  for (const auto& existing : repository_->ListAttributes(*tx, entity_id)) {
    if (existing.attribute_definition_id == definition->id && model::ValueKey(existing.columns) == value_key) {
      throw util::DuplicateValue("attribute '" + key + "' already holds " + model::DebugString(value));
    }
  }

  util::ThrowIfDbError<util::DuplicateValue>(repository_->InsertAttribute(*tx, record), "set attribute '" + key + "'");
  Touch(*repository_, *tx, std::move(entity));

  util::CommitOrThrow(*tx);
  return record.id;
}

std::vector<model::AttributeValue> EntityStore::GetAttributeValues(uint64_t entity_id, const std::string& key) {
  auto tx     = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  auto entity = RequireEntity(*repository_, *tx, entity_id);

  auto definition = ResolveKey(EffectiveDefinitions(*repository_, *tx, entity), key);
  if (!definition) {
    throw util::UnknownAttributeKey("attribute '" + key + "' is not declared by the type composition of entity " + std::to_string(entity_id));
  }

  std::vector<model::AttributeValue> values;
  for (const auto& row : repository_->ListAttributes(*tx, entity_id)) {
    if (row.attribute_definition_id != definition->id) continue;
    if (auto value = model::FromColumns(row.columns)) {
      values.push_back(std::move(*value));
    } else {
      GRAPHDOC_LOG_WARN("skipping corrupt attribute row", {observability::UintField("attribute_id", row.id)});
    }
  }
  return values;
}

std::vector<std::string> EntityStore::MissingRequiredAttributes(uint64_t entity_id) {
  auto tx     = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  auto entity = RequireEntity(*repository_, *tx, entity_id);

  std::unordered_set<uint64_t> populated;
  for (const auto& row : repository_->ListAttributes(*tx, entity_id)) {
    populated.insert(row.attribute_definition_id);
  }

  std::vector<std::string>        missing;
  std::unordered_set<std::string> seen;
  for (const auto& definition : EffectiveDefinitions(*repository_, *tx, entity)) {
    // shadowed by an earlier definition of the same key
    if (!seen.insert(definition.key).second) continue;
    if (definition.required && !populated.contains(definition.id)) {
      missing.push_back(definition.key);
    }
  }
  return missing;
}

void EntityStore::SetEmbedding(uint64_t entity_id, const std::string& embedding) {
  auto tx = util::BeginOrThrow(*repository_);
  RequireEntity(*repository_, *tx, entity_id);

  db::model::EmbeddingRecord record;
  record.entity_id = entity_id;
  record.embedding = embedding;
  util::ThrowIfDbError(repository_->UpsertEmbedding(*tx, record), "set embedding");

  util::CommitOrThrow(*tx);
}

std::optional<std::string> EntityStore::GetEmbedding(uint64_t entity_id) {
  auto tx = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  RequireEntity(*repository_, *tx, entity_id);

  auto record = repository_->GetEmbedding(*tx, entity_id);
  if (!record) return std::nullopt;
  return std::move(record->embedding);
}

void EntityStore::DeleteEntity(uint64_t entity_id) {
  auto tx     = util::BeginOrThrow(*repository_);
  auto result = repository_->DeleteEntity(*tx, entity_id);
  if (result.code == db::ErrorCode::NotFound) {
    throw util::EntityNotFound("entity " + std::to_string(entity_id) + " not found");
  }
  util::ThrowIfDbError(result, "delete entity " + std::to_string(entity_id));

  util::CommitOrThrow(*tx);

  GRAPHDOC_LOG_DEBUG("entity deleted", {observability::UintField("entity_id", entity_id)});
}

} // namespace graphdoc::entity
