#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace graphdoc::db::memory {

namespace {

template <typename Record>
std::vector<Record> Values(const std::map<uint64_t, Record>& table) {
  std::vector<Record> out;
  out.reserve(table.size());
  for (const auto& [_, record] : table) {
    out.push_back(record);
  }
  return out;
}

template <typename Record, typename Pred>
std::vector<Record> Select(const std::map<uint64_t, Record>& table, Pred&& pred) {
  std::vector<Record> out;
  for (const auto& [_, record] : table) {
    if (pred(record)) out.push_back(record);
  }
  return out;
}

template <typename Record, typename Pred>
std::optional<Record> FindFirst(const std::map<uint64_t, Record>& table, Pred&& pred) {
  for (const auto& [_, record] : table) {
    if (pred(record)) return record;
  }
  return std::nullopt;
}

template <typename Record, typename Pred>
void EraseIf(std::map<uint64_t, Record>& table, Pred&& pred) {
  std::erase_if(table, [&](const auto& entry) { return pred(entry.second); });
}

template <typename Record>
std::optional<Record> Lookup(const std::map<uint64_t, Record>& table, uint64_t id) {
  auto it = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Type registry
// ------------------------------------------------------------------

Result MemoryRepository::InsertModelType(Transaction& t, model::ModelTypeRecord& r) {
  auto& s = TX(t).Mutable();
  if (FindFirst(s.model_types, [&](const auto& e) { return e.name == r.name; })) {
    return Result::Err(ErrorCode::AlreadyExists, "model type name '" + r.name + "' already exists");
  }
  if (r.parent_id && !s.model_types.contains(*r.parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "parent model type does not exist");
  }

  r.id                 = s.next_model_type_id++;
  s.model_types[r.id] = r;
  return Result::Ok();
}

std::optional<model::ModelTypeRecord> MemoryRepository::GetModelType(Transaction& t, uint64_t id) {
  return Lookup(TX(t).View().model_types, id);
}

std::optional<model::ModelTypeRecord> MemoryRepository::GetModelTypeByName(Transaction& t, const std::string& name) {
  return FindFirst(TX(t).View().model_types, [&](const auto& e) { return e.name == name; });
}

std::vector<model::ModelTypeRecord> MemoryRepository::ListModelTypes(Transaction& t) {
  return Values(TX(t).View().model_types);
}

Result MemoryRepository::InsertAttributeDefinition(Transaction& t, model::AttributeDefinitionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.model_types.contains(r.model_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "model type does not exist");
  }
  if (FindFirst(s.attribute_definitions, [&](const auto& e) { return e.model_type_id == r.model_type_id && e.key == r.key; })) {
    return Result::Err(ErrorCode::AlreadyExists, "attribute key '" + r.key + "' already defined");
  }

  r.id                           = s.next_attribute_definition_id++;
  s.attribute_definitions[r.id] = r;
  return Result::Ok();
}

std::optional<model::AttributeDefinitionRecord> MemoryRepository::GetAttributeDefinition(Transaction& t, uint64_t model_type_id,
                                                                                         const std::string& key) {
  return FindFirst(TX(t).View().attribute_definitions, [&](const auto& e) { return e.model_type_id == model_type_id && e.key == key; });
}

std::vector<model::AttributeDefinitionRecord> MemoryRepository::ListAttributeDefinitions(Transaction& t, uint64_t model_type_id) {
  return Select(TX(t).View().attribute_definitions, [&](const auto& e) { return e.model_type_id == model_type_id; });
}

Result MemoryRepository::InsertRelationshipType(Transaction& t, model::RelationshipTypeRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.model_types.contains(r.from_model_type_id) || !s.model_types.contains(r.to_model_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "relationship endpoint type does not exist");
  }
  if (FindRelationshipType(t, r.from_model_type_id, r.to_model_type_id, r.relation_name)) {
    return Result::Err(ErrorCode::AlreadyExists, "relationship type '" + r.relation_name + "' already exists");
  }

  r.id                        = s.next_relationship_type_id++;
  s.relationship_types[r.id] = r;
  return Result::Ok();
}

std::optional<model::RelationshipTypeRecord> MemoryRepository::GetRelationshipType(Transaction& t, uint64_t id) {
  return Lookup(TX(t).View().relationship_types, id);
}

std::optional<model::RelationshipTypeRecord> MemoryRepository::FindRelationshipType(Transaction& t, uint64_t from_model_type_id,
                                                                                    uint64_t to_model_type_id, const std::string& relation_name) {
  return FindFirst(TX(t).View().relationship_types, [&](const auto& e) {
    return e.from_model_type_id == from_model_type_id && e.to_model_type_id == to_model_type_id && e.relation_name == relation_name;
  });
}

std::vector<model::RelationshipTypeRecord> MemoryRepository::ListRelationshipTypesByName(Transaction& t, const std::string& relation_name) {
  return Select(TX(t).View().relationship_types, [&](const auto& e) { return e.relation_name == relation_name; });
}

Result MemoryRepository::InsertRelationAttributeDefinition(Transaction& t, model::RelationAttributeDefinitionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.relationship_types.contains(r.relationship_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "relationship type does not exist");
  }
  if (FindFirst(s.relation_attribute_definitions,
                [&](const auto& e) { return e.relationship_type_id == r.relationship_type_id && e.key == r.key; })) {
    return Result::Err(ErrorCode::AlreadyExists, "relation attribute key '" + r.key + "' already defined");
  }

  r.id                                    = s.next_relation_attribute_definition_id++;
  s.relation_attribute_definitions[r.id] = r;
  return Result::Ok();
}

std::optional<model::RelationAttributeDefinitionRecord> MemoryRepository::GetRelationAttributeDefinition(Transaction& t,
                                                                                                         uint64_t relationship_type_id,
                                                                                                         const std::string& key) {
  return FindFirst(TX(t).View().relation_attribute_definitions,
                   [&](const auto& e) { return e.relationship_type_id == relationship_type_id && e.key == key; });
}

std::vector<model::RelationAttributeDefinitionRecord> MemoryRepository::ListRelationAttributeDefinitions(Transaction& t,
                                                                                                         uint64_t relationship_type_id) {
  return Select(TX(t).View().relation_attribute_definitions, [&](const auto& e) { return e.relationship_type_id == relationship_type_id; });
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result MemoryRepository::InsertEntity(Transaction& t, model::EntityRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.model_types.contains(r.model_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "model type does not exist");
  }

  r.id = s.next_entity_id++;
  if (r.created_at_ms == 0) {
    r.created_at_ms = util::NowMillis();
  }
  if (r.updated_at_ms == 0) {
    r.updated_at_ms = r.created_at_ms;
  }
  s.entities[r.id] = r;
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, uint64_t id) {
  return Lookup(TX(t).View().entities, id);
}

std::vector<model::EntityRecord> MemoryRepository::ListEntities(Transaction& t, const model::EntityFilter& filter) {
  const auto& s = TX(t).View();
  return Select(s.entities, [&](const model::EntityRecord& e) {
    if (filter.base_type_id && e.model_type_id != *filter.base_type_id) return false;
    if (filter.title && e.title != *filter.title) return false;
    if (filter.trait_type_id) {
      auto assigned = FindFirst(s.trait_assignments, [&](const auto& a) { return a.entity_id == e.id && a.trait_type_id == *filter.trait_type_id; });
      if (!assigned) return false;
    }
    return true;
  });
}

Result MemoryRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entities.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.entities[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteEntity(Transaction& t, uint64_t id) {
  auto& s = TX(t).Mutable();
  if (s.entities.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  s.embeddings.erase(id);
  EraseIf(s.trait_assignments, [&](const auto& e) { return e.entity_id == id; });
  EraseIf(s.attributes, [&](const auto& e) { return e.entity_id == id; });

  std::vector<uint64_t> relation_ids;
  for (const auto& [relation_id, relation] : s.relations) {
    if (relation.from_id == id || relation.to_id == id) relation_ids.push_back(relation_id);
  }
  for (auto relation_id : relation_ids) {
    s.relations.erase(relation_id);
    EraseIf(s.relation_attributes, [&](const auto& e) { return e.relation_id == relation_id; });
  }
  return Result::Ok();
}

Result MemoryRepository::InsertTraitAssignment(Transaction& t, model::TraitAssignmentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entities.contains(r.entity_id) || !s.model_types.contains(r.trait_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "trait assignment references a missing row");
  }
  if (FindFirst(s.trait_assignments, [&](const auto& e) { return e.entity_id == r.entity_id && e.trait_type_id == r.trait_type_id; })) {
    return Result::Err(ErrorCode::AlreadyExists, "trait already assigned");
  }

  r.id = s.next_trait_assignment_id++;
  if (r.applied_at_ms == 0) {
    r.applied_at_ms = util::NowMillis();
  }
  s.trait_assignments[r.id] = r;
  return Result::Ok();
}

std::vector<model::TraitAssignmentRecord> MemoryRepository::ListTraitAssignments(Transaction& t, uint64_t entity_id) {
  return Select(TX(t).View().trait_assignments, [&](const auto& e) { return e.entity_id == entity_id; });
}

Result MemoryRepository::InsertAttribute(Transaction& t, model::AttributeRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entities.contains(r.entity_id) || !s.attribute_definitions.contains(r.attribute_definition_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "attribute references a missing row");
  }
  const auto key = graphdoc::model::ValueKey(r.columns);
  if (FindFirst(s.attributes, [&](const auto& e) {
        return e.entity_id == r.entity_id && e.attribute_definition_id == r.attribute_definition_id && graphdoc::model::ValueKey(e.columns) == key;
      })) {
    return Result::Err(ErrorCode::AlreadyExists, "attribute value already stored");
  }

  r.id                = s.next_attribute_id++;
  s.attributes[r.id] = r;
  return Result::Ok();
}

std::vector<model::AttributeRecord> MemoryRepository::ListAttributes(Transaction& t, uint64_t entity_id) {
  return Select(TX(t).View().attributes, [&](const auto& e) { return e.entity_id == entity_id; });
}

Result MemoryRepository::UpsertEmbedding(Transaction& t, const model::EmbeddingRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entities.contains(r.entity_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "embedding references a missing entity");
  }
  s.embeddings[r.entity_id] = r;
  return Result::Ok();
}

std::optional<model::EmbeddingRecord> MemoryRepository::GetEmbedding(Transaction& t, uint64_t entity_id) {
  return Lookup(TX(t).View().embeddings, entity_id);
}

// ------------------------------------------------------------------
// Relations
// ------------------------------------------------------------------

Result MemoryRepository::InsertRelation(Transaction& t, model::RelationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entities.contains(r.from_id) || !s.entities.contains(r.to_id) || !s.relationship_types.contains(r.relationship_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "relation references a missing row");
  }

  r.id = s.next_relation_id++;
  if (r.created_at_ms == 0) {
    r.created_at_ms = util::NowMillis();
  }
  s.relations[r.id] = r;
  return Result::Ok();
}

std::optional<model::RelationRecord> MemoryRepository::GetRelation(Transaction& t, uint64_t id) {
  return Lookup(TX(t).View().relations, id);
}

std::vector<model::RelationRecord> MemoryRepository::ListRelations(Transaction& t, uint64_t entity_id) {
  return Select(TX(t).View().relations, [&](const auto& e) { return e.from_id == entity_id || e.to_id == entity_id; });
}

Result MemoryRepository::DeleteRelation(Transaction& t, uint64_t id) {
  auto& s = TX(t).Mutable();
  if (s.relations.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  EraseIf(s.relation_attributes, [&](const auto& e) { return e.relation_id == id; });
  return Result::Ok();
}

Result MemoryRepository::InsertRelationAttribute(Transaction& t, model::RelationAttributeRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.relations.contains(r.relation_id) || !s.relation_attribute_definitions.contains(r.relation_attribute_definition_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "relation attribute references a missing row");
  }
  const auto key = graphdoc::model::ValueKey(r.columns);
  if (FindFirst(s.relation_attributes, [&](const auto& e) {
        return e.relation_id == r.relation_id && e.relation_attribute_definition_id == r.relation_attribute_definition_id &&
               graphdoc::model::ValueKey(e.columns) == key;
      })) {
    return Result::Err(ErrorCode::AlreadyExists, "relation attribute value already stored");
  }

  r.id                         = s.next_relation_attribute_id++;
  s.relation_attributes[r.id] = r;
  return Result::Ok();
}

std::vector<model::RelationAttributeRecord> MemoryRepository::ListRelationAttributes(Transaction& t, uint64_t relation_id) {
  return Select(TX(t).View().relation_attributes, [&](const auto& e) { return e.relation_id == relation_id; });
}

} // namespace graphdoc::db::memory
