#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/attribute_value.hpp"

namespace graphdoc::entity {

/*
  EntityStore

  Entities, their trait composition and their typed EAV values. Every
  write is validated against the type registry's definitions inside the
  same transaction that performs it, so a thrown error leaves nothing
  behind.

  Attribute keys resolve against the effective composition: the base
  type first, then assigned traits in ascending trait type id. The
  first definition declaring the key wins.
*/
class EntityStore {
 public:
  explicit EntityStore(std::shared_ptr<db::Repository> repository);

  // UnknownType, InvalidBaseType, InvalidArgument (empty title)
  uint64_t CreateEntity(uint64_t base_type_id, const std::string& title, std::optional<std::string> body = std::nullopt);

  std::optional<db::model::EntityRecord> GetEntity(uint64_t entity_id);

  // Unset fields are left alone. EntityNotFound.
  void UpdateEntity(uint64_t entity_id, std::optional<std::string> title, std::optional<std::string> body);

  std::vector<db::model::EntityRecord> ListEntities(const db::model::EntityFilter& filter = {});

  // EntityNotFound, UnknownType, InvalidTraitType, DuplicateTraitAssignment
  void AssignTrait(uint64_t entity_id, uint64_t trait_type_id);

  // Additive: never replaces an earlier value of the same key.
  // EntityNotFound, UnknownAttributeKey, TypeMismatch, ConstraintViolation, DuplicateValue
  uint64_t SetAttribute(uint64_t entity_id, const std::string& key, const model::AttributeValue& value);

  // All stored values of one key in insertion order.
  std::vector<model::AttributeValue> GetAttributeValues(uint64_t entity_id, const std::string& key);

  // Keys of required definitions in the effective composition with no stored value.
  std::vector<std::string> MissingRequiredAttributes(uint64_t entity_id);

  void                       SetEmbedding(uint64_t entity_id, const std::string& embedding);
  std::optional<std::string> GetEmbedding(uint64_t entity_id);

  // Cascades traits, attributes, embedding and every incident relation.
  void DeleteEntity(uint64_t entity_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

// Attribute definitions visible on an entity, in key resolution order.
std::vector<db::model::AttributeDefinitionRecord> EffectiveDefinitions(db::Repository& repository, db::Transaction& tx,
                                                                       const db::model::EntityRecord& entity);

// Throws util::InvalidArgument for values no backend can store: non-finite
// numbers and datetimes finer than a millisecond.
void ValidateStorable(const model::AttributeValue& value);

} // namespace graphdoc::entity
