#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/type_kind.hpp"
#include "internal/model/value_type.hpp"

namespace graphdoc::registry {

/*
  TypeRegistry

  Owns the schema side of the store: base and trait types, their
  attribute definitions, relationship types and relation attribute
  definitions. Every Define* runs in its own write transaction and
  either commits fully or throws (see util/errors.hpp).

  Lookups throw util::NotFound when the row is absent.
*/
class TypeRegistry {
 public:
  explicit TypeRegistry(std::shared_ptr<db::Repository> repository);

  // DuplicateName, UnknownType (parent), InvalidArgument (empty name)
  uint64_t DefineType(const std::string& name, model::TypeKind kind, std::optional<uint64_t> parent_id = std::nullopt,
                      std::optional<std::string> description = std::nullopt, bool is_action = false);

  // DuplicateKey, UnknownType, InvalidArgument (empty key, bad constraints)
  uint64_t DefineAttribute(uint64_t model_type_id, const std::string& key, model::ValueType value_type, bool required = false,
                           const std::string& constraints = "");

  // DuplicateName, UnknownType, InvalidBaseType, InvalidArgument (multiplicity)
  uint64_t DefineRelationshipType(uint64_t from_model_type_id, uint64_t to_model_type_id, const std::string& relation_name,
                                  const std::string& multiplicity = db::model::kMultiplicityMany,
                                  std::optional<std::string> description = std::nullopt);

  // DuplicateKey, UnknownType (relationship type absent)
  uint64_t DefineRelationAttribute(uint64_t relationship_type_id, const std::string& key, model::ValueType value_type,
                                   bool required = false);

  db::model::ModelTypeRecord              GetType(uint64_t id);
  db::model::ModelTypeRecord              GetTypeByName(const std::string& name);
  std::vector<db::model::ModelTypeRecord> ListTypes();

  db::model::AttributeDefinitionRecord              GetAttributeDefinition(uint64_t model_type_id, const std::string& key);
  std::vector<db::model::AttributeDefinitionRecord> ListAttributeDefinitions(uint64_t model_type_id);

  db::model::RelationshipTypeRecord GetRelationshipType(uint64_t id);
  db::model::RelationshipTypeRecord GetRelationshipType(uint64_t from_model_type_id, uint64_t to_model_type_id,
                                                        const std::string& relation_name);
  std::vector<db::model::RelationshipTypeRecord> ListRelationshipTypesByName(const std::string& relation_name);

  db::model::RelationAttributeDefinitionRecord GetRelationAttributeDefinition(uint64_t relationship_type_id, const std::string& key);
  std::vector<db::model::RelationAttributeDefinitionRecord> ListRelationAttributeDefinitions(uint64_t relationship_type_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace graphdoc::registry
