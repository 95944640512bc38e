#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/attribute_value.hpp"

namespace graphdoc::relation {

/*
  RelationshipStore

  Typed directed edges between entities and their EAV attributes.
  Endpoint base types must equal the relationship type's declared
  from/to types exactly; trait composition does not widen them.
*/
class RelationshipStore {
 public:
  explicit RelationshipStore(std::shared_ptr<db::Repository> repository);

  // EntityNotFound, NotFound (relationship type), EndpointTypeMismatch, MultiplicityExceeded
  uint64_t CreateRelation(uint64_t from_id, uint64_t to_id, uint64_t relationship_type_id);

  // NotFound (relation), UnknownAttributeKey, TypeMismatch, DuplicateValue
  uint64_t SetRelationAttribute(uint64_t relation_id, const std::string& key, const model::AttributeValue& value);

  // Cascades the relation's attributes. NotFound.
  void DeleteRelation(uint64_t relation_id);

  std::optional<db::model::RelationRecord> GetRelation(uint64_t relation_id);

  // Both directions, ordered by id. EntityNotFound.
  std::vector<db::model::RelationRecord> ListRelations(uint64_t entity_id);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace graphdoc::relation
