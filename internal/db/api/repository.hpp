#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/attribute_definition_record.hpp"
#include "internal/db/model/attribute_record.hpp"
#include "internal/db/model/embedding_record.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/model_type_record.hpp"
#include "internal/db/model/relation_record.hpp"
#include "internal/db/model/relationship_type_record.hpp"
#include "internal/db/model/trait_assignment_record.hpp"

namespace graphdoc::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Insert* assigns the row id (and creation timestamps left at 0)
    back into the record
  - Uniqueness is enforced here: a colliding insert returns
    AlreadyExists, even when two transactions race
  - DeleteEntity cascades traits, attributes, embedding and every
    relation touching the entity; DeleteRelation cascades its attributes

  List* results are ordered by id ascending.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kReadWrite) = 0;

  // ---------------------------------------------------------------------
  // Type registry
  // ---------------------------------------------------------------------

  virtual Result InsertModelType(Transaction&, model::ModelTypeRecord&) = 0;

  virtual std::optional<model::ModelTypeRecord> GetModelType(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::ModelTypeRecord> GetModelTypeByName(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::ModelTypeRecord> ListModelTypes(Transaction&) = 0;

  virtual Result InsertAttributeDefinition(Transaction&, model::AttributeDefinitionRecord&) = 0;

  virtual std::optional<model::AttributeDefinitionRecord> GetAttributeDefinition(Transaction&, uint64_t model_type_id, const std::string& key) = 0;

  virtual std::vector<model::AttributeDefinitionRecord> ListAttributeDefinitions(Transaction&, uint64_t model_type_id) = 0;

  virtual Result InsertRelationshipType(Transaction&, model::RelationshipTypeRecord&) = 0;

  virtual std::optional<model::RelationshipTypeRecord> GetRelationshipType(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::RelationshipTypeRecord> FindRelationshipType(Transaction&, uint64_t from_model_type_id, uint64_t to_model_type_id,
                                                                            const std::string& relation_name) = 0;

  virtual std::vector<model::RelationshipTypeRecord> ListRelationshipTypesByName(Transaction&, const std::string& relation_name) = 0;

  virtual Result InsertRelationAttributeDefinition(Transaction&, model::RelationAttributeDefinitionRecord&) = 0;

  virtual std::optional<model::RelationAttributeDefinitionRecord> GetRelationAttributeDefinition(Transaction&, uint64_t relationship_type_id,
                                                                                                const std::string& key) = 0;

  virtual std::vector<model::RelationAttributeDefinitionRecord> ListRelationAttributeDefinitions(Transaction&, uint64_t relationship_type_id) = 0;

  // ---------------------------------------------------------------------
  // Entities
  // ---------------------------------------------------------------------

  virtual Result InsertEntity(Transaction&, model::EntityRecord&) = 0;

  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, uint64_t id) = 0;

  virtual std::vector<model::EntityRecord> ListEntities(Transaction&, const model::EntityFilter& filter) = 0;

  virtual Result UpdateEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual Result DeleteEntity(Transaction&, uint64_t id) = 0;

  // Row lock held until the transaction ends. Backends that already
  // serialize writers have nothing to do.
  virtual Result LockEntity(Transaction&, uint64_t) {
    return Result::Ok();
  }

  virtual Result InsertTraitAssignment(Transaction&, model::TraitAssignmentRecord&) = 0;

  virtual std::vector<model::TraitAssignmentRecord> ListTraitAssignments(Transaction&, uint64_t entity_id) = 0;

  virtual Result InsertAttribute(Transaction&, model::AttributeRecord&) = 0;

  virtual std::vector<model::AttributeRecord> ListAttributes(Transaction&, uint64_t entity_id) = 0;

  virtual Result UpsertEmbedding(Transaction&, const model::EmbeddingRecord&) = 0;

  virtual std::optional<model::EmbeddingRecord> GetEmbedding(Transaction&, uint64_t entity_id) = 0;

  // ---------------------------------------------------------------------
  // Relations
  // ---------------------------------------------------------------------

  virtual Result InsertRelation(Transaction&, model::RelationRecord&) = 0;

  virtual std::optional<model::RelationRecord> GetRelation(Transaction&, uint64_t id) = 0;

  // Relations where the entity is either endpoint.
  virtual std::vector<model::RelationRecord> ListRelations(Transaction&, uint64_t entity_id) = 0;

  virtual Result DeleteRelation(Transaction&, uint64_t id) = 0;

  virtual Result InsertRelationAttribute(Transaction&, model::RelationAttributeRecord&) = 0;

  virtual std::vector<model::RelationAttributeRecord> ListRelationAttributes(Transaction&, uint64_t relation_id) = 0;

  // ---------------------------------------------------------------------
  // Server-side materialization
  // ---------------------------------------------------------------------

  // True when LoadMaterializedJson is backed by a stored routine.
  virtual bool SupportsStoredMaterialization() const {
    return false;
  }

  // JSON document of the full entity view, nullopt when the entity is absent
  // or the backend has no stored routine.
  virtual std::optional<std::string> LoadMaterializedJson(Transaction&, uint64_t) {
    return std::nullopt;
  }
};

} // namespace graphdoc::db
