#pragma once

#include <map>
#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace graphdoc::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kReadWrite) override;

  Result InsertModelType(Transaction&, model::ModelTypeRecord&) override;
  std::optional<model::ModelTypeRecord> GetModelType(Transaction&, uint64_t id) override;
  std::optional<model::ModelTypeRecord> GetModelTypeByName(Transaction&, const std::string& name) override;
  std::vector<model::ModelTypeRecord> ListModelTypes(Transaction&) override;

  Result InsertAttributeDefinition(Transaction&, model::AttributeDefinitionRecord&) override;
  std::optional<model::AttributeDefinitionRecord> GetAttributeDefinition(
      Transaction&, uint64_t model_type_id, const std::string& key) override;
  std::vector<model::AttributeDefinitionRecord> ListAttributeDefinitions(Transaction&, uint64_t model_type_id) override;

  Result InsertRelationshipType(Transaction&, model::RelationshipTypeRecord&) override;
  std::optional<model::RelationshipTypeRecord> GetRelationshipType(Transaction&, uint64_t id) override;
  std::optional<model::RelationshipTypeRecord> FindRelationshipType(
      Transaction&, uint64_t from_model_type_id, uint64_t to_model_type_id, const std::string& relation_name) override;
  std::vector<model::RelationshipTypeRecord> ListRelationshipTypesByName(Transaction&, const std::string& relation_name) override;

  Result InsertRelationAttributeDefinition(Transaction&, model::RelationAttributeDefinitionRecord&) override;
  std::optional<model::RelationAttributeDefinitionRecord> GetRelationAttributeDefinition(
      Transaction&, uint64_t relationship_type_id, const std::string& key) override;
  std::vector<model::RelationAttributeDefinitionRecord> ListRelationAttributeDefinitions(
      Transaction&, uint64_t relationship_type_id) override;

  Result InsertEntity(Transaction&, model::EntityRecord&) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, uint64_t id) override;
  std::vector<model::EntityRecord> ListEntities(Transaction&, const model::EntityFilter& filter) override;
  Result UpdateEntity(Transaction&, const model::EntityRecord&) override;
  Result DeleteEntity(Transaction&, uint64_t id) override;

  Result InsertTraitAssignment(Transaction&, model::TraitAssignmentRecord&) override;
  std::vector<model::TraitAssignmentRecord> ListTraitAssignments(Transaction&, uint64_t entity_id) override;

  Result InsertAttribute(Transaction&, model::AttributeRecord&) override;
  std::vector<model::AttributeRecord> ListAttributes(Transaction&, uint64_t entity_id) override;

  Result UpsertEmbedding(Transaction&, const model::EmbeddingRecord&) override;
  std::optional<model::EmbeddingRecord> GetEmbedding(Transaction&, uint64_t entity_id) override;

  Result InsertRelation(Transaction&, model::RelationRecord&) override;
  std::optional<model::RelationRecord> GetRelation(Transaction&, uint64_t id) override;
  std::vector<model::RelationRecord> ListRelations(Transaction&, uint64_t entity_id) override;
  Result DeleteRelation(Transaction&, uint64_t id) override;

  Result InsertRelationAttribute(Transaction&, model::RelationAttributeRecord&) override;
  std::vector<model::RelationAttributeRecord> ListRelationAttributes(Transaction&, uint64_t relation_id) override;

private:
  friend class MemoryTransaction;

  // ordered maps keep List* results in id order
  struct State {
    std::map<uint64_t, model::ModelTypeRecord>                   model_types;
    std::map<uint64_t, model::AttributeDefinitionRecord>         attribute_definitions;
    std::map<uint64_t, model::RelationshipTypeRecord>            relationship_types;
    std::map<uint64_t, model::RelationAttributeDefinitionRecord> relation_attribute_definitions;

    std::map<uint64_t, model::EntityRecord>            entities;
    std::map<uint64_t, model::TraitAssignmentRecord>   trait_assignments;
    std::map<uint64_t, model::AttributeRecord>         attributes;
    std::map<uint64_t, model::EmbeddingRecord>         embeddings;
    std::map<uint64_t, model::RelationRecord>          relations;
    std::map<uint64_t, model::RelationAttributeRecord> relation_attributes;

    // per-table sequences; never reused after delete
    uint64_t next_model_type_id                    = 1;
    uint64_t next_attribute_definition_id          = 1;
    uint64_t next_relationship_type_id             = 1;
    uint64_t next_relation_attribute_definition_id = 1;
    uint64_t next_entity_id                        = 1;
    uint64_t next_trait_assignment_id              = 1;
    uint64_t next_attribute_id                     = 1;
    uint64_t next_relation_id                      = 1;
    uint64_t next_relation_attribute_id            = 1;
  };

  // guards committed_
  std::mutex mutex_;
  // held by the single active write transaction
  std::mutex writer_mutex_;

  std::shared_ptr<const State> committed_;
};

}
