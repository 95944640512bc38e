#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace graphdoc::db::postgres {

/*
  libpqxx-backed repository.

  Statements are prepared per connection by PgPool. Writers run under
  READ COMMITTED; uniqueness races resolve through the table
  constraints, and relation multiplicity through LockEntity.
*/
class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kReadWrite) override;

  Result InsertModelType(Transaction&, model::ModelTypeRecord&) override;
  std::optional<model::ModelTypeRecord> GetModelType(Transaction&, uint64_t id) override;
  std::optional<model::ModelTypeRecord> GetModelTypeByName(Transaction&, const std::string& name) override;
  std::vector<model::ModelTypeRecord> ListModelTypes(Transaction&) override;

  Result InsertAttributeDefinition(Transaction&, model::AttributeDefinitionRecord&) override;
  std::optional<model::AttributeDefinitionRecord> GetAttributeDefinition(Transaction&, uint64_t model_type_id, const std::string& key) override;
  std::vector<model::AttributeDefinitionRecord> ListAttributeDefinitions(Transaction&, uint64_t model_type_id) override;

  Result InsertRelationshipType(Transaction&, model::RelationshipTypeRecord&) override;
  std::optional<model::RelationshipTypeRecord> GetRelationshipType(Transaction&, uint64_t id) override;
  std::optional<model::RelationshipTypeRecord> FindRelationshipType(Transaction&, uint64_t from_model_type_id, uint64_t to_model_type_id,
                                                                    const std::string& relation_name) override;
  std::vector<model::RelationshipTypeRecord> ListRelationshipTypesByName(Transaction&, const std::string& relation_name) override;

  Result InsertRelationAttributeDefinition(Transaction&, model::RelationAttributeDefinitionRecord&) override;
  std::optional<model::RelationAttributeDefinitionRecord> GetRelationAttributeDefinition(Transaction&, uint64_t relationship_type_id,
                                                                                        const std::string& key) override;
  std::vector<model::RelationAttributeDefinitionRecord> ListRelationAttributeDefinitions(Transaction&, uint64_t relationship_type_id) override;

  Result InsertEntity(Transaction&, model::EntityRecord&) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, uint64_t id) override;
  std::vector<model::EntityRecord> ListEntities(Transaction&, const model::EntityFilter& filter) override;
  Result UpdateEntity(Transaction&, const model::EntityRecord&) override;
  Result DeleteEntity(Transaction&, uint64_t id) override;
  Result LockEntity(Transaction&, uint64_t id) override;

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

  bool SupportsStoredMaterialization() const override {
    return true;
  }
  std::optional<std::string> LoadMaterializedJson(Transaction&, uint64_t entity_id) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
