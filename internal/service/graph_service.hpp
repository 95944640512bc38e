#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/model_type_record.hpp"
#include "internal/db/model/relation_record.hpp"
#include "internal/db/model/relationship_type_record.hpp"
#include "internal/model/attribute_value.hpp"
#include "internal/model/type_kind.hpp"
#include "internal/model/value_type.hpp"
#include "internal/standardize/response_standardizer.hpp"
#include "service_context.hpp"

namespace graphdoc::service {

/*
  GraphService

  Entry point for collaborators. Each call is traced, counted and timed;
  failures are logged and rethrown unchanged (see util/errors.hpp for the
  exception types).
*/
class GraphService {
 public:
  explicit GraphService(ServiceContext ctx);

  // -------------------------------------------------------------------
  // Type registry
  // -------------------------------------------------------------------

  uint64_t DefineType(const std::string& name, model::TypeKind kind, std::optional<uint64_t> parent_id = std::nullopt,
                      std::optional<std::string> description = std::nullopt, bool is_action = false);

  uint64_t DefineAttribute(uint64_t model_type_id, const std::string& key, model::ValueType value_type, bool required = false,
                           const std::string& constraints = "");

  uint64_t DefineRelationshipType(uint64_t from_model_type_id, uint64_t to_model_type_id, const std::string& relation_name,
                                  const std::string&         multiplicity = db::model::kMultiplicityMany,
                                  std::optional<std::string> description  = std::nullopt);

  uint64_t DefineRelationAttribute(uint64_t relationship_type_id, const std::string& key, model::ValueType value_type,
                                   bool required = false);

  db::model::ModelTypeRecord GetTypeByName(const std::string& name);

  // -------------------------------------------------------------------
  // Entities and relations
  // -------------------------------------------------------------------

  uint64_t CreateEntity(uint64_t base_type_id, const std::string& title, std::optional<std::string> body = std::nullopt);
  void     UpdateEntity(uint64_t entity_id, std::optional<std::string> title, std::optional<std::string> body);
  void     AssignTrait(uint64_t entity_id, uint64_t trait_type_id);
  uint64_t SetAttribute(uint64_t entity_id, const std::string& key, const model::AttributeValue& value);
  void     SetEmbedding(uint64_t entity_id, const std::string& embedding);
  void     DeleteEntity(uint64_t entity_id);

  std::vector<db::model::EntityRecord> ListEntities(const db::model::EntityFilter& filter = {});

  uint64_t CreateRelation(uint64_t from_id, uint64_t to_id, uint64_t relationship_type_id);
  uint64_t SetRelationAttribute(uint64_t relation_id, const std::string& key, const model::AttributeValue& value);
  void     DeleteRelation(uint64_t relation_id);

  // -------------------------------------------------------------------
  // Read side
  // -------------------------------------------------------------------

  // nullopt when the entity does not exist
  std::optional<google::protobuf::Value> Materialize(uint64_t entity_id);

  google::protobuf::Value Standardize(standardize::ShapeTag tag, const google::protobuf::Value& raw);
  bool                    Validate(standardize::ShapeTag tag, const google::protobuf::Value& value);

 private:
  ServiceContext ctx_;
};

} // namespace graphdoc::service
