#include "graph_materializer.hpp"

#include <algorithm>
#include <unordered_map>

#include "internal/entity/entity_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/standardize/response_standardizer.hpp"
#include "internal/util/db_errors.hpp"

namespace graphdoc::materialize {

using db::TxMode;
using db::model::EntityRecord;
using google::protobuf::Value;

namespace {

TypeRef MakeTypeRef(const db::model::ModelTypeRecord& type) {
  return TypeRef{type.id, type.name, type.description};
}

TypeComposition LoadComposition(db::Repository& repository, db::Transaction& tx, const EntityRecord& entity) {
  TypeComposition composition;

  if (auto base = repository.GetModelType(tx, entity.model_type_id)) {
    composition.base_model = MakeTypeRef(*base);
  } else {
    GRAPHDOC_LOG_WARN("entity references a missing base type",
                      {observability::UintField("entity_id", entity.id), observability::UintField("type_id", entity.model_type_id)});
    composition.base_model.id = entity.model_type_id;
  }

  auto assignments = repository.ListTraitAssignments(tx, entity.id);
  std::sort(assignments.begin(), assignments.end(), [](const auto& a, const auto& b) { return a.trait_type_id < b.trait_type_id; });

  for (const auto& assignment : assignments) {
    auto trait = repository.GetModelType(tx, assignment.trait_type_id);
    if (!trait) {
      GRAPHDOC_LOG_WARN("skipping missing trait type", {observability::UintField("entity_id", entity.id),
                                                        observability::UintField("type_id", assignment.trait_type_id)});
      continue;
    }
    composition.traits.push_back(MakeTypeRef(*trait));
  }
  return composition;
}

ModelView LoadModelView(db::Repository& repository, db::Transaction& tx, const EntityRecord& entity) {
  ModelView view;
  view.id            = entity.id;
  view.title         = entity.title;
  view.body          = entity.body;
  view.created_at_ms = entity.created_at_ms;
  view.updated_at_ms = entity.updated_at_ms;
  view.model_type    = LoadComposition(repository, tx, entity);
  return view;
}

// Rows arrive in id order, so a later row of the same key replaces an earlier one.
template <typename Row, typename DefinitionIdOf>
AttributeMap Collapse(const std::vector<Row>& rows, const std::unordered_map<uint64_t, std::string>& keys, DefinitionIdOf definition_id_of,
                      std::string_view owner, uint64_t owner_id) {
  AttributeMap out;
  for (const auto& row : rows) {
    const auto key = keys.find(definition_id_of(row));
    if (key == keys.end()) {
      GRAPHDOC_LOG_WARN("skipping value of an unknown definition",
                        {observability::StringField("owner", owner), observability::UintField("owner_id", owner_id),
                         observability::UintField("definition_id", definition_id_of(row))});
      continue;
    }
    auto value = model::FromColumns(row.columns);
    if (!value) {
      GRAPHDOC_LOG_WARN("skipping malformed stored value",
                        {observability::StringField("owner", owner), observability::UintField("owner_id", owner_id),
                         observability::StringField("key", key->second), observability::UintField("row_id", row.id)});
      continue;
    }
    out.insert_or_assign(key->second, std::move(*value));
  }
  return out;
}

} // namespace

GraphMaterializer::GraphMaterializer(std::shared_ptr<db::Repository> repository) : GraphMaterializer(std::move(repository), Options{}) {
}

GraphMaterializer::GraphMaterializer(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
}

std::optional<MaterializedModel> GraphMaterializer::Build(uint64_t entity_id) {
  auto  tx   = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  auto& repo = *repository_;

  auto entity = repo.GetEntity(*tx, entity_id);
  if (!entity) {
    return std::nullopt;
  }

  MaterializedModel out;
  out.model = LoadModelView(repo, *tx, *entity);

  std::unordered_map<uint64_t, std::string> attribute_keys;
  for (const auto& definition : entity::EffectiveDefinitions(repo, *tx, *entity)) {
    attribute_keys.emplace(definition.id, definition.key);
  }
  out.attributes = Collapse(
      repo.ListAttributes(*tx, entity_id), attribute_keys, [](const auto& row) { return row.attribute_definition_id; }, "entity", entity_id);

  for (const auto& relation : repo.ListRelations(*tx, entity_id)) {
    auto type = repo.GetRelationshipType(*tx, relation.relationship_type_id);
    if (!type) {
      GRAPHDOC_LOG_WARN("skipping relation of a missing relationship type", {observability::UintField("relation_id", relation.id)});
      continue;
    }

    const bool     outgoing = relation.from_id == entity_id;
    const uint64_t other_id = outgoing ? relation.to_id : relation.from_id;
    auto           other    = repo.GetEntity(*tx, other_id);
    if (!other) {
      GRAPHDOC_LOG_WARN("skipping relation to a missing entity",
                        {observability::UintField("relation_id", relation.id), observability::UintField("entity_id", other_id)});
      continue;
    }

    RelationView view;
    view.relation_id   = relation.id;
    view.relation_name = type->relation_name;
    view.outgoing      = outgoing;
    view.other_model   = LoadModelView(repo, *tx, *other);

    std::unordered_map<uint64_t, std::string> relation_keys;
    for (const auto& definition : repo.ListRelationAttributeDefinitions(*tx, type->id)) {
      relation_keys.emplace(definition.id, definition.key);
    }
    view.relation_attributes = Collapse(
        repo.ListRelationAttributes(*tx, relation.id), relation_keys,
        [](const auto& row) { return row.relation_attribute_definition_id; }, "relation", relation.id);

    out.relations.push_back(std::move(view));
  }

  return out;
}

std::optional<Value> GraphMaterializer::Materialize(uint64_t entity_id) {
  observability::SpanScope span("graphdoc.materialize");
  span.SetAttribute("entity_id", static_cast<std::int64_t>(entity_id));

  if (options_.use_stored_function && repository_->SupportsStoredMaterialization()) {
    return MaterializeStored(entity_id);
  }

  auto built = Build(entity_id);
  if (!built) {
    return std::nullopt;
  }

  auto raw = ToValue(*built);
  if (options_.validate_output && !standardize::Validate(standardize::ShapeTag::kModelFull, raw)) {
    GRAPHDOC_LOG_WARN("materialized view needed repair", {observability::UintField("entity_id", entity_id)});
  }
  return standardize::Standardize(standardize::ShapeTag::kModelFull, raw);
}

std::optional<Value> GraphMaterializer::MaterializeStored(uint64_t entity_id) {
  auto tx   = util::BeginOrThrow(*repository_, TxMode::kReadOnly);
  auto json = repository_->LoadMaterializedJson(*tx, entity_id);
  if (!json) {
    return std::nullopt;
  }
  return standardize::StandardizeJson(standardize::ShapeTag::kModelFull, *json);
}

} // namespace graphdoc::materialize
