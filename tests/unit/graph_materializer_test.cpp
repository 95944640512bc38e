#include "internal/materialize/graph_materializer.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/registry/type_registry.hpp"
#include "internal/relation/relationship_store.hpp"
#include "internal/standardize/response_standardizer.hpp"
#include "internal/util/time.hpp"

namespace {

using google::protobuf::Value;
using graphdoc::entity::EntityStore;
using graphdoc::materialize::GraphMaterializer;
using graphdoc::model::AttributeValue;
using graphdoc::model::TypeKind;
using graphdoc::model::ValueType;
using graphdoc::registry::TypeRegistry;
using graphdoc::relation::RelationshipStore;
using graphdoc::standardize::ShapeTag;

const Value& Field(const Value& object, const std::string& key) {
  assert(object.kind_case() == Value::kStructValue);
  const auto& fields = object.struct_value().fields();
  auto        it     = fields.find(key);
  assert(it != fields.end());
  return it->second;
}

bool HasField(const Value& object, const std::string& key) {
  return object.struct_value().fields().count(key) == 1;
}

struct Fixture {
  std::shared_ptr<graphdoc::db::memory::MemoryRepository> repository = std::make_shared<graphdoc::db::memory::MemoryRepository>();
  TypeRegistry                                            registry{repository};
  EntityStore                                             entities{repository};
  RelationshipStore                                       relations{repository};
  GraphMaterializer                                       materializer{repository};

  uint64_t person   = registry.DefineType("Person", TypeKind::kBase, std::nullopt, std::string("A human"));
  uint64_t company  = registry.DefineType("Company", TypeKind::kBase);
  uint64_t employee = registry.DefineType("Employee", TypeKind::kTrait);
  uint64_t works_at = registry.DefineRelationshipType(person, company, "works_at");

  Fixture() {
    registry.DefineAttribute(person, "age", ValueType::kNumber);
    registry.DefineAttribute(person, "nickname", ValueType::kString);
    registry.DefineAttribute(person, "active", ValueType::kBoolean);
    registry.DefineAttribute(person, "born", ValueType::kDatetime);
    registry.DefineAttribute(employee, "salary", ValueType::kNumber);
    registry.DefineRelationAttribute(works_at, "role", ValueType::kString);
  }
};

void TestMaterializeAlice() {
  Fixture f;

  const auto alice = f.entities.CreateEntity(f.person, "Alice");
  f.entities.AssignTrait(alice, f.employee);
  f.entities.SetAttribute(alice, "age", AttributeValue{28.0});
  f.entities.SetAttribute(alice, "active", AttributeValue{true});
  f.entities.SetAttribute(alice, "born", AttributeValue{graphdoc::util::FromUnixMillis(0)});
  f.entities.SetAttribute(alice, "salary", AttributeValue{5000.0});

  const auto acme     = f.entities.CreateEntity(f.company, "Acme", std::string("Widgets"));
  const auto relation = f.relations.CreateRelation(alice, acme, f.works_at);
  f.relations.SetRelationAttribute(relation, "role", AttributeValue{std::string("engineer")});

  auto full = f.materializer.Materialize(alice);
  assert(full);

  const auto& model = Field(*full, "model");
  assert(Field(model, "id").number_value() == static_cast<double>(alice));
  assert(Field(model, "title").string_value() == "Alice");
  assert(Field(model, "body").kind_case() == Value::kNullValue);
  assert(graphdoc::util::ParseRfc3339(Field(model, "created_at").string_value()));
  assert(graphdoc::util::ParseRfc3339(Field(model, "updated_at").string_value()));

  const auto& model_type = Field(model, "model_type");
  const auto& base       = Field(model_type, "base_model");
  assert(Field(base, "name").string_value() == "Person");
  assert(Field(base, "description").string_value() == "A human");
  const auto& traits = Field(model_type, "traits").list_value();
  assert(traits.values_size() == 1);
  assert(Field(traits.values(0), "name").string_value() == "Employee");
  assert(Field(traits.values(0), "description").kind_case() == Value::kNullValue);

  const auto& attributes = Field(*full, "attributes");
  assert(Field(attributes, "age").number_value() == 28.0);
  assert(Field(attributes, "active").bool_value());
  assert(Field(attributes, "born").string_value() == "1970-01-01T00:00:00.000Z");
  assert(Field(attributes, "salary").number_value() == 5000.0);
  assert(!HasField(attributes, "nickname"));

  const auto& relations = Field(*full, "relations").list_value();
  assert(relations.values_size() == 1);
  const auto& edge = relations.values(0);
  assert(Field(edge, "relation_id").number_value() == static_cast<double>(relation));
  assert(Field(edge, "relation_name").string_value() == "works_at");
  assert(Field(edge, "direction").string_value() == "outgoing");
  const auto& other = Field(edge, "other_model");
  assert(Field(other, "title").string_value() == "Acme");
  assert(Field(other, "body").string_value() == "Widgets");
  assert(Field(Field(Field(other, "model_type"), "base_model"), "name").string_value() == "Company");
  assert(Field(Field(edge, "relation_attributes"), "role").string_value() == "engineer");

  assert(graphdoc::standardize::Validate(ShapeTag::kModelFull, *full));
}

void TestDirectionIsSymmetric() {
  Fixture f;
  const auto alice    = f.entities.CreateEntity(f.person, "Alice");
  const auto acme     = f.entities.CreateEntity(f.company, "Acme");
  const auto relation = f.relations.CreateRelation(alice, acme, f.works_at);

  auto from_acme = f.materializer.Materialize(acme);
  assert(from_acme);
  const auto& relations = Field(*from_acme, "relations").list_value();
  assert(relations.values_size() == 1);
  assert(Field(relations.values(0), "relation_id").number_value() == static_cast<double>(relation));
  assert(Field(relations.values(0), "direction").string_value() == "incoming");
  assert(Field(Field(relations.values(0), "other_model"), "title").string_value() == "Alice");
  assert(Field(relations.values(0), "relation_attributes").struct_value().fields().empty());
}

void TestLatestValueWins() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");
  f.entities.SetAttribute(alice, "nickname", AttributeValue{std::string("Al")});
  f.entities.SetAttribute(alice, "nickname", AttributeValue{std::string("Ally")});

  auto built = f.materializer.Build(alice);
  assert(built);
  assert(std::get<std::string>(built->attributes.at("nickname")) == "Ally");
  assert(f.entities.GetAttributeValues(alice, "nickname").size() == 2);
}

void TestEmptyEntityHasEmptyCollections() {
  Fixture f;
  const auto bare = f.entities.CreateEntity(f.company, "Bare");

  auto full = f.materializer.Materialize(bare);
  assert(full);
  assert(Field(*full, "attributes").struct_value().fields().empty());
  assert(Field(*full, "relations").list_value().values_size() == 0);
  assert(Field(Field(Field(*full, "model"), "model_type"), "traits").list_value().values_size() == 0);
}

void TestMissingEntity() {
  Fixture f;
  assert(!f.materializer.Materialize(123456));
  assert(!f.materializer.Build(123456));
}

void TestCorruptRowsAreSkipped() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");
  f.entities.SetAttribute(alice, "age", AttributeValue{28.0});

  {
    auto tx         = f.repository->Begin();
    auto definition = f.repository->GetAttributeDefinition(*tx, f.person, "nickname");
    assert(definition);

    graphdoc::db::model::AttributeRecord corrupt;
    corrupt.entity_id               = alice;
    corrupt.attribute_definition_id = definition->id;
    corrupt.columns.text            = "two";
    corrupt.columns.number          = 2.0;
    const auto inserted = f.repository->InsertAttribute(*tx, corrupt);
    assert(inserted);
    tx->Commit();
  }

  auto full = f.materializer.Materialize(alice);
  assert(full);
  const auto& attributes = Field(*full, "attributes");
  assert(Field(attributes, "age").number_value() == 28.0);
  assert(!HasField(attributes, "nickname"));
}

void TestDeleteRemovesRelationsFromOtherSide() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");
  const auto acme  = f.entities.CreateEntity(f.company, "Acme");
  f.relations.CreateRelation(alice, acme, f.works_at);

  f.entities.DeleteEntity(acme);

  assert(!f.materializer.Materialize(acme));
  auto full = f.materializer.Materialize(alice);
  assert(full);
  assert(Field(*full, "relations").list_value().values_size() == 0);
}

void TestStoredFunctionFallsBackWithoutBackendSupport() {
  Fixture           f;
  GraphMaterializer stored(f.repository, GraphMaterializer::Options{.use_stored_function = true, .validate_output = true});

  const auto alice = f.entities.CreateEntity(f.person, "Alice");
  auto       full  = stored.Materialize(alice);
  assert(full);
  assert(Field(Field(*full, "model"), "title").string_value() == "Alice");
}

} // namespace

int main() {
  TestMaterializeAlice();
  TestDirectionIsSymmetric();
  TestLatestValueWins();
  TestEmptyEntityHasEmptyCollections();
  TestMissingEntity();
  TestCorruptRowsAreSkipped();
  TestDeleteRemovesRelationsFromOtherSide();
  TestStoredFunctionFallsBackWithoutBackendSupport();

  std::cout << "graphdoc_unit_graph_materializer: pass\n";
  return 0;
}
