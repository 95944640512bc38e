#include "internal/relation/relationship_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/registry/type_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using graphdoc::entity::EntityStore;
using graphdoc::model::AttributeValue;
using graphdoc::model::TypeKind;
using graphdoc::model::ValueType;
using graphdoc::registry::TypeRegistry;
using graphdoc::relation::RelationshipStore;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

struct Fixture {
  std::shared_ptr<graphdoc::db::memory::MemoryRepository> repository = std::make_shared<graphdoc::db::memory::MemoryRepository>();
  TypeRegistry                                            registry{repository};
  EntityStore                                             entities{repository};
  RelationshipStore                                       relations{repository};

  uint64_t person  = registry.DefineType("Person", TypeKind::kBase);
  uint64_t company = registry.DefineType("Company", TypeKind::kBase);
  uint64_t manager = registry.DefineType("Manager", TypeKind::kTrait);

  uint64_t works_at = registry.DefineRelationshipType(person, company, "works_at", "one");
  uint64_t knows    = registry.DefineRelationshipType(person, person, "knows");

  uint64_t alice = entities.CreateEntity(person, "Alice");
  uint64_t bob   = entities.CreateEntity(person, "Bob");
  uint64_t acme  = entities.CreateEntity(company, "Acme");
  uint64_t initech = entities.CreateEntity(company, "Initech");

  Fixture() {
    registry.DefineRelationAttribute(works_at, "role", ValueType::kString);
  }
};

void TestCreateAndListRelations() {
  Fixture f;

  const auto employment = f.relations.CreateRelation(f.alice, f.acme, f.works_at);
  const auto friendship = f.relations.CreateRelation(f.bob, f.alice, f.knows);

  auto record = f.relations.GetRelation(employment);
  assert(record);
  assert(record->from_id == f.alice && record->to_id == f.acme);
  assert(record->relationship_type_id == f.works_at);

  // both directions, ordered by id
  auto incident = f.relations.ListRelations(f.alice);
  assert(incident.size() == 2);
  assert(incident[0].id == employment && incident[1].id == friendship);

  assert(f.relations.ListRelations(f.acme).size() == 1);
  assert(f.relations.ListRelations(f.initech).empty());
  assert(Throws<graphdoc::util::EntityNotFound>([&] { f.relations.ListRelations(31337); }));
}

void TestEndpointTypesMustMatchExactly() {
  Fixture f;

  assert(Throws<graphdoc::util::EndpointTypeMismatch>([&] { f.relations.CreateRelation(f.acme, f.alice, f.works_at); }));
  assert(Throws<graphdoc::util::EndpointTypeMismatch>([&] { f.relations.CreateRelation(f.alice, f.bob, f.works_at); }));

  // a trait does not widen the endpoint type
  f.entities.AssignTrait(f.alice, f.manager);
  assert(Throws<graphdoc::util::EndpointTypeMismatch>([&] { f.relations.CreateRelation(f.acme, f.alice, f.works_at); }));

  assert(Throws<graphdoc::util::EntityNotFound>([&] { f.relations.CreateRelation(f.alice, 8888, f.works_at); }));
  assert(Throws<graphdoc::util::EntityNotFound>([&] { f.relations.CreateRelation(8888, f.acme, f.works_at); }));
  assert(Throws<graphdoc::util::NotFound>([&] { f.relations.CreateRelation(f.alice, f.acme, 8888); }));
  assert(f.relations.ListRelations(f.alice).empty());
}

void TestMultiplicityOne() {
  Fixture f;

  f.relations.CreateRelation(f.alice, f.acme, f.works_at);
  assert(Throws<graphdoc::util::MultiplicityExceeded>([&] { f.relations.CreateRelation(f.alice, f.initech, f.works_at); }));

  // the limit is per source entity
  f.relations.CreateRelation(f.bob, f.acme, f.works_at);

  // "many" relations repeat freely, even between the same pair
  f.relations.CreateRelation(f.alice, f.bob, f.knows);
  f.relations.CreateRelation(f.alice, f.bob, f.knows);
  f.relations.CreateRelation(f.alice, f.alice, f.knows);
}

void TestRelationAttributes() {
  Fixture f;
  const auto employment = f.relations.CreateRelation(f.alice, f.acme, f.works_at);
  const auto friendship = f.relations.CreateRelation(f.alice, f.bob, f.knows);

  f.relations.SetRelationAttribute(employment, "role", AttributeValue{std::string("engineer")});
  f.relations.SetRelationAttribute(employment, "role", AttributeValue{std::string("lead")});

  assert(Throws<graphdoc::util::DuplicateValue>(
      [&] { f.relations.SetRelationAttribute(employment, "role", AttributeValue{std::string("lead")}); }));
  assert(Throws<graphdoc::util::TypeMismatch>([&] { f.relations.SetRelationAttribute(employment, "role", AttributeValue{1.0}); }));
  assert(Throws<graphdoc::util::UnknownAttributeKey>(
      [&] { f.relations.SetRelationAttribute(friendship, "role", AttributeValue{std::string("x")}); }));
  assert(Throws<graphdoc::util::NotFound>([&] { f.relations.SetRelationAttribute(424242, "role", AttributeValue{std::string("x")}); }));
}

void TestDeleteRelation() {
  Fixture f;
  const auto employment = f.relations.CreateRelation(f.alice, f.acme, f.works_at);
  f.relations.SetRelationAttribute(employment, "role", AttributeValue{std::string("engineer")});

  f.relations.DeleteRelation(employment);
  assert(!f.relations.GetRelation(employment));
  assert(Throws<graphdoc::util::NotFound>([&] { f.relations.DeleteRelation(employment); }));

  // the multiplicity slot is free again
  f.relations.CreateRelation(f.alice, f.initech, f.works_at);
}

void TestDeletingEntityRemovesIncidentRelations() {
  Fixture f;
  const auto employment = f.relations.CreateRelation(f.alice, f.acme, f.works_at);
  const auto friendship = f.relations.CreateRelation(f.bob, f.alice, f.knows);

  f.entities.DeleteEntity(f.alice);

  assert(!f.relations.GetRelation(employment));
  assert(!f.relations.GetRelation(friendship));
  assert(f.relations.ListRelations(f.bob).empty());
  assert(f.relations.ListRelations(f.acme).empty());
}

} // namespace

int main() {
  TestCreateAndListRelations();
  TestEndpointTypesMustMatchExactly();
  TestMultiplicityOne();
  TestRelationAttributes();
  TestDeleteRelation();
  TestDeletingEntityRemovesIncidentRelations();

  std::cout << "graphdoc_unit_relationship_store: pass\n";
  return 0;
}
