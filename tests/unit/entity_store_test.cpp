#include "internal/entity/entity_store.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/registry/type_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using graphdoc::entity::EntityStore;
using graphdoc::model::AttributeValue;
using graphdoc::model::TypeKind;
using graphdoc::model::ValueType;
using graphdoc::registry::TypeRegistry;

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

  uint64_t person   = registry.DefineType("Person", TypeKind::kBase);
  uint64_t company  = registry.DefineType("Company", TypeKind::kBase);
  uint64_t employee = registry.DefineType("Employee", TypeKind::kTrait);

  Fixture() {
    registry.DefineAttribute(person, "name", ValueType::kString, /*required=*/true);
    registry.DefineAttribute(person, "age", ValueType::kNumber, false, R"({"min": 0, "max": 150})");
    registry.DefineAttribute(person, "tag", ValueType::kString);
    registry.DefineAttribute(person, "seen", ValueType::kDatetime);
    registry.DefineAttribute(person, "score", ValueType::kNumber);
    registry.DefineAttribute(employee, "salary", ValueType::kNumber, /*required=*/true);
    // shadowed by Person.age once the trait is assigned
    registry.DefineAttribute(employee, "age", ValueType::kString);
  }
};

void TestCreateAndUpdateEntity() {
  Fixture f;

  const auto alice = f.entities.CreateEntity(f.person, "Alice", std::string("Engineer"));
  auto       record = f.entities.GetEntity(alice);
  assert(record);
  assert(record->title == "Alice");
  assert(record->body && *record->body == "Engineer");
  assert(record->model_type_id == f.person);
  assert(record->created_at_ms > 0);
  assert(record->updated_at_ms >= record->created_at_ms);

  const auto before = record->updated_at_ms;
  f.entities.UpdateEntity(alice, std::string("Alice B."), std::nullopt);
  record = f.entities.GetEntity(alice);
  assert(record->title == "Alice B.");
  assert(record->body && *record->body == "Engineer");
  assert(record->updated_at_ms >= before);

  assert(!f.entities.GetEntity(987654));
  assert(Throws<graphdoc::util::EntityNotFound>([&] { f.entities.UpdateEntity(987654, std::string("x"), std::nullopt); }));
}

void TestCreateEntityValidation() {
  Fixture f;
  assert(Throws<graphdoc::util::UnknownType>([&] { f.entities.CreateEntity(4242, "Ghost"); }));
  assert(Throws<graphdoc::util::InvalidBaseType>([&] { f.entities.CreateEntity(f.employee, "Trait as base"); }));
  assert(Throws<graphdoc::util::InvalidArgument>([&] { f.entities.CreateEntity(f.person, ""); }));
  assert(f.entities.ListEntities().empty());
}

void TestTraitAssignment() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");

  assert(Throws<graphdoc::util::UnknownAttributeKey>([&] { f.entities.SetAttribute(alice, "salary", AttributeValue{1000.0}); }));

  f.entities.AssignTrait(alice, f.employee);
  f.entities.SetAttribute(alice, "salary", AttributeValue{1000.0});

  assert(Throws<graphdoc::util::DuplicateTraitAssignment>([&] { f.entities.AssignTrait(alice, f.employee); }));
  assert(Throws<graphdoc::util::InvalidTraitType>([&] { f.entities.AssignTrait(alice, f.company); }));
  assert(Throws<graphdoc::util::UnknownType>([&] { f.entities.AssignTrait(alice, 5555); }));
  assert(Throws<graphdoc::util::EntityNotFound>([&] { f.entities.AssignTrait(5555, f.employee); }));

  graphdoc::db::model::EntityFilter filter;
  filter.trait_type_id = f.employee;
  auto employees       = f.entities.ListEntities(filter);
  assert(employees.size() == 1 && employees[0].id == alice);
}

void TestAttributesAreTypedAndAdditive() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");

  f.entities.SetAttribute(alice, "age", AttributeValue{28.0});
  f.entities.SetAttribute(alice, "tag", AttributeValue{std::string("a")});
  f.entities.SetAttribute(alice, "tag", AttributeValue{std::string("b")});

  auto tags = f.entities.GetAttributeValues(alice, "tag");
  assert(tags.size() == 2);
  assert(std::get<std::string>(tags[0]) == "a");
  assert(std::get<std::string>(tags[1]) == "b");

  assert(Throws<graphdoc::util::DuplicateValue>([&] { f.entities.SetAttribute(alice, "tag", AttributeValue{std::string("a")}); }));
  assert(Throws<graphdoc::util::TypeMismatch>([&] { f.entities.SetAttribute(alice, "age", AttributeValue{std::string("28")}); }));
  assert(Throws<graphdoc::util::ConstraintViolation>([&] { f.entities.SetAttribute(alice, "age", AttributeValue{200.0}); }));
  assert(Throws<graphdoc::util::InvalidArgument>([&] { f.entities.SetAttribute(alice, "age", AttributeValue{std::nan("")}); }));
  assert(Throws<graphdoc::util::UnknownAttributeKey>([&] { f.entities.SetAttribute(alice, "height", AttributeValue{1.7}); }));

  // rejected writes leave nothing behind
  assert(f.entities.GetAttributeValues(alice, "age").size() == 1);
  assert(f.entities.GetAttributeValues(alice, "tag").size() == 2);
}

void TestDatetimeAndZeroValueIdentity() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");

  using std::chrono::microseconds;
  using std::chrono::milliseconds;
  const auto second = graphdoc::util::TimePoint{} + milliseconds(1000);

  // a datetime that milliseconds cannot hold is refused, not truncated
  assert(Throws<graphdoc::util::InvalidArgument>([&] { f.entities.SetAttribute(alice, "seen", AttributeValue{second + microseconds(100)}); }));
  assert(f.entities.GetAttributeValues(alice, "seen").empty());

  f.entities.SetAttribute(alice, "seen", AttributeValue{second});
  f.entities.SetAttribute(alice, "seen", AttributeValue{second + milliseconds(1)});
  auto seen = f.entities.GetAttributeValues(alice, "seen");
  assert(seen.size() == 2);
  assert(std::get<graphdoc::util::TimePoint>(seen[0]) == second);
  assert(std::get<graphdoc::util::TimePoint>(seen[1]) == second + milliseconds(1));
  assert(Throws<graphdoc::util::DuplicateValue>([&] { f.entities.SetAttribute(alice, "seen", AttributeValue{second}); }));

  f.entities.SetAttribute(alice, "score", AttributeValue{0.0});
  assert(Throws<graphdoc::util::DuplicateValue>([&] { f.entities.SetAttribute(alice, "score", AttributeValue{-0.0}); }));
  auto scores = f.entities.GetAttributeValues(alice, "score");
  assert(scores.size() == 1);
  assert(!std::signbit(std::get<double>(scores[0])));
}

void TestBaseDefinitionShadowsTraitKey() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");
  f.entities.AssignTrait(alice, f.employee);

  assert(Throws<graphdoc::util::TypeMismatch>([&] { f.entities.SetAttribute(alice, "age", AttributeValue{std::string("old")}); }));
  f.entities.SetAttribute(alice, "age", AttributeValue{30.0});
}

void TestMissingRequiredAttributes() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");
  f.entities.AssignTrait(alice, f.employee);

  auto missing = f.entities.MissingRequiredAttributes(alice);
  assert((missing == std::vector<std::string>{"name", "salary"}));

  f.entities.SetAttribute(alice, "name", AttributeValue{std::string("Alice")});
  missing = f.entities.MissingRequiredAttributes(alice);
  assert((missing == std::vector<std::string>{"salary"}));
}

void TestEmbedding() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");

  assert(!f.entities.GetEmbedding(alice));
  f.entities.SetEmbedding(alice, "v1");
  f.entities.SetEmbedding(alice, "v2");
  auto embedding = f.entities.GetEmbedding(alice);
  assert(embedding && *embedding == "v2");

  assert(Throws<graphdoc::util::EntityNotFound>([&] { f.entities.SetEmbedding(9999, "v"); }));
}

void TestDeleteEntity() {
  Fixture f;
  const auto alice = f.entities.CreateEntity(f.person, "Alice");
  f.entities.SetAttribute(alice, "age", AttributeValue{28.0});

  f.entities.DeleteEntity(alice);
  assert(!f.entities.GetEntity(alice));
  assert(Throws<graphdoc::util::EntityNotFound>([&] { f.entities.DeleteEntity(alice); }));
}

} // namespace

int main() {
  TestCreateAndUpdateEntity();
  TestCreateEntityValidation();
  TestTraitAssignment();
  TestAttributesAreTypedAndAdditive();
  TestDatetimeAndZeroValueIdentity();
  TestBaseDefinitionShadowsTraitKey();
  TestMissingRequiredAttributes();
  TestEmbedding();
  TestDeleteEntity();

  std::cout << "graphdoc_unit_entity_store: pass\n";
  return 0;
}
