#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/materialize/graph_materializer.hpp"
#include "internal/registry/type_registry.hpp"
#include "internal/relation/relationship_store.hpp"

#if GRAPHDOC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if GRAPHDOC_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using graphdoc::db::ErrorCode;
using graphdoc::db::Repository;
using graphdoc::db::TxMode;
using graphdoc::db::memory::MemoryRepository;
using graphdoc::db::model::AttributeDefinitionRecord;
using graphdoc::db::model::AttributeRecord;
using graphdoc::db::model::EmbeddingRecord;
using graphdoc::db::model::EntityFilter;
using graphdoc::db::model::EntityRecord;
using graphdoc::db::model::ModelTypeRecord;
using graphdoc::db::model::RelationAttributeDefinitionRecord;
using graphdoc::db::model::RelationAttributeRecord;
using graphdoc::db::model::RelationRecord;
using graphdoc::db::model::RelationshipTypeRecord;
using graphdoc::db::model::TraitAssignmentRecord;
using graphdoc::model::TypeKind;
using graphdoc::model::TypedColumns;
using graphdoc::model::ValueType;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Postgres keeps rows between runs, so every name carries a run suffix.
std::string Unique(const std::string& backend, const std::string& name) {
  static const std::string run = std::to_string(NowMs());
  return backend + "-" + name + "-" + run;
}

uint64_t InsertType(Repository& repo, graphdoc::db::Transaction& tx, const std::string& name, TypeKind kind) {
  ModelTypeRecord record;
  record.name = name;
  record.kind = kind;
  const auto result = repo.InsertModelType(tx, record);
  assert(result);
  assert(record.id != 0);
  return record.id;
}

uint64_t InsertDefinition(Repository& repo, graphdoc::db::Transaction& tx, uint64_t type_id, const std::string& key, ValueType value_type) {
  AttributeDefinitionRecord record;
  record.model_type_id = type_id;
  record.key           = key;
  record.value_type    = value_type;
  const auto result    = repo.InsertAttributeDefinition(tx, record);
  assert(result);
  return record.id;
}

uint64_t InsertEntity(Repository& repo, graphdoc::db::Transaction& tx, uint64_t type_id, const std::string& title) {
  EntityRecord record;
  record.model_type_id = type_id;
  record.title         = title;
  const auto result    = repo.InsertEntity(tx, record);
  assert(result);
  assert(record.created_at_ms > 0 && record.updated_at_ms > 0);
  return record.id;
}

// A failed statement poisons a Postgres transaction, so every rejected
// write runs in its own transaction, rolled back on scope exit.
template <typename Fn>
ErrorCode RejectedCode(Repository& repo, Fn&& fn) {
  auto       tx     = repo.Begin();
  const auto result = fn(*tx);
  assert(!result);
  return result.code;
}

void VerifyTypeRegistryRows(Repository& repo, const std::string& backend) {
  const auto base_name = Unique(backend, "Person");

  uint64_t                          person = 0;
  ModelTypeRecord                   child;
  RelationshipTypeRecord            knows;
  RelationAttributeDefinitionRecord since;
  {
    auto tx = repo.Begin();
    person  = InsertType(repo, *tx, base_name, TypeKind::kBase);

    child.name        = Unique(backend, "Child");
    child.parent_id   = person;
    child.description = "nested";
    child.is_action   = true;
    assert(repo.InsertModelType(*tx, child));

    InsertDefinition(repo, *tx, person, "age", ValueType::kNumber);

    knows.from_model_type_id = person;
    knows.to_model_type_id   = person;
    knows.relation_name      = Unique(backend, "knows");
    knows.multiplicity       = "one";
    assert(repo.InsertRelationshipType(*tx, knows));

    since.relationship_type_id = knows.id;
    since.key                  = "since";
    since.value_type           = ValueType::kDatetime;
    assert(repo.InsertRelationAttributeDefinition(*tx, since));
    tx->Commit();
  }

  assert(RejectedCode(repo, [&](auto& tx) {
           ModelTypeRecord duplicate;
           duplicate.name = base_name;
           return repo.InsertModelType(tx, duplicate);
         }) == ErrorCode::AlreadyExists);

  assert(RejectedCode(repo, [&](auto& tx) {
           ModelTypeRecord orphan;
           orphan.name      = Unique(backend, "Orphan");
           orphan.parent_id = child.id + 100000;
           return repo.InsertModelType(tx, orphan);
         }) == ErrorCode::ConstraintViolation);

  assert(RejectedCode(repo, [&](auto& tx) {
           AttributeDefinitionRecord dup_key;
           dup_key.model_type_id = person;
           dup_key.key           = "age";
           return repo.InsertAttributeDefinition(tx, dup_key);
         }) == ErrorCode::AlreadyExists);

  assert(RejectedCode(repo, [&](auto& tx) {
           RelationshipTypeRecord knows_again = knows;
           knows_again.id                     = 0;
           return repo.InsertRelationshipType(tx, knows_again);
         }) == ErrorCode::AlreadyExists);

  auto tx = repo.Begin(TxMode::kReadOnly);

  auto loaded = repo.GetModelType(*tx, child.id);
  assert(loaded);
  assert(loaded->parent_id && *loaded->parent_id == person);
  assert(loaded->description && *loaded->description == "nested");
  assert(loaded->is_action);
  assert(repo.GetModelTypeByName(*tx, base_name)->id == person);
  assert(!repo.GetModelTypeByName(*tx, Unique(backend, "Nobody")));

  auto definition = repo.GetAttributeDefinition(*tx, person, "age");
  assert(definition && definition->value_type == ValueType::kNumber);
  assert(repo.ListAttributeDefinitions(*tx, person).size() == 1);

  auto found = repo.FindRelationshipType(*tx, person, person, knows.relation_name);
  assert(found && found->id == knows.id && found->multiplicity == "one");
  assert(repo.ListRelationshipTypesByName(*tx, knows.relation_name).size() == 1);

  assert(repo.GetRelationAttributeDefinition(*tx, knows.id, "since")->id == since.id);
  assert(repo.ListRelationAttributeDefinitions(*tx, knows.id).size() == 1);
}

void VerifyEntityAndAttributeRows(Repository& repo, const std::string& backend) {
  uint64_t person = 0, badge = 0, tag = 0, vec = 0, alice = 0, bob = 0;

  TypedColumns text, number, when, flag, payload, second;
  text.text      = "first";
  number.number  = 28.0;
  when.time_ms   = 1700000000123;
  flag.boolean   = false;
  payload.vector = "0.25,0.5,1";
  second.text    = "second";

  auto insert = [&](graphdoc::db::Transaction& tx, uint64_t definition, const TypedColumns& columns) {
    AttributeRecord record;
    record.entity_id               = alice;
    record.attribute_definition_id = definition;
    record.columns                 = columns;
    return repo.InsertAttribute(tx, record);
  };

  {
    auto tx = repo.Begin();

    person            = InsertType(repo, *tx, Unique(backend, "EavPerson"), TypeKind::kBase);
    badge             = InsertType(repo, *tx, Unique(backend, "EavBadge"), TypeKind::kTrait);
    tag               = InsertDefinition(repo, *tx, person, "tag", ValueType::kString);
    const auto age    = InsertDefinition(repo, *tx, person, "age", ValueType::kNumber);
    const auto born   = InsertDefinition(repo, *tx, person, "born", ValueType::kDatetime);
    const auto active = InsertDefinition(repo, *tx, person, "active", ValueType::kBoolean);
    vec               = InsertDefinition(repo, *tx, person, "vec", ValueType::kVector);

    alice = InsertEntity(repo, *tx, person, "Alice");
    bob   = InsertEntity(repo, *tx, person, "Bob");

    auto entity = repo.GetEntity(*tx, alice);
    assert(entity && entity->title == "Alice" && !entity->body);
    entity->body = "updated";
    assert(repo.UpdateEntity(*tx, *entity));
    assert(repo.GetEntity(*tx, alice)->body == std::optional<std::string>("updated"));

    TraitAssignmentRecord assignment;
    assignment.entity_id     = alice;
    assignment.trait_type_id = badge;
    assert(repo.InsertTraitAssignment(*tx, assignment));
    assert(assignment.applied_at_ms > 0);

    assert(insert(*tx, tag, text));
    assert(insert(*tx, age, number));
    assert(insert(*tx, born, when));
    assert(insert(*tx, active, flag));
    assert(insert(*tx, vec, payload));
    assert(insert(*tx, tag, second));

    EmbeddingRecord embedding;
    embedding.entity_id = alice;
    embedding.embedding = "e1";
    assert(repo.UpsertEmbedding(*tx, embedding));
    embedding.embedding = "e2";
    assert(repo.UpsertEmbedding(*tx, embedding));

    tx->Commit();
  }

  assert(RejectedCode(repo, [&](auto& tx) {
           EntityRecord missing;
           missing.id    = alice + bob + 100000;
           missing.title = "ghost";
           return repo.UpdateEntity(tx, missing);
         }) == ErrorCode::NotFound);

  assert(RejectedCode(repo, [&](auto& tx) {
           TraitAssignmentRecord again;
           again.entity_id     = alice;
           again.trait_type_id = badge;
           return repo.InsertTraitAssignment(tx, again);
         }) == ErrorCode::AlreadyExists);

  assert(RejectedCode(repo, [&](auto& tx) { return insert(tx, tag, text); }) == ErrorCode::AlreadyExists);
  assert(RejectedCode(repo, [&](auto& tx) { return insert(tx, vec + 100000, text); }) == ErrorCode::ConstraintViolation);

  auto tx = repo.Begin(TxMode::kReadOnly);

  EntityFilter by_trait;
  by_trait.trait_type_id = badge;
  auto with_badge        = repo.ListEntities(*tx, by_trait);
  assert(with_badge.size() == 1 && with_badge[0].id == alice);

  EntityFilter by_base;
  by_base.base_type_id = person;
  auto people          = repo.ListEntities(*tx, by_base);
  assert(people.size() == 2 && people[0].id == alice && people[1].id == bob);

  EntityFilter by_title;
  by_title.base_type_id = person;
  by_title.title        = "Bob";
  assert(repo.ListEntities(*tx, by_title).size() == 1);

  auto rows = repo.ListAttributes(*tx, alice);
  assert(rows.size() == 6);
  for (size_t i = 1; i < rows.size(); ++i) {
    assert(rows[i - 1].id < rows[i].id);
  }
  assert(rows[0].columns == text);
  assert(rows[1].columns == number);
  assert(rows[2].columns == when);
  assert(rows[3].columns == flag);
  assert(rows[4].columns == payload);
  assert(rows[5].columns == second);

  assert(repo.GetEmbedding(*tx, alice)->embedding == "e2");
  assert(!repo.GetEmbedding(*tx, bob));
}

void VerifyRelationsAndCascades(Repository& repo, const std::string& backend) {
  uint64_t person = 0, alice = 0, bob = 0, carol = 0;

  RelationshipTypeRecord            knows;
  RelationAttributeDefinitionRecord weight;
  RelationRecord                    ab, cb;
  RelationAttributeRecord           w;
  {
    auto tx = repo.Begin();

    person           = InsertType(repo, *tx, Unique(backend, "RelPerson"), TypeKind::kBase);
    const auto badge = InsertType(repo, *tx, Unique(backend, "RelBadge"), TypeKind::kTrait);
    const auto tag   = InsertDefinition(repo, *tx, person, "tag", ValueType::kString);

    knows.from_model_type_id = person;
    knows.to_model_type_id   = person;
    knows.relation_name      = Unique(backend, "rel-knows");
    assert(repo.InsertRelationshipType(*tx, knows));

    weight.relationship_type_id = knows.id;
    weight.key                  = "weight";
    weight.value_type           = ValueType::kNumber;
    assert(repo.InsertRelationAttributeDefinition(*tx, weight));

    alice = InsertEntity(repo, *tx, person, "Alice");
    bob   = InsertEntity(repo, *tx, person, "Bob");
    carol = InsertEntity(repo, *tx, person, "Carol");

    ab.from_id              = alice;
    ab.to_id                = bob;
    ab.relationship_type_id = knows.id;
    assert(repo.InsertRelation(*tx, ab));
    assert(ab.created_at_ms > 0);

    cb.from_id              = carol;
    cb.to_id                = bob;
    cb.relationship_type_id = knows.id;
    assert(repo.InsertRelation(*tx, cb));

    w.relation_id                      = ab.id;
    w.relation_attribute_definition_id = weight.id;
    w.columns.number                   = 0.5;
    assert(repo.InsertRelationAttribute(*tx, w));

    TraitAssignmentRecord assignment;
    assignment.entity_id     = alice;
    assignment.trait_type_id = badge;
    assert(repo.InsertTraitAssignment(*tx, assignment));

    AttributeRecord value;
    value.entity_id               = alice;
    value.attribute_definition_id = tag;
    value.columns.text            = "x";
    assert(repo.InsertAttribute(*tx, value));

    EmbeddingRecord embedding;
    embedding.entity_id = alice;
    embedding.embedding = "e";
    assert(repo.UpsertEmbedding(*tx, embedding));

    tx->Commit();
  }

  assert(RejectedCode(repo, [&](auto& tx) {
           RelationRecord dangling = ab;
           dangling.id             = 0;
           dangling.to_id          = carol + 100000;
           return repo.InsertRelation(tx, dangling);
         }) == ErrorCode::ConstraintViolation);

  assert(RejectedCode(repo, [&](auto& tx) {
           RelationAttributeRecord w_again = w;
           w_again.id                      = 0;
           return repo.InsertRelationAttribute(tx, w_again);
         }) == ErrorCode::AlreadyExists);

  {
    auto tx     = repo.Begin(TxMode::kReadOnly);
    auto of_bob = repo.ListRelations(*tx, bob);
    assert(of_bob.size() == 2 && of_bob[0].id == ab.id && of_bob[1].id == cb.id);
    assert(repo.ListRelations(*tx, alice).size() == 1);
    assert(repo.ListRelationAttributes(*tx, ab.id).size() == 1);
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteRelation(*tx, cb.id));
    assert(repo.DeleteRelation(*tx, cb.id).code == ErrorCode::NotFound);
    assert(repo.DeleteEntity(*tx, alice));
    assert(repo.DeleteEntity(*tx, alice).code == ErrorCode::NotFound);
    tx->Commit();
  }

  auto tx = repo.Begin(TxMode::kReadOnly);
  assert(!repo.GetRelation(*tx, cb.id));
  assert(!repo.GetEntity(*tx, alice));
  assert(repo.ListTraitAssignments(*tx, alice).empty());
  assert(repo.ListAttributes(*tx, alice).empty());
  assert(!repo.GetEmbedding(*tx, alice));
  assert(!repo.GetRelation(*tx, ab.id));
  assert(repo.ListRelationAttributes(*tx, ab.id).empty());
  assert(repo.ListRelations(*tx, bob).empty());
  assert(repo.GetEntity(*tx, carol));
}

void VerifyRollbackBehavior(Repository& repo, const std::string& backend) {
  const auto name = Unique(backend, "RolledBack");
  {
    auto tx = repo.Begin();
    InsertType(repo, *tx, name, TypeKind::kBase);

    // uncommitted writes stay invisible to readers
    auto reader = repo.Begin(TxMode::kReadOnly);
    assert(!repo.GetModelTypeByName(*reader, name));
  }

  {
    auto tx = repo.Begin();
    InsertType(repo, *tx, name, TypeKind::kBase);
    tx->Rollback();
  }

  auto tx = repo.Begin(TxMode::kReadOnly);
  assert(!repo.GetModelTypeByName(*tx, name));
}

void VerifyStoreLevelMaterialization(const std::shared_ptr<Repository>& repo, const std::string& backend) {
  graphdoc::registry::TypeRegistry     registry(repo);
  graphdoc::entity::EntityStore        entities(repo);
  graphdoc::relation::RelationshipStore relations(repo);

  const auto person   = registry.DefineType(Unique(backend, "MatPerson"), TypeKind::kBase);
  const auto company  = registry.DefineType(Unique(backend, "MatCompany"), TypeKind::kBase);
  const auto employee = registry.DefineType(Unique(backend, "MatEmployee"), TypeKind::kTrait);
  registry.DefineAttribute(person, "age", ValueType::kNumber);
  registry.DefineAttribute(person, "nickname", ValueType::kString);
  registry.DefineAttribute(employee, "salary", ValueType::kNumber);
  const auto works_at = registry.DefineRelationshipType(person, company, "works_at");
  registry.DefineRelationAttribute(works_at, "role", ValueType::kString);

  const auto alice = entities.CreateEntity(person, "Alice");
  const auto acme  = entities.CreateEntity(company, "Acme");
  entities.AssignTrait(alice, employee);
  entities.SetAttribute(alice, "age", graphdoc::model::AttributeValue{28.0});
  entities.SetAttribute(alice, "nickname", graphdoc::model::AttributeValue{std::string("Al")});
  entities.SetAttribute(alice, "nickname", graphdoc::model::AttributeValue{std::string("Ally")});
  entities.SetAttribute(alice, "salary", graphdoc::model::AttributeValue{5000.0});
  const auto relation = relations.CreateRelation(alice, acme, works_at);
  relations.SetRelationAttribute(relation, "role", graphdoc::model::AttributeValue{std::string("engineer")});

  std::vector<graphdoc::materialize::GraphMaterializer> strategies;
  strategies.emplace_back(repo);
  if (repo->SupportsStoredMaterialization()) {
    strategies.emplace_back(repo, graphdoc::materialize::GraphMaterializer::Options{.use_stored_function = true, .validate_output = true});
  }

  for (auto& materializer : strategies) {
    auto full = materializer.Materialize(alice);
    assert(full);
    const auto& fields     = full->struct_value().fields();
    const auto& model      = fields.at("model").struct_value().fields();
    const auto& attributes = fields.at("attributes").struct_value().fields();
    const auto& edges      = fields.at("relations").list_value();

    assert(model.at("title").string_value() == "Alice");
    assert(model.at("model_type").struct_value().fields().at("traits").list_value().values_size() == 1);
    assert(attributes.at("age").number_value() == 28.0);
    assert(attributes.at("nickname").string_value() == "Ally");
    assert(attributes.at("salary").number_value() == 5000.0);
    assert(edges.values_size() == 1);

    const auto& edge = edges.values(0).struct_value().fields();
    assert(edge.at("relation_id").number_value() == static_cast<double>(relation));
    assert(edge.at("direction").string_value() == "outgoing");
    assert(edge.at("other_model").struct_value().fields().at("title").string_value() == "Acme");
    assert(edge.at("relation_attributes").struct_value().fields().at("role").string_value() == "engineer");

    auto reverse = materializer.Materialize(acme);
    assert(reverse);
    const auto& reverse_edges = reverse->struct_value().fields().at("relations").list_value();
    assert(reverse_edges.values_size() == 1);
    assert(reverse_edges.values(0).struct_value().fields().at("direction").string_value() == "incoming");

    assert(!materializer.Materialize(alice + acme + 100000));
  }
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& name) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    InsertType(*repo, *tx, name, TypeKind::kBase);
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin(TxMode::kReadOnly);
  assert(repo->GetModelTypeByName(*tx, name));
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if GRAPHDOC_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("graphdoc_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto repo = std::make_shared<graphdoc::db::sqlite::SqliteRepository>(std::make_shared<graphdoc::db::sqlite::SqliteDB>(db_path));
    repo->BootstrapSchema();
    return std::shared_ptr<Repository>(std::move(repo));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if GRAPHDOC_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("GRAPHDOC_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("GRAPHDOC_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<graphdoc::db::postgres::PgPool>(conninfo);
    pool->BootstrapSchema();
    return std::shared_ptr<Repository>(std::make_shared<graphdoc::db::postgres::PgRepository>(std::move(pool)));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyTypeRegistryRows(*repo, backend.name);
  VerifyEntityAndAttributeRows(*repo, backend.name);
  VerifyRelationsAndCascades(*repo, backend.name);
  VerifyRollbackBehavior(*repo, backend.name);
  VerifyStoreLevelMaterialization(repo, backend.name);

  repo.reset();
  VerifyRestartDurability(backend, Unique(backend.name, "durable"));

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if GRAPHDOC_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if GRAPHDOC_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "graphdoc_integration_repository_parity: pass\n";
  return 0;
}
