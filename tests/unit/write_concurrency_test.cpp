#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/entity/entity_store.hpp"
#include "internal/registry/type_registry.hpp"
#include "internal/relation/relationship_store.hpp"
#include "internal/util/errors.hpp"

#if GRAPHDOC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using graphdoc::db::Repository;
using graphdoc::entity::EntityStore;
using graphdoc::model::AttributeValue;
using graphdoc::model::TypeKind;
using graphdoc::model::ValueType;
using graphdoc::registry::TypeRegistry;
using graphdoc::relation::RelationshipStore;

constexpr int kThreads = 8;

struct Outcome {
  std::atomic<int> ok{0};
  std::atomic<int> rejected{0};
};

// Runs the same write from every thread at once. Each attempt must either
// succeed or fail with the expected domain error.
template <typename Expected>
void Race(const std::function<void()>& write, Outcome& outcome) {
  std::atomic<bool>        go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      try {
        write();
        ++outcome.ok;
      } catch (const Expected&) {
        ++outcome.rejected;
      }
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }
}

void RunRaces(const std::string& backend, const std::shared_ptr<Repository>& repository) {
  TypeRegistry      registry(repository);
  EntityStore       entities(repository);
  RelationshipStore relations(repository);

  {
    Outcome outcome;
    Race<graphdoc::util::DuplicateName>([&] { registry.DefineType("Person", TypeKind::kBase); }, outcome);
    assert(outcome.ok == 1);
    assert(outcome.rejected == kThreads - 1);
  }

  const auto person  = registry.GetTypeByName("Person").id;
  const auto company = registry.DefineType("Company", TypeKind::kBase);
  const auto badge   = registry.DefineType("Badge", TypeKind::kTrait);
  registry.DefineAttribute(person, "tag", ValueType::kString);
  const auto works_at = registry.DefineRelationshipType(person, company, "works_at", "one");

  const auto alice = entities.CreateEntity(person, "Alice");
  const auto acme  = entities.CreateEntity(company, "Acme");

  {
    Outcome outcome;
    Race<graphdoc::util::DuplicateValue>([&] { entities.SetAttribute(alice, "tag", AttributeValue{std::string("same")}); }, outcome);
    assert(outcome.ok == 1);
    assert(outcome.rejected == kThreads - 1);
    assert(entities.GetAttributeValues(alice, "tag").size() == 1);
  }

  {
    Outcome outcome;
    Race<graphdoc::util::DuplicateTraitAssignment>([&] { entities.AssignTrait(alice, badge); }, outcome);
    assert(outcome.ok == 1);
    assert(outcome.rejected == kThreads - 1);
  }

  {
    Outcome outcome;
    Race<graphdoc::util::MultiplicityExceeded>([&] { relations.CreateRelation(alice, acme, works_at); }, outcome);
    assert(outcome.ok == 1);
    assert(outcome.rejected == kThreads - 1);
    assert(relations.ListRelations(alice).size() == 1);
  }

  {
    // distinct values never collide
    Outcome           outcome;
    std::atomic<int>  next{0};
    Race<graphdoc::util::DuplicateValue>(
        [&] { entities.SetAttribute(alice, "tag", AttributeValue{"v" + std::to_string(next++)}); }, outcome);
    assert(outcome.ok == kThreads);
    assert(entities.GetAttributeValues(alice, "tag").size() == kThreads + 1);
  }

  std::cout << "  " << backend << ": ok\n";
}

} // namespace

int main() {
  RunRaces("memory", std::make_shared<graphdoc::db::memory::MemoryRepository>());

#if GRAPHDOC_DB_SQLITE
  const auto path = std::filesystem::temp_directory_path() /
                    ("graphdoc_concurrency_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db");
  {
    auto repository = std::make_shared<graphdoc::db::sqlite::SqliteRepository>(std::make_shared<graphdoc::db::sqlite::SqliteDB>(path.string()));
    repository->BootstrapSchema();
    RunRaces("sqlite", repository);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
#endif

  std::cout << "graphdoc_unit_write_concurrency: pass\n";
  return 0;
}
