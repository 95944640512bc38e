#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace graphdoc::db::sqlite {

using graphdoc::db::ErrorCode;
using graphdoc::db::Result;
using graphdoc::model::TypedColumns;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

[[noreturn]] void ThrowReadFailure(sqlite3* db, const char* what) {
  throw util::StoreUnavailable(std::string("sqlite ") + what + ": " + sqlite3_errmsg(db));
}

// Read paths throw; write paths check for a null statement and report a Result.
Statement PrepareOrNull(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return Statement(nullptr, &sqlite3_finalize);
  }
  return Statement(st, &sqlite3_finalize);
}

Statement PrepareForRead(sqlite3* db, const char* sql) {
  auto st = PrepareOrNull(db, sql);
  if (!st) ThrowReadFailure(db, "prepare");
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

// Binds value_text..value_vector, value_key at idx..idx+5.
void BindColumns(sqlite3_stmt* st, int idx, const TypedColumns& c) {
  BindOptText(st, idx, c.text);
  if (c.number) {
    sqlite3_bind_double(st, idx + 1, *c.number);
  } else {
    sqlite3_bind_null(st, idx + 1);
  }
  if (c.time_ms) {
    sqlite3_bind_int64(st, idx + 2, static_cast<sqlite3_int64>(*c.time_ms));
  } else {
    sqlite3_bind_null(st, idx + 2);
  }
  if (c.boolean) {
    BindBool(st, idx + 3, *c.boolean);
  } else {
    sqlite3_bind_null(st, idx + 3);
  }
  BindOptText(st, idx + 4, c.vector);
  BindText(st, idx + 5, graphdoc::model::ValueKey(c));
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const auto* t = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
  if (!t) return {};
  return std::string(t, static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColU64(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

TypedColumns ColColumns(sqlite3_stmt* st, int col) {
  TypedColumns c;
  c.text = ColOptText(st, col);
  if (!IsNull(st, col + 1)) c.number = sqlite3_column_double(st, col + 1);
  if (!IsNull(st, col + 2)) c.time_ms = static_cast<int64_t>(sqlite3_column_int64(st, col + 2));
  if (!IsNull(st, col + 3)) c.boolean = ColBool(st, col + 3);
  c.vector = ColOptText(st, col + 4);
  return c;
}

// Steps through every row, appending read(st) for each.
template <typename Row, typename ReadFn>
std::vector<Row> Collect(sqlite3* db, sqlite3_stmt* st, ReadFn read) {
  std::vector<Row> out;
  int              rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) ThrowReadFailure(db, "step");
  return out;
}

template <typename Row, typename ReadFn>
std::optional<Row> First(sqlite3* db, sqlite3_stmt* st, ReadFn read) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowReadFailure(db, "step");
  return read(st);
}

// ------------------------------------------------------------------
// Row readers (column order matches the SELECT lists below)
// ------------------------------------------------------------------

constexpr const char* kModelTypeColumns = "SELECT id,name,type_kind,parent_id,is_action,description FROM model_types ";

model::ModelTypeRecord ReadModelType(sqlite3_stmt* st) {
  model::ModelTypeRecord r;
  r.id          = ColU64(st, 0);
  r.name        = ColText(st, 1);
  r.kind        = graphdoc::model::ParseTypeKind(ColText(st, 2)).value_or(graphdoc::model::TypeKind::kBase);
  r.parent_id   = ColOptU64(st, 3);
  r.is_action   = ColBool(st, 4);
  r.description = ColOptText(st, 5);
  return r;
}

constexpr const char* kAttributeDefinitionColumns =
    "SELECT id,model_type_id,key,value_type,required,constraints FROM attribute_definitions ";

model::AttributeDefinitionRecord ReadAttributeDefinition(sqlite3_stmt* st) {
  model::AttributeDefinitionRecord r;
  r.id            = ColU64(st, 0);
  r.model_type_id = ColU64(st, 1);
  r.key           = ColText(st, 2);
  r.value_type    = graphdoc::model::ParseValueType(ColText(st, 3)).value_or(graphdoc::model::ValueType::kString);
  r.required      = ColBool(st, 4);
  r.constraints   = ColText(st, 5);
  return r;
}

constexpr const char* kRelationshipTypeColumns =
    "SELECT id,from_model_type_id,to_model_type_id,relation_name,multiplicity,description FROM relationship_types ";

model::RelationshipTypeRecord ReadRelationshipType(sqlite3_stmt* st) {
  model::RelationshipTypeRecord r;
  r.id                 = ColU64(st, 0);
  r.from_model_type_id = ColU64(st, 1);
  r.to_model_type_id   = ColU64(st, 2);
  r.relation_name      = ColText(st, 3);
  r.multiplicity       = ColText(st, 4);
  r.description        = ColOptText(st, 5);
  return r;
}

constexpr const char* kRelationAttributeDefinitionColumns =
    "SELECT id,relationship_type_id,key,value_type,required FROM relation_attribute_definitions ";

model::RelationAttributeDefinitionRecord ReadRelationAttributeDefinition(sqlite3_stmt* st) {
  model::RelationAttributeDefinitionRecord r;
  r.id                   = ColU64(st, 0);
  r.relationship_type_id = ColU64(st, 1);
  r.key                  = ColText(st, 2);
  r.value_type           = graphdoc::model::ParseValueType(ColText(st, 3)).value_or(graphdoc::model::ValueType::kString);
  r.required             = ColBool(st, 4);
  return r;
}

model::EntityRecord ReadEntity(sqlite3_stmt* st) {
  model::EntityRecord r;
  r.id            = ColU64(st, 0);
  r.model_type_id = ColU64(st, 1);
  r.title         = ColText(st, 2);
  r.body          = ColOptText(st, 3);
  r.created_at_ms = ColU64(st, 4);
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

model::RelationRecord ReadRelation(sqlite3_stmt* st) {
  model::RelationRecord r;
  r.id                   = ColU64(st, 0);
  r.from_id              = ColU64(st, 1);
  r.to_id                = ColU64(st, 2);
  r.relationship_type_id = ColU64(st, 3);
  r.created_at_ms        = ColU64(st, 4);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
  if (mode == TxMode::kReadWrite || db_->IsPrivate()) {
    return std::make_unique<SqliteTransaction>(db_, mode, /*shared_connection=*/true);
  }

  // Readers get their own connection so they never queue behind a writer.
  SqliteOptions options = db_->Options();
  options.read_only     = true;
  auto reader           = std::make_shared<SqliteDB>(db_->Path(), options);
  return std::make_unique<SqliteTransaction>(std::move(reader), mode, /*shared_connection=*/false);
}

void SqliteRepository::BootstrapSchema() {
  std::scoped_lock lock(db_->WriterMutex());
  for (const auto& statement : sql::SqliteSchema()) {
    db_->Exec(statement);
  }
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_CONSTRAINT_UNIQUE:
    case SQLITE_CONSTRAINT_PRIMARYKEY:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_CORRUPT:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Type registry
// ------------------------------------------------------------------

Result SqliteRepository::InsertModelType(Transaction& t, model::ModelTypeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "INSERT INTO model_types(name,type_kind,parent_id,is_action,description) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, std::string(graphdoc::model::ToString(r.kind)));
  BindOptU64(st.get(), 3, r.parent_id);
  BindBool(st.get(), 4, r.is_action);
  BindOptText(st.get(), 5, r.description);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::ModelTypeRecord> SqliteRepository::GetModelType(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kModelTypeColumns) + "WHERE id=?;").c_str());
  BindU64(st.get(), 1, id);
  return First<model::ModelTypeRecord>(db, st.get(), ReadModelType);
}

std::optional<model::ModelTypeRecord> SqliteRepository::GetModelTypeByName(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kModelTypeColumns) + "WHERE name=?;").c_str());
  BindText(st.get(), 1, name);
  return First<model::ModelTypeRecord>(db, st.get(), ReadModelType);
}

std::vector<model::ModelTypeRecord> SqliteRepository::ListModelTypes(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kModelTypeColumns) + "ORDER BY id;").c_str());
  return Collect<model::ModelTypeRecord>(db, st.get(), ReadModelType);
}

Result SqliteRepository::InsertAttributeDefinition(Transaction& t, model::AttributeDefinitionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "INSERT INTO attribute_definitions(model_type_id,key,value_type,required,constraints) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.model_type_id);
  BindText(st.get(), 2, r.key);
  BindText(st.get(), 3, std::string(graphdoc::model::ToString(r.value_type)));
  BindBool(st.get(), 4, r.required);
  BindText(st.get(), 5, r.constraints);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::AttributeDefinitionRecord> SqliteRepository::GetAttributeDefinition(Transaction& t, uint64_t model_type_id,
                                                                                         const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kAttributeDefinitionColumns) + "WHERE model_type_id=? AND key=?;").c_str());
  BindU64(st.get(), 1, model_type_id);
  BindText(st.get(), 2, key);
  return First<model::AttributeDefinitionRecord>(db, st.get(), ReadAttributeDefinition);
}

std::vector<model::AttributeDefinitionRecord> SqliteRepository::ListAttributeDefinitions(Transaction& t, uint64_t model_type_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kAttributeDefinitionColumns) + "WHERE model_type_id=? ORDER BY id;").c_str());
  BindU64(st.get(), 1, model_type_id);
  return Collect<model::AttributeDefinitionRecord>(db, st.get(), ReadAttributeDefinition);
}

Result SqliteRepository::InsertRelationshipType(Transaction& t, model::RelationshipTypeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db,
                           "INSERT INTO relationship_types(from_model_type_id,to_model_type_id,relation_name,multiplicity,description) "
                            "VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.from_model_type_id);
  BindU64(st.get(), 2, r.to_model_type_id);
  BindText(st.get(), 3, r.relation_name);
  BindText(st.get(), 4, r.multiplicity);
  BindOptText(st.get(), 5, r.description);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::RelationshipTypeRecord> SqliteRepository::GetRelationshipType(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kRelationshipTypeColumns) + "WHERE id=?;").c_str());
  BindU64(st.get(), 1, id);
  return First<model::RelationshipTypeRecord>(db, st.get(), ReadRelationshipType);
}

std::optional<model::RelationshipTypeRecord> SqliteRepository::FindRelationshipType(Transaction& t, uint64_t from_model_type_id,
                                                                                    uint64_t to_model_type_id, const std::string& relation_name) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(
      db, (std::string(kRelationshipTypeColumns) + "WHERE from_model_type_id=? AND to_model_type_id=? AND relation_name=?;").c_str());
  BindU64(st.get(), 1, from_model_type_id);
  BindU64(st.get(), 2, to_model_type_id);
  BindText(st.get(), 3, relation_name);
  return First<model::RelationshipTypeRecord>(db, st.get(), ReadRelationshipType);
}

std::vector<model::RelationshipTypeRecord> SqliteRepository::ListRelationshipTypesByName(Transaction& t, const std::string& relation_name) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kRelationshipTypeColumns) + "WHERE relation_name=? ORDER BY id;").c_str());
  BindText(st.get(), 1, relation_name);
  return Collect<model::RelationshipTypeRecord>(db, st.get(), ReadRelationshipType);
}

Result SqliteRepository::InsertRelationAttributeDefinition(Transaction& t, model::RelationAttributeDefinitionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "INSERT INTO relation_attribute_definitions(relationship_type_id,key,value_type,required) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.relationship_type_id);
  BindText(st.get(), 2, r.key);
  BindText(st.get(), 3, std::string(graphdoc::model::ToString(r.value_type)));
  BindBool(st.get(), 4, r.required);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::RelationAttributeDefinitionRecord> SqliteRepository::GetRelationAttributeDefinition(Transaction& t,
                                                                                                         uint64_t relationship_type_id,
                                                                                                         const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kRelationAttributeDefinitionColumns) + "WHERE relationship_type_id=? AND key=?;").c_str());
  BindU64(st.get(), 1, relationship_type_id);
  BindText(st.get(), 2, key);
  return First<model::RelationAttributeDefinitionRecord>(db, st.get(), ReadRelationAttributeDefinition);
}

std::vector<model::RelationAttributeDefinitionRecord> SqliteRepository::ListRelationAttributeDefinitions(Transaction& t,
                                                                                                         uint64_t relationship_type_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, (std::string(kRelationAttributeDefinitionColumns) + "WHERE relationship_type_id=? ORDER BY id;").c_str());
  BindU64(st.get(), 1, relationship_type_id);
  return Collect<model::RelationAttributeDefinitionRecord>(db, st.get(), ReadRelationAttributeDefinition);
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntity(Transaction& t, model::EntityRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "INSERT INTO entities(model_type_id,title,body,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

  BindU64(st.get(), 1, r.model_type_id);
  BindText(st.get(), 2, r.title);
  BindOptText(st.get(), 3, r.body);
  BindU64(st.get(), 4, r.created_at_ms);
  BindU64(st.get(), 5, r.updated_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::EntityRecord> SqliteRepository::GetEntity(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, "SELECT id,model_type_id,title,body,created_at_ms,updated_at_ms FROM entities WHERE id=?;");
  BindU64(st.get(), 1, id);
  return First<model::EntityRecord>(db, st.get(), ReadEntity);
}

std::vector<model::EntityRecord> SqliteRepository::ListEntities(Transaction& t, const model::EntityFilter& filter) {
  auto* db = TX(t).Handle();

  // Unset filters bind NULL and match everything.
  auto st = PrepareForRead(db,
                           "SELECT e.id,e.model_type_id,e.title,e.body,e.created_at_ms,e.updated_at_ms FROM entities e "
                           "WHERE (?1 IS NULL OR e.model_type_id=?1) "
                           "AND (?2 IS NULL OR EXISTS (SELECT 1 FROM trait_assignments ta WHERE ta.entity_id=e.id AND ta.trait_type_id=?2)) "
                           "AND (?3 IS NULL OR e.title=?3) "
                           "ORDER BY e.id;");
  BindOptU64(st.get(), 1, filter.base_type_id);
  BindOptU64(st.get(), 2, filter.trait_type_id);
  BindOptText(st.get(), 3, filter.title);
  return Collect<model::EntityRecord>(db, st.get(), ReadEntity);
}

Result SqliteRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "UPDATE entities SET model_type_id=?,title=?,body=?,created_at_ms=?,updated_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.model_type_id);
  BindText(st.get(), 2, r.title);
  BindOptText(st.get(), 3, r.body);
  BindU64(st.get(), 4, r.created_at_ms);
  BindU64(st.get(), 5, r.updated_at_ms);
  BindU64(st.get(), 6, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::DeleteEntity(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "DELETE FROM entities WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, id);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::InsertTraitAssignment(Transaction& t, model::TraitAssignmentRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "INSERT INTO trait_assignments(entity_id,trait_type_id,applied_at_ms) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  if (r.applied_at_ms == 0) r.applied_at_ms = util::NowMillis();

  BindU64(st.get(), 1, r.entity_id);
  BindU64(st.get(), 2, r.trait_type_id);
  BindU64(st.get(), 3, r.applied_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<model::TraitAssignmentRecord> SqliteRepository::ListTraitAssignments(Transaction& t, uint64_t entity_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, "SELECT id,entity_id,trait_type_id,applied_at_ms FROM trait_assignments WHERE entity_id=? ORDER BY id;");
  BindU64(st.get(), 1, entity_id);
  return Collect<model::TraitAssignmentRecord>(db, st.get(), [](sqlite3_stmt* row) {
    model::TraitAssignmentRecord r;
    r.id            = ColU64(row, 0);
    r.entity_id     = ColU64(row, 1);
    r.trait_type_id = ColU64(row, 2);
    r.applied_at_ms = ColU64(row, 3);
    return r;
  });
}

Result SqliteRepository::InsertAttribute(Transaction& t, model::AttributeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db,
                           "INSERT INTO attributes(entity_id,attribute_definition_id,value_text,value_number,value_time_ms,value_bool,value_vector,value_key) "
                            "VALUES(?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.entity_id);
  BindU64(st.get(), 2, r.attribute_definition_id);
  BindColumns(st.get(), 3, r.columns);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<model::AttributeRecord> SqliteRepository::ListAttributes(Transaction& t, uint64_t entity_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db,
                            "SELECT id,entity_id,attribute_definition_id,value_text,value_number,value_time_ms,value_bool,value_vector "
                             "FROM attributes WHERE entity_id=? ORDER BY id;");
  BindU64(st.get(), 1, entity_id);
  return Collect<model::AttributeRecord>(db, st.get(), [](sqlite3_stmt* row) {
    model::AttributeRecord r;
    r.id                      = ColU64(row, 0);
    r.entity_id               = ColU64(row, 1);
    r.attribute_definition_id = ColU64(row, 2);
    r.columns                 = ColColumns(row, 3);
    return r;
  });
}

Result SqliteRepository::UpsertEmbedding(Transaction& t, const model::EmbeddingRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db,
                           "INSERT INTO embeddings(entity_id,embedding) VALUES(?,?) "
                            "ON CONFLICT(entity_id) DO UPDATE SET embedding=excluded.embedding;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.entity_id);
  BindText(st.get(), 2, r.embedding);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::EmbeddingRecord> SqliteRepository::GetEmbedding(Transaction& t, uint64_t entity_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, "SELECT entity_id,embedding FROM embeddings WHERE entity_id=?;");
  BindU64(st.get(), 1, entity_id);
  return First<model::EmbeddingRecord>(db, st.get(), [](sqlite3_stmt* row) {
    model::EmbeddingRecord r;
    r.entity_id = ColU64(row, 0);
    r.embedding = ColText(row, 1);
    return r;
  });
}

// ------------------------------------------------------------------
// Relations
// ------------------------------------------------------------------

Result SqliteRepository::InsertRelation(Transaction& t, model::RelationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "INSERT INTO relations(from_id,to_id,relationship_type_id,created_at_ms) VALUES(?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  if (r.created_at_ms == 0) r.created_at_ms = util::NowMillis();

  BindU64(st.get(), 1, r.from_id);
  BindU64(st.get(), 2, r.to_id);
  BindU64(st.get(), 3, r.relationship_type_id);
  BindU64(st.get(), 4, r.created_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::optional<model::RelationRecord> SqliteRepository::GetRelation(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, "SELECT id,from_id,to_id,relationship_type_id,created_at_ms FROM relations WHERE id=?;");
  BindU64(st.get(), 1, id);
  return First<model::RelationRecord>(db, st.get(), ReadRelation);
}

std::vector<model::RelationRecord> SqliteRepository::ListRelations(Transaction& t, uint64_t entity_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db, "SELECT id,from_id,to_id,relationship_type_id,created_at_ms FROM relations WHERE from_id=?1 OR to_id=?1 ORDER BY id;");
  BindU64(st.get(), 1, entity_id);
  return Collect<model::RelationRecord>(db, st.get(), ReadRelation);
}

Result SqliteRepository::DeleteRelation(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db, "DELETE FROM relations WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, id);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::InsertRelationAttribute(Transaction& t, model::RelationAttributeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrNull(db,
                           "INSERT INTO relation_attributes(relation_id,relation_attribute_definition_id,value_text,value_number,value_time_ms,"
                            "value_bool,value_vector,value_key) VALUES(?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.relation_id);
  BindU64(st.get(), 2, r.relation_attribute_definition_id);
  BindColumns(st.get(), 3, r.columns);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<model::RelationAttributeRecord> SqliteRepository::ListRelationAttributes(Transaction& t, uint64_t relation_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareForRead(db,
                            "SELECT id,relation_id,relation_attribute_definition_id,value_text,value_number,value_time_ms,value_bool,value_vector "
                             "FROM relation_attributes WHERE relation_id=? ORDER BY id;");
  BindU64(st.get(), 1, relation_id);
  return Collect<model::RelationAttributeRecord>(db, st.get(), [](sqlite3_stmt* row) {
    model::RelationAttributeRecord r;
    r.id                               = ColU64(row, 0);
    r.relation_id                      = ColU64(row, 1);
    r.relation_attribute_definition_id = ColU64(row, 2);
    r.columns                          = ColColumns(row, 3);
    return r;
  });
}

} // namespace graphdoc::db::sqlite
