#pragma once

#include <string>
#include <vector>

namespace graphdoc::db::sql {

/*
  Bootstrap DDL.

  Every statement is idempotent (IF NOT EXISTS / OR REPLACE) so it can
  run on every start. Versioned migrations are out of scope.

  Typed value columns: exactly one of value_text, value_number,
  value_time_ms, value_bool, value_vector is non-null (CHECK); value_key
  is the type-tagged canonical text of that column and carries the
  (owner, definition, value) uniqueness constraint.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS model_types ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " name TEXT NOT NULL UNIQUE,"
      " type_kind TEXT NOT NULL CHECK (type_kind IN ('base','trait')),"
      " parent_id INTEGER REFERENCES model_types(id),"
      " is_action INTEGER NOT NULL DEFAULT 0,"
      " description TEXT);",

      "CREATE TABLE IF NOT EXISTS attribute_definitions ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " model_type_id INTEGER NOT NULL REFERENCES model_types(id) ON DELETE CASCADE,"
      " key TEXT NOT NULL,"
      " value_type TEXT NOT NULL CHECK (value_type IN ('string','number','datetime','boolean','vector')),"
      " required INTEGER NOT NULL DEFAULT 0,"
      " constraints TEXT,"
      " UNIQUE (model_type_id, key));",

      "CREATE TABLE IF NOT EXISTS entities ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " model_type_id INTEGER NOT NULL REFERENCES model_types(id),"
      " title TEXT NOT NULL,"
      " body TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS trait_assignments ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " entity_id INTEGER NOT NULL REFERENCES entities(id) ON DELETE CASCADE,"
      " trait_type_id INTEGER NOT NULL REFERENCES model_types(id) ON DELETE CASCADE,"
      " applied_at_ms INTEGER NOT NULL,"
      " UNIQUE (entity_id, trait_type_id));",

      "CREATE TABLE IF NOT EXISTS attributes ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " entity_id INTEGER NOT NULL REFERENCES entities(id) ON DELETE CASCADE,"
      " attribute_definition_id INTEGER NOT NULL REFERENCES attribute_definitions(id) ON DELETE CASCADE,"
      " value_text TEXT,"
      " value_number REAL,"
      " value_time_ms INTEGER,"
      " value_bool INTEGER,"
      " value_vector TEXT,"
      " value_key TEXT NOT NULL,"
      " CHECK ((value_text IS NOT NULL) + (value_number IS NOT NULL) + (value_time_ms IS NOT NULL)"
      " + (value_bool IS NOT NULL) + (value_vector IS NOT NULL) = 1),"
      " UNIQUE (entity_id, attribute_definition_id, value_key));",

      "CREATE TABLE IF NOT EXISTS embeddings ("
      " entity_id INTEGER PRIMARY KEY REFERENCES entities(id) ON DELETE CASCADE,"
      " embedding TEXT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS relationship_types ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " from_model_type_id INTEGER NOT NULL REFERENCES model_types(id) ON DELETE CASCADE,"
      " to_model_type_id INTEGER NOT NULL REFERENCES model_types(id) ON DELETE CASCADE,"
      " relation_name TEXT NOT NULL,"
      " multiplicity TEXT NOT NULL DEFAULT 'many',"
      " description TEXT,"
      " UNIQUE (from_model_type_id, to_model_type_id, relation_name));",

      "CREATE TABLE IF NOT EXISTS relation_attribute_definitions ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " relationship_type_id INTEGER NOT NULL REFERENCES relationship_types(id) ON DELETE CASCADE,"
      " key TEXT NOT NULL,"
      " value_type TEXT NOT NULL CHECK (value_type IN ('string','number','datetime','boolean','vector')),"
      " required INTEGER NOT NULL DEFAULT 0,"
      " UNIQUE (relationship_type_id, key));",

      "CREATE TABLE IF NOT EXISTS relations ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " from_id INTEGER NOT NULL REFERENCES entities(id) ON DELETE CASCADE,"
      " to_id INTEGER NOT NULL REFERENCES entities(id) ON DELETE CASCADE,"
      " relationship_type_id INTEGER NOT NULL REFERENCES relationship_types(id) ON DELETE CASCADE,"
      " created_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS relation_attributes ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " relation_id INTEGER NOT NULL REFERENCES relations(id) ON DELETE CASCADE,"
      " relation_attribute_definition_id INTEGER NOT NULL REFERENCES relation_attribute_definitions(id) ON DELETE CASCADE,"
      " value_text TEXT,"
      " value_number REAL,"
      " value_time_ms INTEGER,"
      " value_bool INTEGER,"
      " value_vector TEXT,"
      " value_key TEXT NOT NULL,"
      " CHECK ((value_text IS NOT NULL) + (value_number IS NOT NULL) + (value_time_ms IS NOT NULL)"
      " + (value_bool IS NOT NULL) + (value_vector IS NOT NULL) = 1),"
      " UNIQUE (relation_id, relation_attribute_definition_id, value_key));",

      "CREATE INDEX IF NOT EXISTS idx_attributes_entity ON attributes(entity_id);",
      "CREATE INDEX IF NOT EXISTS idx_relations_from ON relations(from_id);",
      "CREATE INDEX IF NOT EXISTS idx_relations_to ON relations(to_id);",
  };
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS model_types ("
      " id BIGSERIAL PRIMARY KEY,"
      " name TEXT NOT NULL UNIQUE,"
      " type_kind TEXT NOT NULL CHECK (type_kind IN ('base','trait')),"
      " parent_id BIGINT REFERENCES model_types(id),"
      " is_action BOOLEAN NOT NULL DEFAULT FALSE,"
      " description TEXT);",

      "CREATE TABLE IF NOT EXISTS attribute_definitions ("
      " id BIGSERIAL PRIMARY KEY,"
      " model_type_id BIGINT NOT NULL REFERENCES model_types(id) ON DELETE CASCADE,"
      " key TEXT NOT NULL,"
      " value_type TEXT NOT NULL CHECK (value_type IN ('string','number','datetime','boolean','vector')),"
      " required BOOLEAN NOT NULL DEFAULT FALSE,"
      " constraints TEXT,"
      " UNIQUE (model_type_id, key));",

      "CREATE TABLE IF NOT EXISTS entities ("
      " id BIGSERIAL PRIMARY KEY,"
      " model_type_id BIGINT NOT NULL REFERENCES model_types(id),"
      " title TEXT NOT NULL,"
      " body TEXT,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS trait_assignments ("
      " id BIGSERIAL PRIMARY KEY,"
      " entity_id BIGINT NOT NULL REFERENCES entities(id) ON DELETE CASCADE,"
      " trait_type_id BIGINT NOT NULL REFERENCES model_types(id) ON DELETE CASCADE,"
      " applied_at_ms BIGINT NOT NULL,"
      " UNIQUE (entity_id, trait_type_id));",

      "CREATE TABLE IF NOT EXISTS attributes ("
      " id BIGSERIAL PRIMARY KEY,"
      " entity_id BIGINT NOT NULL REFERENCES entities(id) ON DELETE CASCADE,"
      " attribute_definition_id BIGINT NOT NULL REFERENCES attribute_definitions(id) ON DELETE CASCADE,"
      " value_text TEXT,"
      " value_number DOUBLE PRECISION,"
      " value_time_ms BIGINT,"
      " value_bool BOOLEAN,"
      " value_vector TEXT,"
      " value_key TEXT NOT NULL,"
      " CHECK (num_nonnulls(value_text, value_number, value_time_ms, value_bool, value_vector) = 1),"
      " UNIQUE (entity_id, attribute_definition_id, value_key));",

      "CREATE TABLE IF NOT EXISTS embeddings ("
      " entity_id BIGINT PRIMARY KEY REFERENCES entities(id) ON DELETE CASCADE,"
      " embedding TEXT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS relationship_types ("
      " id BIGSERIAL PRIMARY KEY,"
      " from_model_type_id BIGINT NOT NULL REFERENCES model_types(id) ON DELETE CASCADE,"
      " to_model_type_id BIGINT NOT NULL REFERENCES model_types(id) ON DELETE CASCADE,"
      " relation_name TEXT NOT NULL,"
      " multiplicity TEXT NOT NULL DEFAULT 'many',"
      " description TEXT,"
      " UNIQUE (from_model_type_id, to_model_type_id, relation_name));",

      "CREATE TABLE IF NOT EXISTS relation_attribute_definitions ("
      " id BIGSERIAL PRIMARY KEY,"
      " relationship_type_id BIGINT NOT NULL REFERENCES relationship_types(id) ON DELETE CASCADE,"
      " key TEXT NOT NULL,"
      " value_type TEXT NOT NULL CHECK (value_type IN ('string','number','datetime','boolean','vector')),"
      " required BOOLEAN NOT NULL DEFAULT FALSE,"
      " UNIQUE (relationship_type_id, key));",

      "CREATE TABLE IF NOT EXISTS relations ("
      " id BIGSERIAL PRIMARY KEY,"
      " from_id BIGINT NOT NULL REFERENCES entities(id) ON DELETE CASCADE,"
      " to_id BIGINT NOT NULL REFERENCES entities(id) ON DELETE CASCADE,"
      " relationship_type_id BIGINT NOT NULL REFERENCES relationship_types(id) ON DELETE CASCADE,"
      " created_at_ms BIGINT NOT NULL);",

      "CREATE TABLE IF NOT EXISTS relation_attributes ("
      " id BIGSERIAL PRIMARY KEY,"
      " relation_id BIGINT NOT NULL REFERENCES relations(id) ON DELETE CASCADE,"
      " relation_attribute_definition_id BIGINT NOT NULL REFERENCES relation_attribute_definitions(id) ON DELETE CASCADE,"
      " value_text TEXT,"
      " value_number DOUBLE PRECISION,"
      " value_time_ms BIGINT,"
      " value_bool BOOLEAN,"
      " value_vector TEXT,"
      " value_key TEXT NOT NULL,"
      " CHECK (num_nonnulls(value_text, value_number, value_time_ms, value_bool, value_vector) = 1),"
      " UNIQUE (relation_id, relation_attribute_definition_id, value_key));",

      "CREATE INDEX IF NOT EXISTS idx_attributes_entity ON attributes(entity_id);",
      "CREATE INDEX IF NOT EXISTS idx_relations_from ON relations(from_id);",
      "CREATE INDEX IF NOT EXISTS idx_relations_to ON relations(to_id);",

      // ---------------------------------------------------------------
      // Server-side materialization: graphdoc_get_model_full(id) returns
      // the same nested document the in-process materializer builds.
      // ---------------------------------------------------------------

      R"sql(CREATE OR REPLACE FUNCTION graphdoc_ms_to_text(ms BIGINT) RETURNS TEXT
LANGUAGE SQL IMMUTABLE AS $$
  SELECT to_char(to_timestamp(ms / 1000.0) AT TIME ZONE 'UTC', 'YYYY-MM-DD"T"HH24:MI:SS.MS"Z"')
$$;)sql",

      R"sql(CREATE OR REPLACE FUNCTION graphdoc_typed_value(v_text TEXT, v_number DOUBLE PRECISION, v_time_ms BIGINT,
                                               v_bool BOOLEAN, v_vector TEXT) RETURNS JSONB
LANGUAGE SQL IMMUTABLE AS $$
  SELECT CASE
    WHEN v_text IS NOT NULL THEN to_jsonb(v_text)
    WHEN v_number IS NOT NULL THEN to_jsonb(v_number)
    WHEN v_time_ms IS NOT NULL THEN to_jsonb(graphdoc_ms_to_text(v_time_ms))
    WHEN v_bool IS NOT NULL THEN to_jsonb(v_bool)
    ELSE to_jsonb(v_vector)
  END
$$;)sql",

      R"sql(CREATE OR REPLACE FUNCTION graphdoc_model_json(p_entity_id BIGINT) RETURNS JSONB
LANGUAGE SQL STABLE AS $$
  SELECT jsonb_build_object(
    'id', e.id,
    'title', e.title,
    'body', e.body,
    'created_at', graphdoc_ms_to_text(e.created_at_ms),
    'updated_at', graphdoc_ms_to_text(e.updated_at_ms),
    'model_type', jsonb_build_object(
      'base_model', jsonb_build_object('id', mt.id, 'name', mt.name, 'description', mt.description),
      'traits', COALESCE((
        SELECT jsonb_agg(jsonb_build_object('id', tt.id, 'name', tt.name, 'description', tt.description) ORDER BY ta.id)
        FROM trait_assignments ta
        JOIN model_types tt ON tt.id = ta.trait_type_id
        WHERE ta.entity_id = e.id), '[]'::jsonb)))
  FROM entities e
  JOIN model_types mt ON mt.id = e.model_type_id
  WHERE e.id = p_entity_id
$$;)sql",

      // jsonb keeps the last value of a duplicated key, so ordering the
      // aggregate by row id makes the most recent value win.
      R"sql(CREATE OR REPLACE FUNCTION graphdoc_get_model_full(p_entity_id BIGINT) RETURNS JSONB
LANGUAGE SQL STABLE AS $$
  SELECT jsonb_build_object(
    'model', graphdoc_model_json(e.id),
    'attributes', COALESCE((
      SELECT jsonb_object_agg(d.key, graphdoc_typed_value(a.value_text, a.value_number, a.value_time_ms, a.value_bool, a.value_vector) ORDER BY a.id)
      FROM attributes a
      JOIN attribute_definitions d ON d.id = a.attribute_definition_id
      WHERE a.entity_id = e.id), '{}'::jsonb),
    'relations', COALESCE((
      SELECT jsonb_agg(jsonb_build_object(
        'relation_id', r.id,
        'relation_name', rt.relation_name,
        'direction', CASE WHEN r.from_id = e.id THEN 'outgoing' ELSE 'incoming' END,
        'other_model', graphdoc_model_json(CASE WHEN r.from_id = e.id THEN r.to_id ELSE r.from_id END),
        'relation_attributes', COALESCE((
          SELECT jsonb_object_agg(rd.key, graphdoc_typed_value(ra.value_text, ra.value_number, ra.value_time_ms, ra.value_bool, ra.value_vector) ORDER BY ra.id)
          FROM relation_attributes ra
          JOIN relation_attribute_definitions rd ON rd.id = ra.relation_attribute_definition_id
          WHERE ra.relation_id = r.id), '{}'::jsonb)) ORDER BY r.id)
      FROM relations r
      JOIN relationship_types rt ON rt.id = r.relationship_type_id
      WHERE r.from_id = e.id OR r.to_id = e.id), '[]'::jsonb))
  FROM entities e
  WHERE e.id = p_entity_id
$$;)sql",
  };
  return kStatements;
}

} // namespace graphdoc::db::sql
