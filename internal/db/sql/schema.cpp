#include "schema.hpp"

#include <stdexcept>

namespace datagraph::db::sql {

namespace {

const std::string kAssets               = "assets";
const std::string kProcessingActivities = "processing_activities";
const std::string kDataElements         = "data_elements";
const std::string kDataSubjectTypes     = "data_subject_types";
const std::string kVendors              = "vendors";

std::vector<std::string> EntityTables() {
  return {kAssets, kProcessingActivities, kDataElements, kDataSubjectTypes, kVendors};
}

} // namespace

const std::string& TableFor(graph::v1::EntityKind kind) {
  switch (kind) {
    case graph::v1::ENTITY_KIND_ASSET:
      return kAssets;
    case graph::v1::ENTITY_KIND_PROCESSING_ACTIVITY:
      return kProcessingActivities;
    case graph::v1::ENTITY_KIND_DATA_ELEMENT:
      return kDataElements;
    case graph::v1::ENTITY_KIND_DATA_SUBJECT_TYPE:
      return kDataSubjectTypes;
    case graph::v1::ENTITY_KIND_VENDOR:
      return kVendors;
    default:
      throw std::invalid_argument("no table for entity kind " + std::to_string(static_cast<int>(kind)));
  }
}

const std::vector<std::string>& SqliteBootstrapSql() {
  static const std::vector<std::string> kSql = [] {
    std::vector<std::string> sql;
    for (const auto& table : EntityTables()) {
      sql.push_back("CREATE TABLE IF NOT EXISTS " + table +
                    " (id TEXT PRIMARY KEY, name TEXT NOT NULL, description TEXT, properties TEXT NOT NULL DEFAULT '', embedding BLOB NOT NULL, "
                    "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);");
      sql.push_back("CREATE INDEX IF NOT EXISTS idx_" + table + "_name ON " + table + " (name, id);");
    }
    sql.push_back(
        "CREATE TABLE IF NOT EXISTS entity_relationships (relationship_id TEXT PRIMARY KEY, source_id TEXT NOT NULL, target_id TEXT NOT NULL, "
        "relationship_type TEXT NOT NULL, properties TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
        "sequence INTEGER NOT NULL);");
    sql.push_back("CREATE INDEX IF NOT EXISTS idx_entity_relationships_source ON entity_relationships (source_id, target_id);");
    sql.push_back("CREATE INDEX IF NOT EXISTS idx_entity_relationships_target ON entity_relationships (target_id);");
    sql.push_back("CREATE UNIQUE INDEX IF NOT EXISTS idx_entity_relationships_sequence ON entity_relationships (sequence);");
    sql.push_back("CREATE TABLE IF NOT EXISTS entity_types (type_id TEXT PRIMARY KEY, name TEXT NOT NULL UNIQUE, description TEXT NOT NULL DEFAULT '', "
                  "table_name TEXT NOT NULL, kind INTEGER NOT NULL);");
    sql.push_back(
        "CREATE TABLE IF NOT EXISTS entity_type_properties (type_id TEXT NOT NULL REFERENCES entity_types(type_id) ON DELETE CASCADE, "
        "property_name TEXT NOT NULL, data_type TEXT NOT NULL, is_required INTEGER NOT NULL DEFAULT 0, description TEXT NOT NULL DEFAULT '', "
        "PRIMARY KEY (type_id, property_name));");
    sql.push_back(
        "CREATE TABLE IF NOT EXISTS relationship_ontology (source_type_id TEXT NOT NULL REFERENCES entity_types(type_id) ON DELETE CASCADE, "
        "target_type_id TEXT NOT NULL REFERENCES entity_types(type_id) ON DELETE CASCADE, relationship_type TEXT NOT NULL, "
        "description TEXT NOT NULL DEFAULT '', PRIMARY KEY (source_type_id, target_type_id, relationship_type));");
    return sql;
  }();
  return kSql;
}

const std::vector<std::string>& PostgresBootstrapSql() {
  static const std::vector<std::string> kSql = [] {
    std::vector<std::string> sql;
    sql.push_back("CREATE EXTENSION IF NOT EXISTS vector;");
    for (const auto& table : EntityTables()) {
      sql.push_back("CREATE TABLE IF NOT EXISTS " + table +
                    " (id TEXT PRIMARY KEY, name TEXT NOT NULL, description TEXT, properties JSONB, embedding vector NOT NULL, "
                    "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");
      sql.push_back("CREATE INDEX IF NOT EXISTS idx_" + table + "_name ON " + table + " (name COLLATE \"C\", id);");
    }
    sql.push_back(
        "CREATE TABLE IF NOT EXISTS entity_relationships (relationship_id TEXT PRIMARY KEY, source_id TEXT NOT NULL, target_id TEXT NOT NULL, "
        "relationship_type TEXT NOT NULL, properties JSONB, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, sequence BIGSERIAL);");
    sql.push_back("ALTER TABLE entity_relationships ADD COLUMN IF NOT EXISTS sequence BIGSERIAL;");
    sql.push_back("CREATE INDEX IF NOT EXISTS idx_entity_relationships_source ON entity_relationships (source_id, target_id);");
    sql.push_back("CREATE INDEX IF NOT EXISTS idx_entity_relationships_target ON entity_relationships (target_id);");
    sql.push_back("CREATE TABLE IF NOT EXISTS entity_types (type_id TEXT PRIMARY KEY, name TEXT NOT NULL UNIQUE, description TEXT NOT NULL DEFAULT '', "
                  "table_name TEXT NOT NULL, kind SMALLINT NOT NULL);");
    sql.push_back(
        "CREATE TABLE IF NOT EXISTS entity_type_properties (type_id TEXT NOT NULL REFERENCES entity_types(type_id) ON DELETE CASCADE, "
        "property_name TEXT NOT NULL, data_type TEXT NOT NULL, is_required BOOLEAN NOT NULL DEFAULT FALSE, description TEXT NOT NULL DEFAULT '', "
        "PRIMARY KEY (type_id, property_name));");
    sql.push_back(
        "CREATE TABLE IF NOT EXISTS relationship_ontology (source_type_id TEXT NOT NULL REFERENCES entity_types(type_id) ON DELETE CASCADE, "
        "target_type_id TEXT NOT NULL REFERENCES entity_types(type_id) ON DELETE CASCADE, relationship_type TEXT NOT NULL, "
        "description TEXT NOT NULL DEFAULT '', PRIMARY KEY (source_type_id, target_type_id, relationship_type));");
    return sql;
  }();
  return kSql;
}

} // namespace datagraph::db::sql
