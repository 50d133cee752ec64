#include "pg_repository.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include "api/datagraph/graph/v1.hpp"
#include "internal/db/sql/schema.hpp"

namespace datagraph::db::postgres {

namespace {

// pgvector text form: [0.1,0.2,...]
std::string VectorLiteral(const std::vector<float>& v) {
  std::ostringstream out;
  out.precision(std::numeric_limits<float>::max_digits10);
  out << '[';
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out << ',';
    out << v[i];
  }
  out << ']';
  return out.str();
}

std::vector<float> ParseVector(const std::string& text) {
  std::vector<float> out;
  std::string        body = text;
  if (!body.empty() && body.front() == '[') body.erase(0, 1);
  if (!body.empty() && body.back() == ']') body.pop_back();

  std::istringstream in(body);
  std::string        token;
  while (std::getline(in, token, ',')) {
    if (!token.empty()) out.push_back(std::stof(token));
  }
  return out;
}

std::optional<std::string> JsonbParam(const std::string& json) {
  if (json.empty()) return std::nullopt;
  return json;
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

constexpr const char* kEntityColumns = "id,name,description,properties::text,embedding::text,created_at_ms,updated_at_ms";

model::EntityRecord ReadEntity(const pqxx::row& row, graph::v1::EntityKind kind) {
  model::EntityRecord r;
  r.id              = row[0].c_str();
  r.kind            = kind;
  r.name            = row[1].c_str();
  r.description     = OptText(row[2]);
  r.properties_json = TextOrEmpty(row[3]);
  r.embedding       = ParseVector(row[4].c_str());
  r.created_at_ms   = row[5].as<uint64_t>();
  r.updated_at_ms   = row[6].as<uint64_t>();
  return r;
}

constexpr const char* kRelationshipColumns =
    "relationship_id,source_id,target_id,relationship_type,properties::text,created_at_ms,updated_at_ms,sequence";

model::RelationshipRecord ReadRelationship(const pqxx::row& row) {
  model::RelationshipRecord r;
  r.id                = row[0].c_str();
  r.source_id         = row[1].c_str();
  r.target_id         = row[2].c_str();
  r.relationship_type = row[3].c_str();
  r.properties_json   = TextOrEmpty(row[4]);
  r.created_at_ms     = row[5].as<uint64_t>();
  r.updated_at_ms     = row[6].as<uint64_t>();
  r.sequence          = row[7].as<uint64_t>();
  return r;
}

std::vector<model::RelationshipRecord> ReadRelationships(const pqxx::result& res) {
  std::vector<model::RelationshipRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRelationship(row));
  }
  return out;
}

bool IsZero(const std::vector<float>& v) {
  for (float x : v) {
    if (x != 0.0f) return false;
  }
  return true;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result PgRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO " + sql::TableFor(r.kind) +
                                 "(id,name,description,properties,embedding,created_at_ms,updated_at_ms) VALUES($1,$2,$3,$4::jsonb,$5::vector,$6,$7);",
                             r.id, r.name, r.description, JsonbParam(r.properties_json), VectorLiteral(r.embedding), r.created_at_ms,
                             r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EntityRecord> PgRepository::GetEntity(Transaction& t, graph::v1::EntityKind kind, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEntityColumns + " FROM " + sql::TableFor(kind) + " WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadEntity(res[0], kind);
}

std::optional<model::EntityRecord> PgRepository::FindEntity(Transaction& t, const std::string& id) {
  for (auto kind : graph::v1::kAllEntityKinds) {
    if (auto record = GetEntity(t, kind, id)) return record;
  }
  return std::nullopt;
}

Result PgRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE " + sql::TableFor(r.kind) +
                                            " SET name=$2,description=$3,properties=$4::jsonb,embedding=$5::vector,updated_at_ms=$6 WHERE id=$1;",
                                        r.id, r.name, r.description, JsonbParam(r.properties_json), VectorLiteral(r.embedding),
                                        r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "entity not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteEntity(Transaction& t, graph::v1::EntityKind kind, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM " + sql::TableFor(kind) + " WHERE id=$1;", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "entity not found: " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EntityRecord> PgRepository::ListEntities(Transaction& t, graph::v1::EntityKind kind, std::size_t limit) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kEntityColumns + " FROM " + sql::TableFor(kind) + " ORDER BY name COLLATE \"C\", id LIMIT $1;",
      static_cast<int64_t>(limit));

  std::vector<model::EntityRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEntity(row, kind));
  }
  return out;
}

uint64_t PgRepository::CountEntities(Transaction& t, graph::v1::EntityKind kind) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM " + sql::TableFor(kind) + ";");
  return res[0][0].as<uint64_t>();
}

std::vector<model::ScoredEntityRecord> PgRepository::NearestEntities(Transaction& t, graph::v1::EntityKind kind, const std::vector<float>& query,
                                                                     std::size_t limit) {
  std::vector<model::ScoredEntityRecord> scored;
  if (limit == 0 || query.empty() || IsZero(query)) return scored;

  // <=> is pgvector cosine distance; zero-norm rows would yield NaN
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEntityColumns + ", embedding <=> $1::vector AS distance FROM " +
                                          sql::TableFor(kind) +
                                          " WHERE vector_dims(embedding)=$2 AND vector_norm(embedding) > 0"
                                          " ORDER BY distance, name COLLATE \"C\", id LIMIT $3;",
                                      VectorLiteral(query), static_cast<int>(query.size()), static_cast<int64_t>(limit));

  scored.reserve(res.size());
  for (const auto& row : res) {
    double distance = row[7].as<double>();
    if (std::isnan(distance)) continue;
    scored.push_back({ReadEntity(row, kind), std::clamp(distance, 0.0, 2.0)});
  }
  return scored;
}

// ------------------------------------------------------------------
// Relationships
// ------------------------------------------------------------------

Result PgRepository::InsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_relationship", r.id, r.source_id, r.target_id, r.relationship_type, JsonbParam(r.properties_json),
                               r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RelationshipRecord> PgRepository::GetRelationship(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_relationship", id);
  if (res.empty()) return std::nullopt;
  return ReadRelationship(res[0]);
}

std::vector<model::RelationshipRecord> PgRepository::FindRelationships(Transaction& t, const model::RelationshipFilter& filter) {
  // NULL parameters disable the corresponding filter
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRelationshipColumns +
                                          " FROM entity_relationships"
                                          " WHERE ($1::text IS NULL OR source_id=$1 OR target_id=$1)"
                                          " AND ($2::text IS NULL OR relationship_type=$2)"
                                          " ORDER BY created_at_ms, sequence LIMIT $3;",
                                      filter.entity_id, filter.relationship_type, static_cast<int64_t>(filter.limit));
  return ReadRelationships(res);
}

std::vector<model::RelationshipRecord> PgRepository::ListRelationshipsBetween(Transaction& t, const std::string& source_id,
                                                                              const std::string& target_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRelationshipColumns +
                                          " FROM entity_relationships WHERE source_id=$1 AND target_id=$2 ORDER BY created_at_ms, sequence;",
                                      source_id, target_id);
  return ReadRelationships(res);
}

std::vector<model::RelationshipRecord> PgRepository::ListRelationships(Transaction& t, std::size_t limit) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kRelationshipColumns + " FROM entity_relationships ORDER BY created_at_ms, sequence LIMIT $1;",
      static_cast<int64_t>(limit));
  return ReadRelationships(res);
}

Result PgRepository::UpdateRelationship(Transaction& t, const model::RelationshipRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_relationship", r.id, r.relationship_type, JsonbParam(r.properties_json), r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "relationship not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRelationship(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_relationship", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "relationship not found: " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRelationshipsForEntity(Transaction& t, const std::string& entity_id) {
  try {
    TX(t).Work().exec_prepared("delete_relationships_for_entity", entity_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountRelationships(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM entity_relationships;");
  return res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Ontology catalog
// ------------------------------------------------------------------

Result PgRepository::UpsertEntityType(Transaction& t, const model::EntityTypeRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO entity_types(type_id,name,description,table_name,kind) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(type_id) DO UPDATE SET name=EXCLUDED.name,description=EXCLUDED.description,"
        "table_name=EXCLUDED.table_name,kind=EXCLUDED.kind;",
        r.type_id, r.name, r.description, r.table_name, static_cast<int>(r.kind));
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    // the only other unique key is the type name
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertEntityTypeProperty(Transaction& t, const model::EntityTypePropertyRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO entity_type_properties(type_id,property_name,data_type,is_required,description) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(type_id,property_name) DO UPDATE SET data_type=EXCLUDED.data_type,"
        "is_required=EXCLUDED.is_required,description=EXCLUDED.description;",
        r.type_id, r.property_name, r.data_type, r.is_required, r.description);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertRelationshipOntology(Transaction& t, const model::RelationshipOntologyRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO relationship_ontology(source_type_id,target_type_id,relationship_type,description) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(source_type_id,target_type_id,relationship_type) DO UPDATE SET description=EXCLUDED.description;",
        r.source_type_id, r.target_type_id, r.relationship_type, r.description);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EntityTypeRecord> PgRepository::ListEntityTypes(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT type_id,name,description,table_name,kind FROM entity_types ORDER BY name COLLATE \"C\";");

  std::vector<model::EntityTypeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::EntityTypeRecord r;
    r.type_id     = row[0].c_str();
    r.name        = row[1].c_str();
    r.description = row[2].c_str();
    r.table_name  = row[3].c_str();
    r.kind        = static_cast<graph::v1::EntityKind>(row[4].as<int>());
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::EntityTypePropertyRecord> PgRepository::ListEntityTypeProperties(Transaction& t, const std::string& type_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT type_id,property_name,data_type,is_required,description FROM entity_type_properties "
      "WHERE type_id=$1 ORDER BY property_name COLLATE \"C\";",
      type_id);

  std::vector<model::EntityTypePropertyRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::EntityTypePropertyRecord r;
    r.type_id       = row[0].c_str();
    r.property_name = row[1].c_str();
    r.data_type     = row[2].c_str();
    r.is_required   = row[3].as<bool>();
    r.description   = row[4].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::RelationshipOntologyRecord> PgRepository::ListRelationshipOntology(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT source_type_id,target_type_id,relationship_type,description FROM relationship_ontology "
      "ORDER BY source_type_id COLLATE \"C\", target_type_id COLLATE \"C\", relationship_type COLLATE \"C\";");

  std::vector<model::RelationshipOntologyRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RelationshipOntologyRecord r;
    r.source_type_id    = row[0].c_str();
    r.target_type_id    = row[1].c_str();
    r.relationship_type = row[2].c_str();
    r.description       = row[3].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace datagraph::db::postgres
