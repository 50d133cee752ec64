#include "sqlite_repository.hpp"

#include <cstring>
#include <stdexcept>

#include "api/datagraph/graph/v1.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/util/vector_math.hpp"

namespace datagraph::db::sqlite {

using datagraph::db::ErrorCode;
using datagraph::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Read paths have no Result channel, so prepare/step failures surface as exceptions.
Stmt PrepareOrThrow(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// Embeddings are stored as packed little-endian IEEE-754 float32, four bytes
// per dimension, whatever the host byte order.
void BindEmbedding(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
  std::vector<unsigned char> bytes(v.size() * 4);
  for (std::size_t i = 0; i < v.size(); ++i) {
    uint32_t bits = 0;
    std::memcpy(&bits, &v[i], sizeof(bits));
    for (int b = 0; b < 4; ++b)
      bytes[i * 4 + b] = static_cast<unsigned char>(bits >> (8 * b));
  }
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::vector<float> ColEmbedding(sqlite3_stmt* st, int col) {
  const auto* blob  = static_cast<const unsigned char*>(sqlite3_column_blob(st, col));
  const int   bytes = sqlite3_column_bytes(st, col);
  std::vector<float> out(blob ? static_cast<std::size_t>(bytes) / 4 : 0);
  for (std::size_t i = 0; i < out.size(); ++i) {
    uint32_t bits = 0;
    for (int b = 0; b < 4; ++b)
      bits |= static_cast<uint32_t>(blob[i * 4 + b]) << (8 * b);
    std::memcpy(&out[i], &bits, sizeof(bits));
  }
  return out;
}

constexpr const char* kEntityColumns = "id,name,description,properties,embedding,created_at_ms,updated_at_ms";

model::EntityRecord ReadEntity(sqlite3_stmt* st, graph::v1::EntityKind kind) {
  model::EntityRecord r;
  r.id              = ColText(st, 0);
  r.kind            = kind;
  r.name            = ColText(st, 1);
  r.description     = ColOptText(st, 2);
  r.properties_json = ColText(st, 3);
  r.embedding       = ColEmbedding(st, 4);
  r.created_at_ms   = ColU64(st, 5);
  r.updated_at_ms   = ColU64(st, 6);
  return r;
}

constexpr const char* kRelationshipColumns = "relationship_id,source_id,target_id,relationship_type,properties,created_at_ms,updated_at_ms,sequence";

model::RelationshipRecord ReadRelationship(sqlite3_stmt* st) {
  model::RelationshipRecord r;
  r.id                = ColText(st, 0);
  r.source_id         = ColText(st, 1);
  r.target_id         = ColText(st, 2);
  r.relationship_type = ColText(st, 3);
  r.properties_json   = ColText(st, 4);
  r.created_at_ms     = ColU64(st, 5);
  r.updated_at_ms     = ColU64(st, 6);
  r.sequence          = ColU64(st, 7);
  return r;
}

std::vector<model::RelationshipRecord> ReadRelationships(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::RelationshipRecord> out;
  while (StepRow(db, st)) {
    out.push_back(ReadRelationship(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = "INSERT INTO " + sql::TableFor(r.kind) + "(" + kEntityColumns + ") VALUES(?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.id);
  BindText(st, 2, r.name);
  BindOptText(st, 3, r.description);
  BindText(st, 4, r.properties_json);
  BindEmbedding(st, 5, r.embedding);
  BindU64(st, 6, r.created_at_ms);
  BindU64(st, 7, r.updated_at_ms);

  return Translate(db, sqlite3_step(st));
}

std::optional<model::EntityRecord> SqliteRepository::GetEntity(Transaction& t, graph::v1::EntityKind kind, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kEntityColumns + " FROM " + sql::TableFor(kind) + " WHERE id=?;");

  BindText(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadEntity(st.get(), kind);
}

std::optional<model::EntityRecord> SqliteRepository::FindEntity(Transaction& t, const std::string& id) {
  for (auto kind : graph::v1::kAllEntityKinds) {
    if (auto record = GetEntity(t, kind, id)) return record;
  }
  return std::nullopt;
}

Result SqliteRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql =
      "UPDATE " + sql::TableFor(r.kind) + " SET name=?,description=?,properties=?,embedding=?,updated_at_ms=? WHERE id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.name);
  BindOptText(st, 2, r.description);
  BindText(st, 3, r.properties_json);
  BindEmbedding(st, 4, r.embedding);
  BindU64(st, 5, r.updated_at_ms);
  BindText(st, 6, r.id);

  auto res = Translate(db, sqlite3_step(st));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "entity not found: " + r.id);
  return Result::Ok();
}

Result SqliteRepository::DeleteEntity(Transaction& t, graph::v1::EntityKind kind, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = "DELETE FROM " + sql::TableFor(kind) + " WHERE id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, id);
  auto res = Translate(db, sqlite3_step(st));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "entity not found: " + id);
  return Result::Ok();
}

std::vector<model::EntityRecord> SqliteRepository::ListEntities(Transaction& t, graph::v1::EntityKind kind, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kEntityColumns + " FROM " + sql::TableFor(kind) + " ORDER BY name, id LIMIT ?;");

  BindU64(st.get(), 1, limit);

  std::vector<model::EntityRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadEntity(st.get(), kind));
  }
  return out;
}

uint64_t SqliteRepository::CountEntities(Transaction& t, graph::v1::EntityKind kind) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT COUNT(*) FROM " + sql::TableFor(kind) + ";");
  return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

std::vector<model::ScoredEntityRecord> SqliteRepository::NearestEntities(Transaction& t, graph::v1::EntityKind kind,
                                                                         const std::vector<float>& query, std::size_t limit) {
  std::vector<model::ScoredEntityRecord> scored;
  if (limit == 0) return scored;

  // sqlite has no vector index, so rank the whole collection in process
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kEntityColumns + " FROM " + sql::TableFor(kind) + " WHERE length(embedding)=?;");
  BindU64(st.get(), 1, query.size() * sizeof(float));

  while (StepRow(db, st.get())) {
    auto record   = ReadEntity(st.get(), kind);
    auto distance = util::CosineDistance(query, record.embedding);
    if (!distance) continue;
    scored.push_back({std::move(record), *distance});
  }
  util::KeepNearest(scored, limit);
  return scored;
}

// ------------------------------------------------------------------
// Relationships
// ------------------------------------------------------------------

Result SqliteRepository::InsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  auto* db = TX(t).Handle();

  // writers are serialized by BEGIN IMMEDIATE, so MAX()+1 is unique
  const std::string sql = std::string("INSERT INTO entity_relationships(") + kRelationshipColumns +
                          ") VALUES(?,?,?,?,?,?,?,(SELECT COALESCE(MAX(sequence),0)+1 FROM entity_relationships));";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.id);
  BindText(st, 2, r.source_id);
  BindText(st, 3, r.target_id);
  BindText(st, 4, r.relationship_type);
  BindText(st, 5, r.properties_json);
  BindU64(st, 6, r.created_at_ms);
  BindU64(st, 7, r.updated_at_ms);

  return Translate(db, sqlite3_step(st));
}

std::optional<model::RelationshipRecord> SqliteRepository::GetRelationship(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kRelationshipColumns + " FROM entity_relationships WHERE relationship_id=?;");

  BindText(st.get(), 1, id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadRelationship(st.get());
}

std::vector<model::RelationshipRecord> SqliteRepository::FindRelationships(Transaction& t, const model::RelationshipFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kRelationshipColumns + " FROM entity_relationships WHERE 1=1";
  if (filter.entity_id) sql += " AND (source_id=?1 OR target_id=?1)";
  if (filter.relationship_type) sql += " AND relationship_type=?2";
  sql += " ORDER BY created_at_ms, sequence LIMIT ?3;";

  auto st = PrepareOrThrow(db, sql);
  if (filter.entity_id) BindText(st.get(), 1, *filter.entity_id);
  if (filter.relationship_type) BindText(st.get(), 2, *filter.relationship_type);
  BindU64(st.get(), 3, filter.limit);

  return ReadRelationships(db, st.get());
}

std::vector<model::RelationshipRecord> SqliteRepository::ListRelationshipsBetween(Transaction& t, const std::string& source_id,
                                                                                  const std::string& target_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kRelationshipColumns +
                                    " FROM entity_relationships WHERE source_id=? AND target_id=? ORDER BY created_at_ms, sequence;");

  BindText(st.get(), 1, source_id);
  BindText(st.get(), 2, target_id);
  return ReadRelationships(db, st.get());
}

std::vector<model::RelationshipRecord> SqliteRepository::ListRelationships(Transaction& t, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, std::string("SELECT ") + kRelationshipColumns +
                                    " FROM entity_relationships ORDER BY created_at_ms, sequence LIMIT ?;");

  BindU64(st.get(), 1, limit);
  return ReadRelationships(db, st.get());
}

Result SqliteRepository::UpdateRelationship(Transaction& t, const model::RelationshipRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql = "UPDATE entity_relationships SET relationship_type=?,properties=?,updated_at_ms=? WHERE relationship_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.relationship_type);
  BindText(st, 2, r.properties_json);
  BindU64(st, 3, r.updated_at_ms);
  BindText(st, 4, r.id);

  auto res = Translate(db, sqlite3_step(st));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "relationship not found: " + r.id);
  return Result::Ok();
}

Result SqliteRepository::DeleteRelationship(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const char*   sql = "DELETE FROM entity_relationships WHERE relationship_id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, id);
  auto res = Translate(db, sqlite3_step(st));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "relationship not found: " + id);
  return Result::Ok();
}

Result SqliteRepository::DeleteRelationshipsForEntity(Transaction& t, const std::string& entity_id) {
  auto* db = TX(t).Handle();

  const char*   sql = "DELETE FROM entity_relationships WHERE source_id=?1 OR target_id=?1;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, entity_id);
  return Translate(db, sqlite3_step(st));
}

uint64_t SqliteRepository::CountRelationships(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT COUNT(*) FROM entity_relationships;");
  return StepRow(db, st.get()) ? ColU64(st.get(), 0) : 0;
}

// ------------------------------------------------------------------
// Ontology catalog
// ------------------------------------------------------------------

Result SqliteRepository::UpsertEntityType(Transaction& t, const model::EntityTypeRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO entity_types(type_id,name,description,table_name,kind) VALUES(?,?,?,?,?) "
      "ON CONFLICT(type_id) DO UPDATE SET name=excluded.name, description=excluded.description, "
      "table_name=excluded.table_name, kind=excluded.kind;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.type_id);
  BindText(st, 2, r.name);
  BindText(st, 3, r.description);
  BindText(st, 4, r.table_name);
  sqlite3_bind_int(st, 5, static_cast<int>(r.kind));

  return Translate(db, sqlite3_step(st));
}

Result SqliteRepository::UpsertEntityTypeProperty(Transaction& t, const model::EntityTypePropertyRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO entity_type_properties(type_id,property_name,data_type,is_required,description) VALUES(?,?,?,?,?) "
      "ON CONFLICT(type_id,property_name) DO UPDATE SET data_type=excluded.data_type, "
      "is_required=excluded.is_required, description=excluded.description;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.type_id);
  BindText(st, 2, r.property_name);
  BindText(st, 3, r.data_type);
  sqlite3_bind_int(st, 4, r.is_required ? 1 : 0);
  BindText(st, 5, r.description);

  return Translate(db, sqlite3_step(st));
}

Result SqliteRepository::UpsertRelationshipOntology(Transaction& t, const model::RelationshipOntologyRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO relationship_ontology(source_type_id,target_type_id,relationship_type,description) VALUES(?,?,?,?) "
      "ON CONFLICT(source_type_id,target_type_id,relationship_type) DO UPDATE SET description=excluded.description;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.source_type_id);
  BindText(st, 2, r.target_type_id);
  BindText(st, 3, r.relationship_type);
  BindText(st, 4, r.description);

  return Translate(db, sqlite3_step(st));
}

std::vector<model::EntityTypeRecord> SqliteRepository::ListEntityTypes(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, "SELECT type_id,name,description,table_name,kind FROM entity_types ORDER BY name;");

  std::vector<model::EntityTypeRecord> out;
  while (StepRow(db, st.get())) {
    model::EntityTypeRecord r;
    r.type_id     = ColText(st.get(), 0);
    r.name        = ColText(st.get(), 1);
    r.description = ColText(st.get(), 2);
    r.table_name  = ColText(st.get(), 3);
    r.kind        = static_cast<graph::v1::EntityKind>(sqlite3_column_int(st.get(), 4));
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::EntityTypePropertyRecord> SqliteRepository::ListEntityTypeProperties(Transaction& t, const std::string& type_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT type_id,property_name,data_type,is_required,description FROM entity_type_properties "
                            "WHERE type_id=? ORDER BY property_name;");
  BindText(st.get(), 1, type_id);

  std::vector<model::EntityTypePropertyRecord> out;
  while (StepRow(db, st.get())) {
    model::EntityTypePropertyRecord r;
    r.type_id       = ColText(st.get(), 0);
    r.property_name = ColText(st.get(), 1);
    r.data_type     = ColText(st.get(), 2);
    r.is_required   = sqlite3_column_int(st.get(), 3) != 0;
    r.description   = ColText(st.get(), 4);
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::RelationshipOntologyRecord> SqliteRepository::ListRelationshipOntology(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db,
                            "SELECT source_type_id,target_type_id,relationship_type,description FROM relationship_ontology "
                            "ORDER BY source_type_id, target_type_id, relationship_type;");

  std::vector<model::RelationshipOntologyRecord> out;
  while (StepRow(db, st.get())) {
    model::RelationshipOntologyRecord r;
    r.source_type_id    = ColText(st.get(), 0);
    r.target_type_id    = ColText(st.get(), 1);
    r.relationship_type = ColText(st.get(), 2);
    r.description       = ColText(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace datagraph::db::sqlite
