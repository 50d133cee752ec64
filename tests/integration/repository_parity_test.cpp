#include <algorithm>
#include <cassert>
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
#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

#if DATAGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if DATAGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using datagraph::db::ErrorCode;
using datagraph::db::Repository;
using datagraph::db::memory::MemoryRepository;
using datagraph::db::model::EntityRecord;
using datagraph::db::model::EntityTypeRecord;
using datagraph::db::model::RelationshipFilter;
using datagraph::db::model::RelationshipOntologyRecord;
using datagraph::db::model::RelationshipRecord;
using namespace datagraph::graph::v1;
namespace util = datagraph::util;

// What a second concurrent writer observes.
enum class Concurrency {
  kConflictOnCommit,  // optimistic snapshot
  kSingleWriter,      // second Begin() fails
  kLastWriterWins,
};

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  Concurrency                                       concurrency = Concurrency::kConflictOnCommit;
};

EntityRecord MakeEntity(EntityKind kind, const std::string& name, std::vector<float> embedding = {1.0f, 0.0f, 0.0f}) {
  EntityRecord record;
  record.id            = util::NewId();
  record.kind          = kind;
  record.name          = name;
  record.embedding     = std::move(embedding);
  record.created_at_ms = util::NowMillis();
  record.updated_at_ms = record.created_at_ms;
  return record;
}

RelationshipRecord MakeEdge(const std::string& source, const std::string& target, const std::string& type, uint64_t created_at_ms) {
  RelationshipRecord record;
  record.id                = util::NewId();
  record.source_id         = source;
  record.target_id         = target;
  record.relationship_type = type;
  record.created_at_ms     = created_at_ms;
  record.updated_at_ms     = created_at_ms;
  return record;
}

std::vector<EntityRecord> WithPrefix(const std::vector<EntityRecord>& records, const std::string& prefix) {
  std::vector<EntityRecord> out;
  for (const auto& r : records) {
    if (r.name.rfind(prefix, 0) == 0) out.push_back(r);
  }
  return out;
}

void VerifyEntityLifecycle(Repository& repo, const std::string& tag) {
  auto tx = repo.Begin();

  auto asset            = MakeEntity(ENTITY_KIND_ASSET, tag + "-b-crm", {0.25f, -0.5f, 1.0f});
  asset.description     = "Customer relationship manager";
  asset.properties_json = R"({"hosting_location":"us-east-1"})";
  assert(repo.InsertEntity(*tx, asset));

  auto second = MakeEntity(ENTITY_KIND_ASSET, tag + "-a-warehouse");
  assert(repo.InsertEntity(*tx, second));

  auto read = repo.GetEntity(*tx, ENTITY_KIND_ASSET, asset.id);
  assert(read.has_value());
  assert(read->name == asset.name);
  assert(read->description == asset.description);
  assert(read->properties_json == asset.properties_json);
  assert(read->embedding == asset.embedding);
  assert(read->created_at_ms == asset.created_at_ms);

  auto bare = repo.GetEntity(*tx, ENTITY_KIND_ASSET, second.id);
  assert(bare.has_value());
  assert(!bare->description.has_value());
  assert(bare->properties_json.empty());

  // ids are scoped to their collection
  assert(!repo.GetEntity(*tx, ENTITY_KIND_VENDOR, asset.id).has_value());
  auto found = repo.FindEntity(*tx, asset.id);
  assert(found.has_value() && found->kind == ENTITY_KIND_ASSET);
  assert(!repo.FindEntity(*tx, util::NewId()).has_value());

  auto listed = WithPrefix(repo.ListEntities(*tx, ENTITY_KIND_ASSET, 1000), tag);
  assert(listed.size() == 2);
  assert(listed[0].id == second.id);
  assert(listed[1].id == asset.id);

  read->name          = tag + "-c-crm";
  read->description   = std::nullopt;
  read->updated_at_ms = read->created_at_ms + 5;
  assert(repo.UpdateEntity(*tx, *read));
  auto updated = repo.GetEntity(*tx, ENTITY_KIND_ASSET, asset.id);
  assert(updated->name == tag + "-c-crm");
  assert(!updated->description.has_value());
  assert(updated->updated_at_ms == read->updated_at_ms);

  auto ghost = MakeEntity(ENTITY_KIND_ASSET, tag + "-ghost");
  auto miss  = repo.UpdateEntity(*tx, ghost);
  assert(!miss && miss.code == ErrorCode::NotFound);

  const auto before = repo.CountEntities(*tx, ENTITY_KIND_ASSET);
  assert(repo.DeleteEntity(*tx, ENTITY_KIND_ASSET, second.id));
  assert(repo.CountEntities(*tx, ENTITY_KIND_ASSET) == before - 1);
  auto again = repo.DeleteEntity(*tx, ENTITY_KIND_ASSET, second.id);
  assert(!again && again.code == ErrorCode::NotFound);

  tx->Commit();

  // a failed statement poisons a postgres transaction, so it gets its own
  auto dup_tx    = repo.Begin();
  auto duplicate = repo.InsertEntity(*dup_tx, asset);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);
  dup_tx->Rollback();
}

void VerifyNearestEntities(Repository& repo, const std::string& tag) {
  auto tx = repo.Begin();

  // a kind nothing else in the suite writes to, with a dimension nothing else uses
  auto same    = MakeEntity(ENTITY_KIND_DATA_SUBJECT_TYPE, tag + "-same", {1.0f, 0.0f, 0.0f, 0.0f, 0.0f});
  auto close   = MakeEntity(ENTITY_KIND_DATA_SUBJECT_TYPE, tag + "-close", {1.0f, 0.2f, 0.0f, 0.0f, 0.0f});
  auto far     = MakeEntity(ENTITY_KIND_DATA_SUBJECT_TYPE, tag + "-far", {0.0f, 0.0f, 1.0f, 0.0f, 0.0f});
  auto othered = MakeEntity(ENTITY_KIND_DATA_SUBJECT_TYPE, tag + "-other-dim", {1.0f, 0.0f});
  for (auto* r : {&same, &close, &far, &othered}) assert(repo.InsertEntity(*tx, *r));

  auto hits = repo.NearestEntities(*tx, ENTITY_KIND_DATA_SUBJECT_TYPE, {2.0f, 0.0f, 0.0f, 0.0f, 0.0f}, 2);
  assert(hits.size() == 2);
  assert(hits[0].record.id == same.id);
  assert(hits[0].distance < 1e-6);
  assert(hits[1].record.id == close.id);
  assert(hits[1].distance > hits[0].distance);

  auto all = repo.NearestEntities(*tx, ENTITY_KIND_DATA_SUBJECT_TYPE, {2.0f, 0.0f, 0.0f, 0.0f, 0.0f}, 100);
  for (const auto& hit : all) assert(hit.record.id != othered.id);
  assert(repo.NearestEntities(*tx, ENTITY_KIND_DATA_SUBJECT_TYPE, {1.0f, 0.0f, 0.0f, 0.0f, 0.0f}, 0).empty());

  tx->Rollback();
}

void VerifyRelationships(Repository& repo, const std::string& tag) {
  auto tx = repo.Begin();

  auto activity = MakeEntity(ENTITY_KIND_PROCESSING_ACTIVITY, tag + "-payroll");
  auto asset    = MakeEntity(ENTITY_KIND_ASSET, tag + "-hr-db");
  auto element  = MakeEntity(ENTITY_KIND_DATA_ELEMENT, tag + "-salary");
  for (auto* r : {&activity, &asset, &element}) assert(repo.InsertEntity(*tx, *r));

  const uint64_t t0 = util::NowMillis();
  auto uses            = MakeEdge(activity.id, asset.id, "USES", t0);
  auto uses_again      = MakeEdge(activity.id, asset.id, "READS", t0 + 1);
  auto contains        = MakeEdge(asset.id, element.id, "CONTAINS", t0 + 2);
  contains.properties_json = R"({"encrypted":true})";
  for (auto* r : {&uses_again, &uses, &contains}) assert(repo.InsertRelationship(*tx, *r));

  auto read = repo.GetRelationship(*tx, contains.id);
  assert(read.has_value());
  assert(read->properties_json == contains.properties_json);
  assert(read->created_at_ms == t0 + 2);

  auto between = repo.ListRelationshipsBetween(*tx, activity.id, asset.id);
  assert(between.size() == 2);
  assert(between[0].id == uses.id);
  assert(between[1].id == uses_again.id);
  assert(repo.ListRelationshipsBetween(*tx, asset.id, activity.id).empty());

  RelationshipFilter touching_asset;
  touching_asset.entity_id = asset.id;
  assert(repo.FindRelationships(*tx, touching_asset).size() == 3);

  touching_asset.relationship_type = "CONTAINS";
  auto typed = repo.FindRelationships(*tx, touching_asset);
  assert(typed.size() == 1 && typed[0].id == contains.id);

  touching_asset.relationship_type.reset();
  touching_asset.limit = 1;
  auto limited = repo.FindRelationships(*tx, touching_asset);
  assert(limited.size() == 1 && limited[0].id == uses.id);

  uses.relationship_type = "RUNS_ON";
  uses.updated_at_ms     = t0 + 10;
  assert(repo.UpdateRelationship(*tx, uses));
  assert(repo.GetRelationship(*tx, uses.id)->relationship_type == "RUNS_ON");

  const auto total = repo.CountRelationships(*tx);
  assert(repo.DeleteRelationship(*tx, uses_again.id));
  auto gone = repo.DeleteRelationship(*tx, uses_again.id);
  assert(!gone && gone.code == ErrorCode::NotFound);

  assert(repo.DeleteRelationshipsForEntity(*tx, asset.id));
  assert(repo.CountRelationships(*tx) == total - 3);
  assert(!repo.GetRelationship(*tx, contains.id).has_value());

  tx->Commit();
}

std::vector<std::string> Ids(const std::vector<RelationshipRecord>& records) {
  std::vector<std::string> out;
  for (const auto& r : records) out.push_back(r.id);
  return out;
}

std::vector<std::string> Ids(const std::vector<EntityRecord>& records) {
  std::vector<std::string> out;
  for (const auto& r : records) out.push_back(r.id);
  return out;
}

// Rows that tie on every ordering column except insertion order still list in
// the same sequence on every call.
void VerifyStableOrdering(Repository& repo, const std::string& tag) {
  auto tx = repo.Begin();

  std::vector<EntityRecord> twins;
  for (int i = 0; i < 4; ++i) {
    twins.push_back(MakeEntity(ENTITY_KIND_VENDOR, tag + "-same-name"));
    assert(repo.InsertEntity(*tx, twins.back()));
  }
  auto source = MakeEntity(ENTITY_KIND_ASSET, tag + "-source");
  assert(repo.InsertEntity(*tx, source));

  const uint64_t           at = util::NowMillis();
  std::vector<std::string> inserted;
  for (int i = 0; i < 6; ++i) {
    auto edge = MakeEdge(source.id, twins[0].id, "SHARES_WITH", at);
    assert(repo.InsertRelationship(*tx, edge));
    inserted.push_back(edge.id);
  }

  auto between = Ids(repo.ListRelationshipsBetween(*tx, source.id, twins[0].id));
  assert(between == inserted);
  assert(Ids(repo.ListRelationshipsBetween(*tx, source.id, twins[0].id)) == between);

  RelationshipFilter from_source;
  from_source.entity_id = source.id;
  auto found            = Ids(repo.FindRelationships(*tx, from_source));
  assert(found == inserted);
  assert(Ids(repo.FindRelationships(*tx, from_source)) == found);

  std::vector<std::string> all;
  for (const auto& id : Ids(repo.ListRelationships(*tx, 100000))) {
    if (std::find(inserted.begin(), inserted.end(), id) != inserted.end()) all.push_back(id);
  }
  assert(all == inserted);

  auto names = Ids(WithPrefix(repo.ListEntities(*tx, ENTITY_KIND_VENDOR, 100000), tag));
  assert(names.size() == twins.size());
  assert(Ids(WithPrefix(repo.ListEntities(*tx, ENTITY_KIND_VENDOR, 100000), tag)) == names);

  auto older = MakeEdge(twins[1].id, twins[2].id, "A", at);
  auto newer = MakeEdge(twins[1].id, twins[2].id, "A", at);
  assert(repo.InsertRelationship(*tx, older));
  assert(repo.InsertRelationship(*tx, newer));
  // an update keeps the edge's place in the pair order
  older.relationship_type = "B";
  older.updated_at_ms     = at + 5;
  assert(repo.UpdateRelationship(*tx, older));
  assert(Ids(repo.ListRelationshipsBetween(*tx, twins[1].id, twins[2].id)) == (std::vector<std::string>{older.id, newer.id}));

  tx->Rollback();
}

void VerifyOntologyCatalog(Repository& repo, const std::string& tag) {
  auto tx = repo.Begin();

  EntityTypeRecord type{tag + "-type", tag + "Thing", "a test type", tag + "_things", ENTITY_KIND_VENDOR};
  assert(repo.UpsertEntityType(*tx, type));
  type.description = "renamed";
  assert(repo.UpsertEntityType(*tx, type));

  int matches = 0;
  for (const auto& t : repo.ListEntityTypes(*tx)) {
    if (t.type_id == type.type_id) {
      ++matches;
      assert(t.description == "renamed");
      assert(t.kind == ENTITY_KIND_VENDOR);
    }
  }
  assert(matches == 1);

  assert(repo.UpsertEntityTypeProperty(*tx, {type.type_id, "region", "STRING", true, "where"}));
  assert(repo.UpsertEntityTypeProperty(*tx, {type.type_id, "region", "STRING", false, "where"}));
  auto properties = repo.ListEntityTypeProperties(*tx, type.type_id);
  assert(properties.size() == 1);
  assert(!properties[0].is_required);

  RelationshipOntologyRecord rule{type.type_id, type.type_id, "KNOWS", "peers"};
  assert(repo.UpsertRelationshipOntology(*tx, rule));
  assert(repo.UpsertRelationshipOntology(*tx, rule));
  int rules = 0;
  for (const auto& r : repo.ListRelationshipOntology(*tx)) {
    if (r.source_type_id == type.type_id) ++rules;
  }
  assert(rules == 1);

  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& tag) {
  auto entity = MakeEntity(ENTITY_KIND_VENDOR, tag + "-rolled-back");
  {
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, entity));
    tx->Rollback();
  }
  {
    // destructor without commit
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, MakeEntity(ENTITY_KIND_VENDOR, tag + "-dropped")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetEntity(*tx, ENTITY_KIND_VENDOR, entity.id).has_value());
  assert(WithPrefix(repo.ListEntities(*tx, ENTITY_KIND_VENDOR, 1000), tag).empty());
  tx->Commit();
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& tag, Concurrency concurrency) {
  auto seed = MakeEntity(ENTITY_KIND_VENDOR, tag + "-contended");
  {
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, seed));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (concurrency == Concurrency::kSingleWriter) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto r1 = repo.GetEntity(*tx1, ENTITY_KIND_VENDOR, seed.id);
  auto r2 = repo.GetEntity(*tx2, ENTITY_KIND_VENDOR, seed.id);
  assert(r1.has_value() && r2.has_value());

  r1->name = tag + "-first";
  r2->name = tag + "-second";

  assert(repo.UpdateEntity(*tx1, *r1));
  tx1->Commit();

  assert(repo.UpdateEntity(*tx2, *r2));
  if (concurrency == Concurrency::kConflictOnCommit) {
    bool conflicted = false;
    try {
      tx2->Commit();
    } catch (const util::Conflict&) {
      conflicted = true;
    }
    assert(conflicted);
  } else {
    tx2->Commit();
  }

  auto verify_tx = repo.Begin();
  auto final     = repo.GetEntity(*verify_tx, ENTITY_KIND_VENDOR, seed.id);
  assert(final.has_value());
  assert(final->name == (concurrency == Concurrency::kConflictOnCommit ? tag + "-first" : tag + "-second"));
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& tag) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo   = backend.make_repository();
  auto entity = MakeEntity(ENTITY_KIND_DATA_ELEMENT, tag + "-durable", {0.125f, 0.5f, -2.0f});
  entity.properties_json = R"({"sensitivity_level":"Secret"})";
  auto peer = MakeEntity(ENTITY_KIND_ASSET, tag + "-durable-peer");
  auto edge = MakeEdge(peer.id, entity.id, "CONTAINS", util::NowMillis());
  {
    auto tx = repo->Begin();
    assert(repo->InsertEntity(*tx, entity));
    assert(repo->InsertEntity(*tx, peer));
    assert(repo->InsertRelationship(*tx, edge));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto e  = repo->GetEntity(*tx, ENTITY_KIND_DATA_ELEMENT, entity.id);
  assert(e.has_value());
  assert(e->embedding == entity.embedding);
  assert(e->properties_json == entity.properties_json);

  auto edges = repo->ListRelationshipsBetween(*tx, peer.id, entity.id);
  assert(edges.size() == 1);
  assert(edges[0].id == edge.id);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .concurrency      = Concurrency::kConflictOnCommit,
  };
}

#if DATAGRAPH_DB_SQLITE
// BLOB layout of a stored embedding: four little-endian bytes per dimension.
void VerifySqliteEmbeddingLayout() {
  const auto db_path =
      (std::filesystem::temp_directory_path() / ("datagraph_integration_blob_" + util::NewId().substr(0, 8) + ".db")).string();
  auto db = std::make_shared<datagraph::db::sqlite::SqliteDB>(db_path);
  for (const auto& sql : datagraph::db::sql::SqliteBootstrapSql()) {
    db->Exec(sql);
  }
  datagraph::db::sqlite::SqliteRepository repo(db);

  auto written = MakeEntity(ENTITY_KIND_ASSET, "blob-layout", {1.0f, -2.0f});
  {
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, written));
    tx->Commit();
  }

  sqlite3_stmt* st = nullptr;
  const auto    select =
      "SELECT embedding FROM " + datagraph::db::sql::TableFor(ENTITY_KIND_ASSET) + " WHERE id='" + written.id + "';";
  assert(sqlite3_prepare_v2(db->Handle(), select.c_str(), -1, &st, nullptr) == SQLITE_OK);
  assert(sqlite3_step(st) == SQLITE_ROW);
  const auto* blob = static_cast<const unsigned char*>(sqlite3_column_blob(st, 0));
  const std::vector<unsigned char> bytes(blob, blob + sqlite3_column_bytes(st, 0));
  sqlite3_finalize(st);
  // 1.0f = 0x3f800000, -2.0f = 0xc0000000
  assert((bytes == std::vector<unsigned char>{0x00, 0x00, 0x80, 0x3f, 0x00, 0x00, 0x00, 0xc0}));

  // rows written by other tools in the same layout read back unchanged
  const auto foreign_id = util::NewId();
  db->Exec("INSERT INTO " + datagraph::db::sql::TableFor(ENTITY_KIND_ASSET) +
           " (id,name,properties,embedding,created_at_ms,updated_at_ms) VALUES ('" + foreign_id +
           "','imported','',X'0000c03f00002041',1,1);");
  {
    auto tx   = repo.Begin();
    auto read = repo.GetEntity(*tx, ENTITY_KIND_ASSET, foreign_id);
    assert(read.has_value());
    assert((read->embedding == std::vector<float>{1.5f, 10.0f}));
    tx->Rollback();
  }

  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}

BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("datagraph_integration_sqlite_" + std::to_string(util::NowMillis()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<datagraph::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : datagraph::db::sql::SqliteBootstrapSql()) {
      db->Exec(sql);
    }
    return std::make_shared<datagraph::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .concurrency = Concurrency::kSingleWriter,
  };
}
#endif

#if DATAGRAPH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DATAGRAPH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DATAGRAPH_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<datagraph::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto& sql : datagraph::db::sql::PostgresBootstrapSql()) {
        tx.exec(sql);
      }
      tx.commit();
    }
    return std::make_shared<datagraph::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
      .concurrency      = Concurrency::kLastWriterWins,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // rows left by earlier runs against a shared database are filtered by tag
  const auto tag = backend.name + "-" + util::NewId().substr(0, 8);

  {
    auto repo = backend.make_repository();

    VerifyEntityLifecycle(*repo, tag + "-life");
    VerifyNearestEntities(*repo, tag + "-nearest");
    VerifyRelationships(*repo, tag + "-edges");
    VerifyStableOrdering(*repo, tag + "-order");
    VerifyOntologyCatalog(*repo, tag + "-ontology");
    VerifyRollbackBehavior(*repo, tag + "-rollback");
    VerifyConcurrentUpdates(*repo, tag + "-concurrency", backend.concurrency);
  }

  VerifyRestartDurability(backend, tag);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DATAGRAPH_DB_SQLITE
  VerifySqliteEmbeddingLayout();
  backends.push_back(MakeSqliteFactory());
#endif

#if DATAGRAPH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "datagraph_integration_repository_parity: pass\n";
  return 0;
}
