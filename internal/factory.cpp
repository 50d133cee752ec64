#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/entity_store.hpp"
#include "internal/core/ingestion_pipeline.hpp"
#include "internal/core/ontology_catalog.hpp"
#include "internal/core/relationship_store.hpp"
#include "internal/core/similarity_search.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/embedding/gemini_embedding_provider.hpp"
#include "internal/embedding/hashing_embedding_provider.hpp"
#include "internal/llm/gemini_text_generator.hpp"
#include "internal/llm/graph_extractor.hpp"
#include "internal/observability/logging.hpp"
#if DATAGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DATAGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace datagraph::factory {

using namespace datagraph;

namespace {

#if DATAGRAPH_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteBootstrapSql()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,name,description,properties,embedding,created_at_ms,updated_at_ms FROM assets LIMIT 1;");
  sqlite_db->Exec("SELECT relationship_id,source_id,target_id,relationship_type FROM entity_relationships LIMIT 1;");
}
#endif

#if DATAGRAPH_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresBootstrapSql()) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,name,description,properties,embedding,created_at_ms,updated_at_ms FROM assets LIMIT 1;");
  tx.exec("SELECT relationship_id,source_id,target_id,relationship_type FROM entity_relationships LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DATAGRAPH_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), !sqlite.has_wal_mode() || sqlite.wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DATAGRAPH_DB_POSTGRES
    const auto& postgres = database.postgres();
    if (postgres.connection_uri().empty()) {
      throw std::runtime_error("database.postgres.connection_uri is required");
    }
    auto pool = postgres.max_connections() > 0 ? std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections())
                                               : std::make_shared<db::postgres::PgPool>(postgres.connection_uri());
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<embedding::EmbeddingProvider> BuildEmbedder(const runtime::config::EmbeddingConfig& config,
                                                            const std::shared_ptr<net::HttpClient>& http) {
  switch (config.provider()) {
    case runtime::config::EMBEDDING_PROVIDER_GEMINI:
      return std::make_shared<embedding::GeminiEmbeddingProvider>(config, http);
    case runtime::config::EMBEDDING_PROVIDER_UNSPECIFIED:
    case runtime::config::EMBEDDING_PROVIDER_HASHING:
      return std::make_shared<embedding::HashingEmbeddingProvider>(config.dimensions() > 0 ? config.dimensions()
                                                                                         : embedding::HashingEmbeddingProvider::kDefaultDimensions);
    default:
      throw std::runtime_error("unknown embedding provider");
  }
}

void BuildEngine(const runtime::config::RuntimeConfig& config, const std::shared_ptr<net::HttpClient>& http, service::ServiceContext& ctx) {
  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);

  auto ontology = std::make_shared<core::OntologyCatalog>(repository);
  if (!config.ontology().has_seed_defaults() || config.ontology().seed_defaults()) {
    ontology->SeedDefaults();
  }

  // ------------------------------------------------------------------
  // Providers
  // ------------------------------------------------------------------
  auto embedder = BuildEmbedder(config.embedding(), http);

  std::shared_ptr<llm::GraphExtractor> extractor;
  if (config.generation().enabled()) {
    extractor = std::make_shared<llm::GraphExtractor>(std::make_shared<llm::GeminiTextGenerator>(config.generation(), http));
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const bool enforce       = config.ontology().enforce();
  auto       validator     = enforce ? ontology : nullptr;
  auto       entities      = std::make_shared<core::EntityStore>(repository, embedder, validator);
  auto       relationships = std::make_shared<core::RelationshipStore>(repository, validator);

  ctx.repository        = repository;
  ctx.embedder          = embedder;
  ctx.ontology          = ontology;
  ctx.entities          = entities;
  ctx.relationships     = relationships;
  ctx.search            = std::make_shared<core::SimilaritySearch>(repository, embedder);
  ctx.ontology_enforced = enforce;
  if (extractor) {
    ctx.ingestion = std::make_shared<core::IngestionPipeline>(extractor, entities, relationships);
  }
}

} // namespace

Application Build(const runtime::config::RuntimeConfig& config) {
  return Build(config, std::make_shared<net::CurlHttpClient>());
}

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config, std::shared_ptr<net::HttpClient> http) {
  Application app;

  try {
    BuildEngine(config, http, app.context);
  } catch (const std::exception& ex) {
    app.context                  = service::ServiceContext{};
    app.context.not_ready_reason = ex.what();
    DATAGRAPH_LOG_ERROR("engine initialization failed", {observability::StringField("error", ex.what())});
  }

  if (app.Ready()) {
    DATAGRAPH_LOG_INFO("engine ready", {observability::StringField("backend", app.context.repository->BackendName()),
                                        observability::StringField("embedding", app.context.embedder->Name()),
                                        observability::BoolField("ingestion", app.context.ingestion != nullptr),
                                        observability::BoolField("ontology_enforced", app.context.ontology_enforced)});
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.entity_service       = std::make_shared<service::EntityService>(app.context);
  app.relationship_service = std::make_shared<service::RelationshipService>(app.context);
  app.search_service       = std::make_shared<service::SearchService>(app.context);
  app.ontology_service     = std::make_shared<service::OntologyService>(app.context);
  app.ingest_service       = std::make_shared<service::IngestService>(app.context);
  app.admin_service        = std::make_shared<service::AdminService>(app.context);

  return app;
}

} // namespace datagraph::factory
