#include "entity_store.hpp"

#include "db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/properties.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "ontology_catalog.hpp"

namespace datagraph::core {

using namespace datagraph::graph::v1;

graph::v1::Entity ToEntity(const db::model::EntityRecord& record) {
  Entity entity;
  entity.set_id(record.id);
  entity.set_kind(record.kind);
  entity.set_name(record.name);
  if (record.description) {
    entity.set_description(*record.description);
  }
  if (!record.properties_json.empty()) {
    *entity.mutable_properties() = util::PropertiesFromJson(record.properties_json);
  }
  *entity.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *entity.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return entity;
}

void RequireKind(EntityKind kind) {
  if (EntityTypeName(kind).empty()) {
    throw util::InvalidArgument("entity kind must be specified");
  }
}

EntityStore::EntityStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<embedding::EmbeddingProvider> embedder,
                         std::shared_ptr<OntologyCatalog> ontology)
    : repository_(std::move(repository)), embedder_(std::move(embedder)), ontology_(std::move(ontology)) {
}

std::vector<float> EntityStore::EmbedOrThrow(const std::string& name, const std::optional<std::string>& description) {
  auto embedding = embedder_->Embed(embedding::EmbeddingText(name, description));
  if (embedding.empty()) {
    throw util::UpstreamError("embedding provider " + embedder_->Name() + " returned an empty vector");
  }
  return embedding;
}

std::string EntityStore::Create(EntityKind kind, const std::string& name, const std::optional<std::string>& description,
                                const std::optional<google::protobuf::Struct>& properties) {
  RequireKind(kind);
  if (name.empty()) {
    throw util::InvalidArgument("entity name must not be empty");
  }
  if (ontology_) {
    ontology_->EnforceEntity(kind, properties.value_or(google::protobuf::Struct{}));
  }

  db::model::EntityRecord record;
  record.id          = util::NewId();
  record.kind        = kind;
  record.name        = name;
  record.description = description;
  if (properties) {
    record.properties_json = util::PropertiesToJson(*properties);
  }
  record.embedding     = EmbedOrThrow(name, description);
  record.created_at_ms = util::NowMillis();
  record.updated_at_ms = record.created_at_ms;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertEntity(*tx, record), "create " + std::string(EntityTypeName(kind)));
  tx->Commit();

  return record.id;
}

std::optional<Entity> EntityStore::Get(EntityKind kind, const std::string& id) {
  RequireKind(kind);

  auto tx     = repository_->Begin();
  auto record = repository_->GetEntity(*tx, kind, id);
  tx->Commit();

  if (!record) return std::nullopt;
  return ToEntity(*record);
}

std::optional<Entity> EntityStore::Find(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->FindEntity(*tx, id);
  tx->Commit();

  if (!record) return std::nullopt;
  return ToEntity(*record);
}

void EntityStore::Update(EntityKind kind, const std::string& id, const EntityUpdate& update) {
  RequireKind(kind);
  if (update.Empty()) {
    return;
  }
  if (update.name && update.name->empty()) {
    throw util::InvalidArgument("entity name must not be empty");
  }

  auto tx      = repository_->Begin();
  auto current = repository_->GetEntity(*tx, kind, id);
  if (!current) {
    throw util::NotFound(std::string(EntityTypeName(kind)) + " not found: " + id);
  }

  auto record = *current;
  if (update.name) record.name = *update.name;
  if (update.description) record.description = *update.description;
  if (update.properties) record.properties_json = util::PropertiesToJson(*update.properties);

  if (update.name || update.description) {
    record.embedding = EmbedOrThrow(record.name, record.description);
  }
  record.updated_at_ms = util::NowMillis();

  ThrowIfDbError(repository_->UpdateEntity(*tx, record), "update " + std::string(EntityTypeName(kind)));
  tx->Commit();
}

void EntityStore::Delete(EntityKind kind, const std::string& id) {
  RequireKind(kind);

  auto tx = repository_->Begin();
  if (!repository_->GetEntity(*tx, kind, id)) {
    throw util::NotFound(std::string(EntityTypeName(kind)) + " not found: " + id);
  }
  ThrowIfDbError(repository_->DeleteRelationshipsForEntity(*tx, id), "delete relationships of " + id);
  ThrowIfDbError(repository_->DeleteEntity(*tx, kind, id), "delete " + std::string(EntityTypeName(kind)));
  tx->Commit();

  DATAGRAPH_LOG_INFO("entity deleted", {observability::StringField("kind", EntityTypeName(kind)), observability::StringField("id", id)});
}

std::vector<Entity> EntityStore::List(EntityKind kind, std::size_t limit) {
  RequireKind(kind);
  if (limit == 0) return {};

  auto tx      = repository_->Begin();
  auto records = repository_->ListEntities(*tx, kind, limit);
  tx->Commit();

  std::vector<Entity> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(ToEntity(r));
  }
  return out;
}

uint64_t EntityStore::Count(EntityKind kind) {
  RequireKind(kind);

  auto tx    = repository_->Begin();
  auto count = repository_->CountEntities(*tx, kind);
  tx->Commit();
  return count;
}

} // namespace datagraph::core
