#include "relationship_store.hpp"

#include <unordered_map>

#include "db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/properties.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "ontology_catalog.hpp"

namespace datagraph::core {

using namespace datagraph::graph::v1;

graph::v1::Relationship ToRelationship(const db::model::RelationshipRecord& record) {
  Relationship out;
  out.set_id(record.id);
  out.set_source_id(record.source_id);
  out.set_target_id(record.target_id);
  out.set_relationship_type(record.relationship_type);
  if (!record.properties_json.empty()) {
    *out.mutable_properties() = util::PropertiesFromJson(record.properties_json);
  }
  *out.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return out;
}

RelationshipStore::RelationshipStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<OntologyCatalog> ontology)
    : repository_(std::move(repository)), ontology_(std::move(ontology)) {
}

std::string RelationshipStore::Create(const std::string& source_id, const std::string& target_id, const std::string& relationship_type,
                                      const std::optional<google::protobuf::Struct>& properties) {
  if (source_id.empty() || target_id.empty()) {
    throw util::InvalidArgument("relationship endpoints must not be empty");
  }
  if (relationship_type.empty()) {
    throw util::InvalidArgument("relationship type must not be empty");
  }

  db::model::RelationshipRecord record;
  record.id                = util::NewId();
  record.source_id         = source_id;
  record.target_id         = target_id;
  record.relationship_type = relationship_type;
  if (properties) {
    record.properties_json = util::PropertiesToJson(*properties);
  }
  record.created_at_ms = util::NowMillis();
  record.updated_at_ms = record.created_at_ms;

  if (ontology_) {
    auto lookup = repository_->Begin();
    auto source = repository_->FindEntity(*lookup, source_id);
    auto target = repository_->FindEntity(*lookup, target_id);
    lookup->Commit();

    if (!source) throw util::NotFound("relationship source not found: " + source_id);
    if (!target) throw util::NotFound("relationship target not found: " + target_id);
    ontology_->EnforceRelationship(source->kind, target->kind, relationship_type);
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertRelationship(*tx, record), "create relationship");
  tx->Commit();

  return record.id;
}

std::vector<Relationship> RelationshipStore::Get(const std::optional<std::string>& entity_id, const std::optional<std::string>& relationship_type,
                                                 std::size_t limit) {
  if (limit == 0) return {};

  db::model::RelationshipFilter filter;
  filter.entity_id         = entity_id;
  filter.relationship_type = relationship_type;
  filter.limit             = limit;

  auto tx      = repository_->Begin();
  auto records = repository_->FindRelationships(*tx, filter);
  tx->Commit();

  std::vector<Relationship> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(ToRelationship(r));
  }
  return out;
}

std::optional<Relationship> RelationshipStore::GetById(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetRelationship(*tx, id);
  tx->Commit();

  if (!record) return std::nullopt;
  return ToRelationship(*record);
}

std::vector<Relationship> RelationshipStore::ListBetween(const std::string& source_id, const std::string& target_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListRelationshipsBetween(*tx, source_id, target_id);
  tx->Commit();

  std::vector<Relationship> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(ToRelationship(r));
  }
  return out;
}

void RelationshipStore::ApplyUpdate(db::Transaction& tx, db::model::RelationshipRecord record, const RelationshipUpdate& update) {
  if (update.relationship_type) record.relationship_type = *update.relationship_type;
  if (update.properties) record.properties_json = util::PropertiesToJson(*update.properties);
  record.updated_at_ms = util::NowMillis();

  ThrowIfDbError(repository_->UpdateRelationship(tx, record), "update relationship");
}

std::string RelationshipStore::Update(const std::string& source_id, const std::string& target_id, const RelationshipUpdate& update) {
  if (update.Empty()) {
    return {};
  }
  if (update.relationship_type && update.relationship_type->empty()) {
    throw util::InvalidArgument("relationship type must not be empty");
  }

  auto tx    = repository_->Begin();
  auto edges = repository_->ListRelationshipsBetween(*tx, source_id, target_id);
  if (edges.empty()) {
    throw util::NotFound("no relationship from " + source_id + " to " + target_id);
  }

  const auto id = edges.front().id;
  ApplyUpdate(*tx, std::move(edges.front()), update);
  tx->Commit();
  return id;
}

void RelationshipStore::UpdateById(const std::string& id, const RelationshipUpdate& update) {
  if (update.Empty()) {
    return;
  }
  if (update.relationship_type && update.relationship_type->empty()) {
    throw util::InvalidArgument("relationship type must not be empty");
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetRelationship(*tx, id);
  if (!record) {
    throw util::NotFound("relationship not found: " + id);
  }

  ApplyUpdate(*tx, std::move(*record), update);
  tx->Commit();
}

std::string RelationshipStore::Delete(const std::string& source_id, const std::string& target_id,
                                      const std::optional<std::string>& relationship_type) {
  auto tx    = repository_->Begin();
  auto edges = repository_->ListRelationshipsBetween(*tx, source_id, target_id);

  const db::model::RelationshipRecord* victim = nullptr;
  for (const auto& edge : edges) {
    if (!relationship_type || edge.relationship_type == *relationship_type) {
      victim = &edge;
      break;
    }
  }
  if (!victim) {
    throw util::NotFound("no relationship from " + source_id + " to " + target_id + (relationship_type ? " of type " + *relationship_type : ""));
  }

  const auto id = victim->id;
  ThrowIfDbError(repository_->DeleteRelationship(*tx, id), "delete relationship");
  tx->Commit();
  return id;
}

void RelationshipStore::DeleteById(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteRelationship(*tx, id), "delete relationship");
  tx->Commit();
}

std::vector<RelationshipView> RelationshipStore::ListAll(std::size_t limit, bool with_entity_details) {
  if (limit == 0) return {};

  auto tx      = repository_->Begin();
  auto records = repository_->ListRelationships(*tx, limit);

  std::vector<RelationshipView> out;
  out.reserve(records.size());

  // endpoints repeat across edges; resolve each id once
  std::unordered_map<std::string, std::optional<db::model::EntityRecord>> resolved;
  auto resolve = [&](const std::string& id) -> const std::optional<db::model::EntityRecord>& {
    auto it = resolved.find(id);
    if (it == resolved.end()) {
      it = resolved.emplace(id, repository_->FindEntity(*tx, id)).first;
    }
    return it->second;
  };

  for (const auto& record : records) {
    RelationshipView view;
    *view.mutable_relationship() = ToRelationship(record);

    if (with_entity_details) {
      const auto& source = resolve(record.source_id);
      const auto& target = resolve(record.target_id);
      view.set_source_name(source ? source->name : kUnknown);
      view.set_source_type(source ? std::string(EntityTypeName(source->kind)) : kUnknown);
      view.set_target_name(target ? target->name : kUnknown);
      view.set_target_type(target ? std::string(EntityTypeName(target->kind)) : kUnknown);
    }
    out.push_back(std::move(view));
  }

  tx->Commit();
  return out;
}

uint64_t RelationshipStore::Count() {
  auto tx    = repository_->Begin();
  auto count = repository_->CountRelationships(*tx);
  tx->Commit();
  return count;
}

} // namespace datagraph::core
