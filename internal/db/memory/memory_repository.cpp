#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/vector_math.hpp"
#include "memory_tx.hpp"

namespace datagraph::db::memory {

namespace {

bool EntityOrder(const model::EntityRecord& lhs, const model::EntityRecord& rhs) {
  if (lhs.name != rhs.name) return lhs.name < rhs.name;
  return lhs.id < rhs.id;
}

bool RelationshipOrder(const model::RelationshipRecord& lhs, const model::RelationshipRecord& rhs) {
  if (lhs.created_at_ms != rhs.created_at_ms) return lhs.created_at_ms < rhs.created_at_ms;
  return lhs.sequence < rhs.sequence;
}

using RelationshipTable = std::unordered_map<std::string, model::RelationshipRecord>;

template <typename Pred>
std::vector<model::RelationshipRecord> CollectRelationships(const RelationshipTable& relationships, Pred&& pred, std::size_t limit) {
  std::vector<model::RelationshipRecord> out;
  for (const auto& [_, record] : relationships) {
    if (pred(record)) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), RelationshipOrder);
  if (out.size() > limit) out.resize(limit);
  return out;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result MemoryRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto& table = TX(t).Mutable().entities[static_cast<int>(r.kind)];
  if (table.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "entity exists: " + r.id);
  table[r.id] = r;
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, graph::v1::EntityKind kind, const std::string& id) {
  const auto& s     = TX(t).View();
  auto        table = s.entities.find(static_cast<int>(kind));
  if (table == s.entities.end()) return std::nullopt;
  auto it = table->second.find(id);
  if (it == table->second.end()) return std::nullopt;
  return it->second;
}

std::optional<model::EntityRecord> MemoryRepository::FindEntity(Transaction& t, const std::string& id) {
  for (const auto& [_, table] : TX(t).View().entities) {
    auto it = table.find(id);
    if (it != table.end()) return it->second;
  }
  return std::nullopt;
}

Result MemoryRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r) {
  auto& table = TX(t).Mutable().entities[static_cast<int>(r.kind)];
  auto  it    = table.find(r.id);
  if (it == table.end()) return Result::Err(ErrorCode::NotFound, "entity not found: " + r.id);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteEntity(Transaction& t, graph::v1::EntityKind kind, const std::string& id) {
  auto& table = TX(t).Mutable().entities[static_cast<int>(kind)];
  if (table.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "entity not found: " + id);
  return Result::Ok();
}

std::vector<model::EntityRecord> MemoryRepository::ListEntities(Transaction& t, graph::v1::EntityKind kind, std::size_t limit) {
  const auto&                      s = TX(t).View();
  std::vector<model::EntityRecord> records;
  auto                             table = s.entities.find(static_cast<int>(kind));
  if (table == s.entities.end()) return records;

  records.reserve(table->second.size());
  for (const auto& [_, record] : table->second) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), EntityOrder);
  if (records.size() > limit) records.resize(limit);
  return records;
}

uint64_t MemoryRepository::CountEntities(Transaction& t, graph::v1::EntityKind kind) {
  const auto& s     = TX(t).View();
  auto        table = s.entities.find(static_cast<int>(kind));
  return table == s.entities.end() ? 0 : table->second.size();
}

std::vector<model::ScoredEntityRecord> MemoryRepository::NearestEntities(Transaction& t, graph::v1::EntityKind kind,
                                                                         const std::vector<float>& query, std::size_t limit) {
  std::vector<model::ScoredEntityRecord> scored;
  if (limit == 0) return scored;

  const auto& s     = TX(t).View();
  auto        table = s.entities.find(static_cast<int>(kind));
  if (table == s.entities.end()) return scored;

  for (const auto& [_, record] : table->second) {
    auto distance = util::CosineDistance(query, record.embedding);
    if (!distance) continue;
    scored.push_back({record, *distance});
  }
  util::KeepNearest(scored, limit);
  return scored;
}

// ------------------------------------------------------------------
// Relationships
// ------------------------------------------------------------------

Result MemoryRepository::InsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.relationships.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "relationship exists: " + r.id);
  auto& stored    = s.relationships[r.id] = r;
  stored.sequence = s.next_relationship_sequence++;
  return Result::Ok();
}

std::optional<model::RelationshipRecord> MemoryRepository::GetRelationship(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.relationships.find(id);
  if (it == s.relationships.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RelationshipRecord> MemoryRepository::FindRelationships(Transaction& t, const model::RelationshipFilter& filter) {
  return CollectRelationships(
      TX(t).View().relationships,
      [&](const model::RelationshipRecord& r) {
        if (filter.entity_id && r.source_id != *filter.entity_id && r.target_id != *filter.entity_id) return false;
        if (filter.relationship_type && r.relationship_type != *filter.relationship_type) return false;
        return true;
      },
      filter.limit);
}

std::vector<model::RelationshipRecord> MemoryRepository::ListRelationshipsBetween(Transaction& t, const std::string& source_id,
                                                                                  const std::string& target_id) {
  const auto& s = TX(t).View();
  return CollectRelationships(
      s.relationships, [&](const model::RelationshipRecord& r) { return r.source_id == source_id && r.target_id == target_id; }, s.relationships.size());
}

std::vector<model::RelationshipRecord> MemoryRepository::ListRelationships(Transaction& t, std::size_t limit) {
  return CollectRelationships(TX(t).View().relationships, [](const model::RelationshipRecord&) { return true; }, limit);
}

Result MemoryRepository::UpdateRelationship(Transaction& t, const model::RelationshipRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.relationships.find(r.id);
  if (it == s.relationships.end()) return Result::Err(ErrorCode::NotFound, "relationship not found: " + r.id);
  const auto sequence  = it->second.sequence;
  it->second           = r;
  it->second.sequence  = sequence;
  return Result::Ok();
}

Result MemoryRepository::DeleteRelationship(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().relationships.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "relationship not found: " + id);
  return Result::Ok();
}

Result MemoryRepository::DeleteRelationshipsForEntity(Transaction& t, const std::string& entity_id) {
  auto& relationships = TX(t).Mutable().relationships;
  std::erase_if(relationships, [&](const auto& entry) { return entry.second.source_id == entity_id || entry.second.target_id == entity_id; });
  return Result::Ok();
}

uint64_t MemoryRepository::CountRelationships(Transaction& t) {
  return TX(t).View().relationships.size();
}

// ------------------------------------------------------------------
// Ontology catalog
// ------------------------------------------------------------------

Result MemoryRepository::UpsertEntityType(Transaction& t, const model::EntityTypeRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [type_id, existing] : s.entity_types) {
    if (existing.name == r.name && type_id != r.type_id) {
      return Result::Err(ErrorCode::ConstraintViolation, "entity type name already used: " + r.name);
    }
  }
  s.entity_types[r.type_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertEntityTypeProperty(Transaction& t, const model::EntityTypePropertyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entity_types.contains(r.type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown entity type: " + r.type_id);
  }
  s.type_properties[{r.type_id, r.property_name}] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertRelationshipOntology(Transaction& t, const model::RelationshipOntologyRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entity_types.contains(r.source_type_id) || !s.entity_types.contains(r.target_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "relationship ontology references unknown entity type");
  }
  s.relationship_ontology[{r.source_type_id, r.target_type_id, r.relationship_type}] = r;
  return Result::Ok();
}

std::vector<model::EntityTypeRecord> MemoryRepository::ListEntityTypes(Transaction& t) {
  std::vector<model::EntityTypeRecord> out;
  for (const auto& [_, record] : TX(t).View().entity_types) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) { return lhs.name < rhs.name; });
  return out;
}

std::vector<model::EntityTypePropertyRecord> MemoryRepository::ListEntityTypeProperties(Transaction& t, const std::string& type_id) {
  std::vector<model::EntityTypePropertyRecord> out;
  for (const auto& [key, record] : TX(t).View().type_properties) {
    if (key.first == type_id) out.push_back(record);
  }
  return out;
}

std::vector<model::RelationshipOntologyRecord> MemoryRepository::ListRelationshipOntology(Transaction& t) {
  std::vector<model::RelationshipOntologyRecord> out;
  for (const auto& [_, record] : TX(t).View().relationship_ontology) {
    out.push_back(record);
  }
  return out;
}

} // namespace datagraph::db::memory
