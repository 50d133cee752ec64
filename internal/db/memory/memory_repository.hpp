#pragma once

#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace datagraph::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::string BackendName() const override { return "memory"; }

  Result InsertEntity(Transaction&, const model::EntityRecord&) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, graph::v1::EntityKind, const std::string&) override;
  std::optional<model::EntityRecord> FindEntity(Transaction&, const std::string&) override;
  Result UpdateEntity(Transaction&, const model::EntityRecord&) override;
  Result DeleteEntity(Transaction&, graph::v1::EntityKind, const std::string&) override;
  std::vector<model::EntityRecord> ListEntities(Transaction&, graph::v1::EntityKind, std::size_t limit) override;
  uint64_t CountEntities(Transaction&, graph::v1::EntityKind) override;
  std::vector<model::ScoredEntityRecord> NearestEntities(Transaction&, graph::v1::EntityKind, const std::vector<float>& query,
                                                         std::size_t limit) override;

  Result InsertRelationship(Transaction&, const model::RelationshipRecord&) override;
  std::optional<model::RelationshipRecord> GetRelationship(Transaction&, const std::string&) override;
  std::vector<model::RelationshipRecord> FindRelationships(Transaction&, const model::RelationshipFilter&) override;
  std::vector<model::RelationshipRecord> ListRelationshipsBetween(Transaction&, const std::string& source_id,
                                                                  const std::string& target_id) override;
  std::vector<model::RelationshipRecord> ListRelationships(Transaction&, std::size_t limit) override;
  Result UpdateRelationship(Transaction&, const model::RelationshipRecord&) override;
  Result DeleteRelationship(Transaction&, const std::string&) override;
  Result DeleteRelationshipsForEntity(Transaction&, const std::string& entity_id) override;
  uint64_t CountRelationships(Transaction&) override;

  Result UpsertEntityType(Transaction&, const model::EntityTypeRecord&) override;
  Result UpsertEntityTypeProperty(Transaction&, const model::EntityTypePropertyRecord&) override;
  Result UpsertRelationshipOntology(Transaction&, const model::RelationshipOntologyRecord&) override;
  std::vector<model::EntityTypeRecord> ListEntityTypes(Transaction&) override;
  std::vector<model::EntityTypePropertyRecord> ListEntityTypeProperties(Transaction&, const std::string& type_id) override;
  std::vector<model::RelationshipOntologyRecord> ListRelationshipOntology(Transaction&) override;

private:
  friend class MemoryTransaction;

  using EntityTable = std::unordered_map<std::string, model::EntityRecord>;

  struct State {
    std::map<int, EntityTable> entities; // keyed by EntityKind
    std::unordered_map<std::string, model::RelationshipRecord> relationships;
    uint64_t next_relationship_sequence = 1;

    std::map<std::string, model::EntityTypeRecord> entity_types; // keyed by type_id
    std::map<std::pair<std::string, std::string>, model::EntityTypePropertyRecord> type_properties;
    std::map<std::tuple<std::string, std::string, std::string>, model::RelationshipOntologyRecord> relationship_ontology;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
