#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace datagraph::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;
  std::string BackendName() const override { return "postgres"; }

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
