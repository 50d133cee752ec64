#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/ontology_record.hpp"
#include "internal/db/model/relationship_record.hpp"

namespace datagraph::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A store operation (including cascades) is exactly one transaction
  - Entity lists are ordered by (name, id)
  - Relationship lists are ordered by (created_at_ms, insertion sequence)

  The DB is the source of truth for:
    entities and their embeddings
    relationships
    the ontology catalog
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // "memory", "sqlite", "postgres"
  virtual std::string BackendName() const = 0;

  // ---------------------------------------------------------------------
  // Entities
  // ---------------------------------------------------------------------

  virtual Result InsertEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, graph::v1::EntityKind kind, const std::string& id) = 0;

  // Looks the id up in every collection.
  virtual std::optional<model::EntityRecord> FindEntity(Transaction&, const std::string& id) = 0;

  virtual Result UpdateEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual Result DeleteEntity(Transaction&, graph::v1::EntityKind kind, const std::string& id) = 0;

  virtual std::vector<model::EntityRecord> ListEntities(Transaction&, graph::v1::EntityKind kind, std::size_t limit) = 0;

  virtual uint64_t CountEntities(Transaction&, graph::v1::EntityKind kind) = 0;

  // Entities of one collection ranked by ascending cosine distance to query.
  // Rows whose embedding dimension differs from the query are ignored.
  virtual std::vector<model::ScoredEntityRecord> NearestEntities(Transaction&, graph::v1::EntityKind kind, const std::vector<float>& query,
                                                                 std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Relationships
  // ---------------------------------------------------------------------

  virtual Result InsertRelationship(Transaction&, const model::RelationshipRecord&) = 0;

  virtual std::optional<model::RelationshipRecord> GetRelationship(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::RelationshipRecord> FindRelationships(Transaction&, const model::RelationshipFilter& filter) = 0;

  virtual std::vector<model::RelationshipRecord> ListRelationshipsBetween(Transaction&, const std::string& source_id,
                                                                          const std::string& target_id) = 0;

  virtual std::vector<model::RelationshipRecord> ListRelationships(Transaction&, std::size_t limit) = 0;

  virtual Result UpdateRelationship(Transaction&, const model::RelationshipRecord&) = 0;

  virtual Result DeleteRelationship(Transaction&, const std::string& id) = 0;

  // Removes every edge where entity_id is source or target.
  virtual Result DeleteRelationshipsForEntity(Transaction&, const std::string& entity_id) = 0;

  virtual uint64_t CountRelationships(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Ontology catalog
  // ---------------------------------------------------------------------

  virtual Result UpsertEntityType(Transaction&, const model::EntityTypeRecord&) = 0;

  virtual Result UpsertEntityTypeProperty(Transaction&, const model::EntityTypePropertyRecord&) = 0;

  virtual Result UpsertRelationshipOntology(Transaction&, const model::RelationshipOntologyRecord&) = 0;

  virtual std::vector<model::EntityTypeRecord> ListEntityTypes(Transaction&) = 0;

  virtual std::vector<model::EntityTypePropertyRecord> ListEntityTypeProperties(Transaction&, const std::string& type_id) = 0;

  virtual std::vector<model::RelationshipOntologyRecord> ListRelationshipOntology(Transaction&) = 0;
};

} // namespace datagraph::db
