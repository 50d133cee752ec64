#pragma once

#include <memory>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "api/datagraph/graph/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace datagraph::core {

/*
  Read-only view of the ontology catalog plus the optional validation hook.

  Lookups never fail for unknown names; they return empty results.
  Validation is advisory unless the caller chooses to enforce it.
*/
class OntologyCatalog {
 public:
  explicit OntologyCatalog(std::shared_ptr<db::Repository> repository);

  // Upserts the built-in entity types, properties and relationship rules.
  // Safe to run on every start.
  void SeedDefaults();

  std::vector<graph::v1::EntityType> ListEntityTypes();

  // entity_type is a type name ("Asset") or a table name ("Assets").
  std::vector<graph::v1::EntityTypeProperty> ListEntityTypeProperties(const std::string& entity_type);

  std::vector<graph::v1::RelationshipOntologyEntry> ListRelationshipOntology();

  // One message per violated property rule; empty when valid.
  std::vector<std::string> ValidateEntity(graph::v1::EntityKind kind, const google::protobuf::Struct& properties);

  bool CheckRelationship(graph::v1::EntityKind source_kind, graph::v1::EntityKind target_kind, const std::string& relationship_type);

  // Throws util::InvalidArgument listing every violation.
  void EnforceEntity(graph::v1::EntityKind kind, const google::protobuf::Struct& properties);

  // Throws util::InvalidArgument when the triple is not declared.
  void EnforceRelationship(graph::v1::EntityKind source_kind, graph::v1::EntityKind target_kind, const std::string& relationship_type);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace datagraph::core
