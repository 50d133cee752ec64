#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "api/datagraph/graph/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace datagraph::core {

class OntologyCatalog;

struct RelationshipUpdate {
  std::optional<std::string>              relationship_type;
  std::optional<google::protobuf::Struct> properties;

  bool Empty() const {
    return !relationship_type && !properties;
  }
};

/*
  Directed edges between entities.

  Every edge has its own id. Pair-keyed Update/Delete act on the first edge
  of the ordered pair (oldest created_at, then earliest inserted) so exactly one
  edge changes per call.
*/
class RelationshipStore {
 public:
  static constexpr std::size_t kDefaultGetLimit     = 100;
  static constexpr std::size_t kDefaultListAllLimit = 1000;

  static constexpr const char* kUnknown = "Unknown";

  // ontology is optional; when set, Create resolves both endpoints and checks
  // the triple against the declared rules.
  explicit RelationshipStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<OntologyCatalog> ontology = nullptr);

  std::string Create(const std::string& source_id, const std::string& target_id, const std::string& relationship_type,
                     const std::optional<google::protobuf::Struct>& properties);

  std::vector<graph::v1::Relationship> Get(const std::optional<std::string>& entity_id, const std::optional<std::string>& relationship_type,
                                           std::size_t limit = kDefaultGetLimit);

  std::optional<graph::v1::Relationship> GetById(const std::string& id);

  std::vector<graph::v1::Relationship> ListBetween(const std::string& source_id, const std::string& target_id);

  // Returns the id of the edge that changed, empty when nothing was requested.
  std::string Update(const std::string& source_id, const std::string& target_id, const RelationshipUpdate& update);

  void UpdateById(const std::string& id, const RelationshipUpdate& update);

  // Returns the id of the removed edge.
  std::string Delete(const std::string& source_id, const std::string& target_id, const std::optional<std::string>& relationship_type);

  void DeleteById(const std::string& id);

  // Endpoint names and types come from the same read transaction as the
  // edges; dangling endpoints read as "Unknown".
  std::vector<graph::v1::RelationshipView> ListAll(std::size_t limit = kDefaultListAllLimit, bool with_entity_details = false);

  uint64_t Count();

 private:
  void ApplyUpdate(db::Transaction& tx, db::model::RelationshipRecord record, const RelationshipUpdate& update);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<OntologyCatalog> ontology_;
};

graph::v1::Relationship ToRelationship(const db::model::RelationshipRecord& record);

} // namespace datagraph::core
