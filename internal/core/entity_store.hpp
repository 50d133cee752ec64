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
#include "internal/embedding/embedding_provider.hpp"

namespace datagraph::core {

class OntologyCatalog;

// Fields left unset are not touched.
struct EntityUpdate {
  std::optional<std::string>              name;
  std::optional<std::string>              description;
  std::optional<google::protobuf::Struct> properties;

  bool Empty() const {
    return !name && !description && !properties;
  }
};

/*
  CRUD over the five typed entity collections.

  Every persisted entity carries an embedding of its current name and
  description. Embeddings are computed outside the write transaction so a
  provider failure leaves storage untouched.
*/
class EntityStore {
 public:
  static constexpr std::size_t kDefaultListLimit = 100;

  // ontology is optional; when set, Create validates properties against it.
  EntityStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<embedding::EmbeddingProvider> embedder,
              std::shared_ptr<OntologyCatalog> ontology = nullptr);

  std::string Create(graph::v1::EntityKind kind, const std::string& name, const std::optional<std::string>& description,
                     const std::optional<google::protobuf::Struct>& properties);

  std::optional<graph::v1::Entity> Get(graph::v1::EntityKind kind, const std::string& id);

  // Resolves an id in any collection.
  std::optional<graph::v1::Entity> Find(const std::string& id);

  void Update(graph::v1::EntityKind kind, const std::string& id, const EntityUpdate& update);

  // Removes the entity and every relationship touching it.
  void Delete(graph::v1::EntityKind kind, const std::string& id);

  std::vector<graph::v1::Entity> List(graph::v1::EntityKind kind, std::size_t limit = kDefaultListLimit);

  uint64_t Count(graph::v1::EntityKind kind);

 private:
  std::vector<float> EmbedOrThrow(const std::string& name, const std::optional<std::string>& description);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<embedding::EmbeddingProvider> embedder_;
  std::shared_ptr<OntologyCatalog>              ontology_;
};

// Shared record -> API conversion.
graph::v1::Entity ToEntity(const db::model::EntityRecord& record);

// Throws util::InvalidArgument for ENTITY_KIND_UNSPECIFIED or unknown values.
void RequireKind(graph::v1::EntityKind kind);

} // namespace datagraph::core
