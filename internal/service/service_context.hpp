#pragma once

#include <memory>
#include <string>

namespace datagraph::core {
class EntityStore;
class RelationshipStore;
class SimilaritySearch;
class OntologyCatalog;
class IngestionPipeline;
} // namespace datagraph::core
namespace datagraph::db {
class Repository;
}
namespace datagraph::embedding {
class EmbeddingProvider;
}

namespace datagraph::service {

/*
  Dependency container shared by all services.

  When construction failed the pointers are null and not_ready_reason says
  why; every service then answers UNAVAILABLE.
*/
struct ServiceContext {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<embedding::EmbeddingProvider> embedder;
  std::shared_ptr<core::EntityStore>            entities;
  std::shared_ptr<core::RelationshipStore>      relationships;
  std::shared_ptr<core::SimilaritySearch>       search;
  std::shared_ptr<core::OntologyCatalog>        ontology;
  // null when text generation is disabled
  std::shared_ptr<core::IngestionPipeline> ingestion;

  bool        ontology_enforced = false;
  std::string not_ready_reason;

  bool Ready() const {
    return not_ready_reason.empty();
  }

  // Throws util::NotReady.
  void RequireReady() const;
};

} // namespace datagraph::service
