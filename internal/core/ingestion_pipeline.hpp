#pragma once

#include <memory>
#include <string>

#include "api/datagraph/graph/v1.hpp"
#include "entity_store.hpp"
#include "internal/llm/graph_extractor.hpp"
#include "relationship_store.hpp"

namespace datagraph::core {

/*
  Document text -> extracted graph -> persisted entities and relationships.

  Extraction is all-or-nothing. Materialization is best effort: each node
  and each edge is its own store operation, failures are recorded in the
  report and the pipeline moves on. Nothing already created is rolled back.
*/
class IngestionPipeline {
 public:
  IngestionPipeline(std::shared_ptr<llm::GraphExtractor> extractor, std::shared_ptr<EntityStore> entities,
                    std::shared_ptr<RelationshipStore> relationships);

  // source_name only labels log lines.
  graph::v1::IngestionReport Ingest(const std::string& document_text, const std::string& source_name = {});

 private:
  std::shared_ptr<llm::GraphExtractor> extractor_;
  std::shared_ptr<EntityStore>         entities_;
  std::shared_ptr<RelationshipStore>   relationships_;
};

} // namespace datagraph::core
