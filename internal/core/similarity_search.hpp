#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api/datagraph/graph/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/embedding/embedding_provider.hpp"

namespace datagraph::core {

class SimilaritySearch {
 public:
  static constexpr std::size_t kDefaultLimit = 5;

  // Distances below this usually mean the same real-world thing. Exported
  // for callers; FindSimilar never filters on it.
  static constexpr double kNearDuplicateThreshold = 0.3;

  SimilaritySearch(std::shared_ptr<db::Repository> repository, std::shared_ptr<embedding::EmbeddingProvider> embedder);

  // Searches one collection, nearest first.
  std::vector<graph::v1::SimilarEntity> FindSimilar(graph::v1::EntityKind kind, const std::string& name,
                                                    const std::optional<std::string>& description, std::size_t limit = kDefaultLimit);

 private:
  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<embedding::EmbeddingProvider> embedder_;
};

} // namespace datagraph::core
