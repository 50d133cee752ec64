#include "similarity_search.hpp"

#include "entity_store.hpp"
#include "internal/util/errors.hpp"

namespace datagraph::core {

using namespace datagraph::graph::v1;

SimilaritySearch::SimilaritySearch(std::shared_ptr<db::Repository> repository, std::shared_ptr<embedding::EmbeddingProvider> embedder)
    : repository_(std::move(repository)), embedder_(std::move(embedder)) {
}

std::vector<SimilarEntity> SimilaritySearch::FindSimilar(EntityKind kind, const std::string& name, const std::optional<std::string>& description,
                                                         std::size_t limit) {
  RequireKind(kind);
  if (limit == 0) return {};

  auto query = embedder_->Embed(embedding::EmbeddingText(name, description));
  if (query.empty()) {
    throw util::UpstreamError("embedding provider " + embedder_->Name() + " returned an empty vector");
  }

  auto tx   = repository_->Begin();
  auto hits = repository_->NearestEntities(*tx, kind, query, limit);
  tx->Commit();

  std::vector<SimilarEntity> out;
  out.reserve(hits.size());
  for (const auto& hit : hits) {
    SimilarEntity similar;
    similar.set_id(hit.record.id);
    similar.set_name(hit.record.name);
    if (hit.record.description) {
      similar.set_description(*hit.record.description);
    }
    similar.set_distance(hit.distance);
    out.push_back(std::move(similar));
  }
  return out;
}

} // namespace datagraph::core
