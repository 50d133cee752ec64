#include "search_service.hpp"

#include "internal/core/similarity_search.hpp"
#include "observe.hpp"

namespace datagraph::service {

using namespace datagraph::graph::v1;

SearchService::SearchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FindSimilarResponse SearchService::FindSimilar(const FindSimilarRequest& req) {
  return Respond<FindSimilarResponse>(ctx_, "SearchService.FindSimilar", [&](FindSimilarResponse& resp) {
    std::optional<std::string> description;
    if (req.has_description()) description = req.description();
    const std::size_t limit = req.has_limit() ? req.limit() : core::SimilaritySearch::kDefaultLimit;

    for (auto& hit : ctx_.search->FindSimilar(req.kind(), req.name(), description, limit)) {
      *resp.add_results() = std::move(hit);
    }
  });
}

} // namespace datagraph::service
