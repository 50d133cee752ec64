#pragma once

#include "api/datagraph/graph/v1.hpp"
#include "service_context.hpp"

namespace datagraph::service {

class SearchService {
 public:
  explicit SearchService(ServiceContext ctx);

  graph::v1::FindSimilarResponse FindSimilar(const graph::v1::FindSimilarRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datagraph::service
