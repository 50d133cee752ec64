#pragma once

#include "api/datagraph/graph/v1.hpp"
#include "service_context.hpp"

namespace datagraph::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  // Always answers OK; readiness is reported in the body.
  graph::v1::HealthResponse Health(const graph::v1::HealthRequest& req);

  graph::v1::StatsResponse Stats(const graph::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datagraph::service
