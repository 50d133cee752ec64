#pragma once

#include "api/datagraph/graph/v1.hpp"
#include "service_context.hpp"

namespace datagraph::service {

class EntityService {
 public:
  explicit EntityService(ServiceContext ctx);

  graph::v1::CreateEntityResponse CreateEntity(const graph::v1::CreateEntityRequest& req);

  graph::v1::GetEntityResponse GetEntity(const graph::v1::GetEntityRequest& req);

  graph::v1::UpdateEntityResponse UpdateEntity(const graph::v1::UpdateEntityRequest& req);

  graph::v1::DeleteEntityResponse DeleteEntity(const graph::v1::DeleteEntityRequest& req);

  graph::v1::ListEntitiesResponse ListEntities(const graph::v1::ListEntitiesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datagraph::service
