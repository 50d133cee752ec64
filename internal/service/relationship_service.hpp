#pragma once

#include "api/datagraph/graph/v1.hpp"
#include "service_context.hpp"

namespace datagraph::service {

class RelationshipService {
 public:
  explicit RelationshipService(ServiceContext ctx);

  graph::v1::CreateRelationshipResponse CreateRelationship(const graph::v1::CreateRelationshipRequest& req);

  graph::v1::GetRelationshipsResponse GetRelationships(const graph::v1::GetRelationshipsRequest& req);

  graph::v1::GetRelationshipResponse GetRelationship(const graph::v1::GetRelationshipRequest& req);

  graph::v1::ListRelationshipsBetweenResponse ListRelationshipsBetween(const graph::v1::ListRelationshipsBetweenRequest& req);

  graph::v1::UpdateRelationshipResponse UpdateRelationship(const graph::v1::UpdateRelationshipRequest& req);

  graph::v1::DeleteRelationshipResponse DeleteRelationship(const graph::v1::DeleteRelationshipRequest& req);

  graph::v1::ListAllRelationshipsResponse ListAllRelationships(const graph::v1::ListAllRelationshipsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datagraph::service
