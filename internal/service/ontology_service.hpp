#pragma once

#include "api/datagraph/graph/v1.hpp"
#include "service_context.hpp"

namespace datagraph::service {

// Read-only: nothing here mutates the catalog.
class OntologyService {
 public:
  explicit OntologyService(ServiceContext ctx);

  graph::v1::ListEntityTypesResponse ListEntityTypes(const graph::v1::ListEntityTypesRequest& req);

  graph::v1::ListEntityTypePropertiesResponse ListEntityTypeProperties(const graph::v1::ListEntityTypePropertiesRequest& req);

  graph::v1::ListRelationshipOntologyResponse ListRelationshipOntology(const graph::v1::ListRelationshipOntologyRequest& req);

  graph::v1::ValidateEntityPropertiesResponse ValidateEntityProperties(const graph::v1::ValidateEntityPropertiesRequest& req);

  graph::v1::CheckRelationshipResponse CheckRelationship(const graph::v1::CheckRelationshipRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datagraph::service
