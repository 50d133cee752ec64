#include "ontology_service.hpp"

#include "internal/core/entity_store.hpp"
#include "internal/core/ontology_catalog.hpp"
#include "observe.hpp"

namespace datagraph::service {

using namespace datagraph::graph::v1;

OntologyService::OntologyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListEntityTypesResponse OntologyService::ListEntityTypes(const ListEntityTypesRequest&) {
  return Respond<ListEntityTypesResponse>(ctx_, "OntologyService.ListEntityTypes", [&](ListEntityTypesResponse& resp) {
    for (auto& type : ctx_.ontology->ListEntityTypes()) {
      *resp.add_entity_types() = std::move(type);
    }
  });
}

ListEntityTypePropertiesResponse OntologyService::ListEntityTypeProperties(const ListEntityTypePropertiesRequest& req) {
  return Respond<ListEntityTypePropertiesResponse>(ctx_, "OntologyService.ListEntityTypeProperties", [&](ListEntityTypePropertiesResponse& resp) {
    for (auto& property : ctx_.ontology->ListEntityTypeProperties(req.entity_type())) {
      *resp.add_properties() = std::move(property);
    }
  });
}

ListRelationshipOntologyResponse OntologyService::ListRelationshipOntology(const ListRelationshipOntologyRequest&) {
  return Respond<ListRelationshipOntologyResponse>(ctx_, "OntologyService.ListRelationshipOntology", [&](ListRelationshipOntologyResponse& resp) {
    for (auto& entry : ctx_.ontology->ListRelationshipOntology()) {
      *resp.add_entries() = std::move(entry);
    }
  });
}

ValidateEntityPropertiesResponse OntologyService::ValidateEntityProperties(const ValidateEntityPropertiesRequest& req) {
  return Respond<ValidateEntityPropertiesResponse>(ctx_, "OntologyService.ValidateEntityProperties", [&](ValidateEntityPropertiesResponse& resp) {
    core::RequireKind(req.kind());
    auto violations = ctx_.ontology->ValidateEntity(req.kind(), req.properties());
    resp.set_valid(violations.empty());
    for (auto& violation : violations) {
      resp.add_violations(std::move(violation));
    }
  });
}

CheckRelationshipResponse OntologyService::CheckRelationship(const CheckRelationshipRequest& req) {
  return Respond<CheckRelationshipResponse>(ctx_, "OntologyService.CheckRelationship", [&](CheckRelationshipResponse& resp) {
    core::RequireKind(req.source_kind());
    core::RequireKind(req.target_kind());
    resp.set_allowed(ctx_.ontology->CheckRelationship(req.source_kind(), req.target_kind(), req.relationship_type()));
  });
}

} // namespace datagraph::service
