#include "relationship_service.hpp"

#include "internal/core/relationship_store.hpp"
#include "internal/util/errors.hpp"
#include "observe.hpp"

namespace datagraph::service {

using namespace datagraph::graph::v1;

RelationshipService::RelationshipService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateRelationshipResponse RelationshipService::CreateRelationship(const CreateRelationshipRequest& req) {
  return Respond<CreateRelationshipResponse>(ctx_, "RelationshipService.CreateRelationship", [&](CreateRelationshipResponse& resp) {
    std::optional<google::protobuf::Struct> properties;
    if (req.has_properties()) properties = req.properties();

    resp.set_id(ctx_.relationships->Create(req.source_id(), req.target_id(), req.relationship_type(), properties));
  });
}

GetRelationshipsResponse RelationshipService::GetRelationships(const GetRelationshipsRequest& req) {
  return Respond<GetRelationshipsResponse>(ctx_, "RelationshipService.GetRelationships", [&](GetRelationshipsResponse& resp) {
    std::optional<std::string> entity_id;
    std::optional<std::string> relationship_type;
    if (req.has_entity_id()) entity_id = req.entity_id();
    if (req.has_relationship_type()) relationship_type = req.relationship_type();
    const std::size_t limit = req.has_limit() ? req.limit() : core::RelationshipStore::kDefaultGetLimit;

    for (auto& relationship : ctx_.relationships->Get(entity_id, relationship_type, limit)) {
      *resp.add_relationships() = std::move(relationship);
    }
  });
}

GetRelationshipResponse RelationshipService::GetRelationship(const GetRelationshipRequest& req) {
  return Respond<GetRelationshipResponse>(ctx_, "RelationshipService.GetRelationship", [&](GetRelationshipResponse& resp) {
    auto relationship = ctx_.relationships->GetById(req.id());
    if (!relationship) {
      throw util::NotFound("relationship not found: " + req.id());
    }
    resp.set_found(true);
    *resp.mutable_relationship() = std::move(*relationship);
  });
}

ListRelationshipsBetweenResponse RelationshipService::ListRelationshipsBetween(const ListRelationshipsBetweenRequest& req) {
  return Respond<ListRelationshipsBetweenResponse>(
      ctx_, "RelationshipService.ListRelationshipsBetween", [&](ListRelationshipsBetweenResponse& resp) {
        for (auto& relationship : ctx_.relationships->ListBetween(req.pair().source_id(), req.pair().target_id())) {
          *resp.add_relationships() = std::move(relationship);
        }
      });
}

UpdateRelationshipResponse RelationshipService::UpdateRelationship(const UpdateRelationshipRequest& req) {
  return Respond<UpdateRelationshipResponse>(ctx_, "RelationshipService.UpdateRelationship", [&](UpdateRelationshipResponse& resp) {
    core::RelationshipUpdate update;
    if (req.has_relationship_type()) update.relationship_type = req.relationship_type();
    if (req.has_properties()) update.properties = req.properties();

    switch (req.selector_case()) {
      case UpdateRelationshipRequest::kId:
        ctx_.relationships->UpdateById(req.id(), update);
        resp.set_relationship_id(update.Empty() ? std::string{} : req.id());
        break;
      case UpdateRelationshipRequest::kPair:
        resp.set_relationship_id(ctx_.relationships->Update(req.pair().source_id(), req.pair().target_id(), update));
        break;
      default:
        throw util::InvalidArgument("relationship id or pair is required");
    }
  });
}

DeleteRelationshipResponse RelationshipService::DeleteRelationship(const DeleteRelationshipRequest& req) {
  return Respond<DeleteRelationshipResponse>(ctx_, "RelationshipService.DeleteRelationship", [&](DeleteRelationshipResponse& resp) {
    switch (req.selector_case()) {
      case DeleteRelationshipRequest::kId:
        ctx_.relationships->DeleteById(req.id());
        resp.set_relationship_id(req.id());
        break;
      case DeleteRelationshipRequest::kPair: {
        std::optional<std::string> relationship_type;
        if (req.has_relationship_type()) relationship_type = req.relationship_type();
        resp.set_relationship_id(ctx_.relationships->Delete(req.pair().source_id(), req.pair().target_id(), relationship_type));
        break;
      }
      default:
        throw util::InvalidArgument("relationship id or pair is required");
    }
  });
}

ListAllRelationshipsResponse RelationshipService::ListAllRelationships(const ListAllRelationshipsRequest& req) {
  return Respond<ListAllRelationshipsResponse>(ctx_, "RelationshipService.ListAllRelationships", [&](ListAllRelationshipsResponse& resp) {
    const std::size_t limit = req.has_limit() ? req.limit() : core::RelationshipStore::kDefaultListAllLimit;
    for (auto& view : ctx_.relationships->ListAll(limit, req.with_entity_details())) {
      *resp.add_relationships() = std::move(view);
    }
  });
}

} // namespace datagraph::service
