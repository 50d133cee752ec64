#include "entity_service.hpp"

#include "internal/core/entity_store.hpp"
#include "internal/util/errors.hpp"
#include "observe.hpp"

namespace datagraph::service {

using namespace datagraph::graph::v1;

EntityService::EntityService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateEntityResponse EntityService::CreateEntity(const CreateEntityRequest& req) {
  return Respond<CreateEntityResponse>(ctx_, "EntityService.CreateEntity", [&](CreateEntityResponse& resp) {
    std::optional<std::string>              description;
    std::optional<google::protobuf::Struct> properties;
    if (req.has_description()) description = req.description();
    if (req.has_properties()) properties = req.properties();

    resp.set_id(ctx_.entities->Create(req.kind(), req.name(), description, properties));
  });
}

GetEntityResponse EntityService::GetEntity(const GetEntityRequest& req) {
  return Respond<GetEntityResponse>(ctx_, "EntityService.GetEntity", [&](GetEntityResponse& resp) {
    auto entity = ctx_.entities->Get(req.kind(), req.id());
    if (!entity) {
      throw util::NotFound(std::string(EntityTypeName(req.kind())) + " not found: " + req.id());
    }
    resp.set_found(true);
    *resp.mutable_entity() = std::move(*entity);
  });
}

UpdateEntityResponse EntityService::UpdateEntity(const UpdateEntityRequest& req) {
  return Respond<UpdateEntityResponse>(ctx_, "EntityService.UpdateEntity", [&](UpdateEntityResponse&) {
    core::EntityUpdate update;
    if (req.has_name()) update.name = req.name();
    if (req.has_description()) update.description = req.description();
    if (req.has_properties()) update.properties = req.properties();

    ctx_.entities->Update(req.kind(), req.id(), update);
  });
}

DeleteEntityResponse EntityService::DeleteEntity(const DeleteEntityRequest& req) {
  return Respond<DeleteEntityResponse>(ctx_, "EntityService.DeleteEntity",
                                       [&](DeleteEntityResponse&) { ctx_.entities->Delete(req.kind(), req.id()); });
}

ListEntitiesResponse EntityService::ListEntities(const ListEntitiesRequest& req) {
  return Respond<ListEntitiesResponse>(ctx_, "EntityService.ListEntities", [&](ListEntitiesResponse& resp) {
    const std::size_t limit = req.has_limit() ? req.limit() : core::EntityStore::kDefaultListLimit;
    for (auto& entity : ctx_.entities->List(req.kind(), limit)) {
      *resp.add_entities() = std::move(entity);
    }
  });
}

} // namespace datagraph::service
