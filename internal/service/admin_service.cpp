#include "admin_service.hpp"

#include "internal/core/entity_store.hpp"
#include "internal/core/relationship_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/embedding/embedding_provider.hpp"
#include "observe.hpp"

namespace datagraph::service {

using namespace datagraph::graph::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthResponse AdminService::Health(const HealthRequest&) {
  HealthResponse resp;
  ObserveCall("AdminService.Health", [&] {
    resp.set_ready(ctx_.Ready());
    resp.set_reason(ctx_.not_ready_reason);
    if (ctx_.repository) resp.set_backend(ctx_.repository->BackendName());
    if (ctx_.embedder) resp.set_embedding_provider(ctx_.embedder->Name());
    resp.set_ontology_enforced(ctx_.ontology_enforced);
    resp.set_ingestion_enabled(ctx_.ingestion != nullptr);
  });
  *resp.mutable_status() = OkStatus();
  return resp;
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return Respond<StatsResponse>(ctx_, "AdminService.Stats", [&](StatsResponse& resp) {
    for (auto kind : kAllEntityKinds) {
      auto* count = resp.add_entities();
      count->set_kind(kind);
      count->set_count(ctx_.entities->Count(kind));
    }
    resp.set_relationship_count(ctx_.relationships->Count());
  });
}

} // namespace datagraph::service
