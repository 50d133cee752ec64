#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/net/http_client.hpp"

#include "internal/service/admin_service.hpp"
#include "internal/service/entity_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/ontology_service.hpp"
#include "internal/service/relationship_service.hpp"
#include "internal/service/search_service.hpp"
#include "internal/service/service_context.hpp"

namespace datagraph::factory {

/*
  Application

  Owns every long-lived object. Services are always constructed; when
  construction of the engine failed they answer UNAVAILABLE and
  context.not_ready_reason explains why.
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<service::EntityService>       entity_service;
  std::shared_ptr<service::RelationshipService> relationship_service;
  std::shared_ptr<service::SearchService>       search_service;
  std::shared_ptr<service::OntologyService>     ontology_service;
  std::shared_ptr<service::IngestService>       ingest_service;
  std::shared_ptr<service::AdminService>        admin_service;

  bool Ready() const {
    return context.Ready();
  }
};

/*
  Build

  Composition root: the ONLY place that knows concrete repository and
  provider types. Never throws for initialization failures.
*/
Application Build(const runtime::config::RuntimeConfig& config);

// Same, with a caller-supplied HTTP client for the hosted providers.
Application Build(const runtime::config::RuntimeConfig& config, std::shared_ptr<net::HttpClient> http);

} // namespace datagraph::factory
