#pragma once

#include "api/datagraph/graph/v1.hpp"
#include "service_context.hpp"

namespace datagraph::service {

class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  graph::v1::IngestDocumentResponse IngestDocument(const graph::v1::IngestDocumentRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace datagraph::service
