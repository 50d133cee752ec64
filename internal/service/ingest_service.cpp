#include "ingest_service.hpp"

#include "internal/core/ingestion_pipeline.hpp"
#include "internal/util/errors.hpp"
#include "observe.hpp"

namespace datagraph::service {

using namespace datagraph::graph::v1;

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

IngestDocumentResponse IngestService::IngestDocument(const IngestDocumentRequest& req) {
  return Respond<IngestDocumentResponse>(ctx_, "IngestService.IngestDocument", [&](IngestDocumentResponse& resp) {
    if (!ctx_.ingestion) {
      throw util::NotReady("text generation is disabled");
    }

    auto report = ctx_.ingestion->Ingest(req.document_text(), req.source_name());
    resp.set_nodes_found(report.nodes_created());
    resp.set_relationships_found(report.relationships_created());
    *resp.mutable_report() = std::move(report);
  });
}

} // namespace datagraph::service
