#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/entity_store.hpp"
#include "internal/core/ingestion_pipeline.hpp"
#include "internal/core/relationship_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using datagraph::core::EntityStore;
using datagraph::core::IngestionPipeline;
using datagraph::core::RelationshipStore;
using datagraph::db::memory::MemoryRepository;
using datagraph::llm::GraphExtractor;
using datagraph::testing::FakeEmbeddingProvider;
using datagraph::testing::ScriptedTextGenerator;
using datagraph::testing::Throws;
using namespace datagraph::graph::v1;
namespace util = datagraph::util;

struct Fixture {
  std::shared_ptr<MemoryRepository>      repository    = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeEmbeddingProvider> embedder      = std::make_shared<FakeEmbeddingProvider>();
  std::shared_ptr<ScriptedTextGenerator> generator     = std::make_shared<ScriptedTextGenerator>();
  std::shared_ptr<EntityStore>           entities      = std::make_shared<EntityStore>(repository, embedder);
  std::shared_ptr<RelationshipStore>     relationships = std::make_shared<RelationshipStore>(repository);
  IngestionPipeline pipeline{std::make_shared<GraphExtractor>(generator), entities, relationships};

  uint64_t TotalEntities() {
    uint64_t total = 0;
    for (auto kind : kAllEntityKinds) total += entities->Count(kind);
    return total;
  }
};

void TestAcmeDocument() {
  Fixture f;
  f.generator->Push(R"(```json
{
  "nodes": [
    {"id": "Acme CRM", "type": "Asset"},
    {"id": "Customer Email", "type": "DataElement", "description": "Email addresses of customers"},
    {"id": "Marketing", "type": "ProcessingActivity", "properties": {"lawful_basis": "consent"}}
  ],
  "relationships": [
    {"source": "Marketing", "target": "Acme CRM", "relationship_type": "USES"},
    {"source": "Acme CRM", "target": "Customer Email", "relationship_type": "CONTAINS"}
  ]
}
```)");

  auto report = f.pipeline.Ingest("Acme CRM stores Customer Email for Marketing. Marketing uses Acme CRM.", "acme.txt");
  assert(report.nodes_extracted() == 3);
  assert(report.relationships_extracted() == 2);
  assert(report.nodes_created() == 3);
  assert(report.relationships_created() == 2);

  assert(f.entities->Count(ENTITY_KIND_ASSET) == 1);
  assert(f.entities->Count(ENTITY_KIND_DATA_ELEMENT) == 1);
  assert(f.entities->Count(ENTITY_KIND_PROCESSING_ACTIVITY) == 1);

  const auto& crm = report.node_outcomes(0);
  assert(crm.outcome() == ITEM_OUTCOME_CREATED);
  auto stored = f.entities->Get(ENTITY_KIND_ASSET, crm.entity_id());
  assert(stored && stored->name() == "Acme CRM");

  auto email = f.entities->Get(ENTITY_KIND_DATA_ELEMENT, report.node_outcomes(1).entity_id());
  assert(email && email->description() == "Email addresses of customers");

  auto edges = f.relationships->Get(crm.entity_id(), std::nullopt);
  assert(edges.size() == 2);
  for (const auto& outcome : report.relationship_outcomes()) {
    assert(outcome.outcome() == ITEM_OUTCOME_CREATED);
    assert(f.relationships->GetById(outcome.relationship_id()).has_value());
  }
}

void TestUnknownTypesAndUnresolvedEdgesAreSkipped() {
  Fixture f;
  f.generator->Push(R"({
  "nodes": [
    {"id": "Payroll", "type": "ProcessingActivity"},
    {"id": "Server Room", "type": "Location"},
    {"id": "Employees", "type": "DataSubjectTypes"}
  ],
  "relationships": [
    {"source": "Payroll", "target": "Server Room", "relationship_type": "RUNS_IN"},
    {"source": "Payroll", "target": "Ghost", "relationship_type": "USES"}
  ]
})");

  auto report = f.pipeline.Ingest("Payroll runs in the server room.");
  assert(report.nodes_extracted() == 3);
  assert(report.nodes_created() == 1);
  assert(report.node_outcomes(1).outcome() == ITEM_OUTCOME_SKIPPED_UNKNOWN_TYPE);
  // collection names are not type tags
  assert(report.node_outcomes(2).outcome() == ITEM_OUTCOME_SKIPPED_UNKNOWN_TYPE);
  assert(report.relationships_created() == 0);
  assert(report.relationship_outcomes(0).outcome() == ITEM_OUTCOME_SKIPPED_UNRESOLVED);
  assert(report.relationship_outcomes(1).outcome() == ITEM_OUTCOME_SKIPPED_UNRESOLVED);
  assert(f.TotalEntities() == 1);
  assert(f.relationships->Count() == 0);
}

void TestNodeFailuresDoNotStopIngestion() {
  Fixture f;
  f.generator->Push(R"({
  "nodes": [
    {"id": "", "type": "Asset"},
    {"id": "Stripe", "type": "Vendor"},
    {"id": "Billing", "type": "Asset"}
  ],
  "relationships": [
    {"source": "Billing", "target": "Stripe", "relationship_type": "TRANSFERS_DATA_TO"},
    {"source": "Billing", "target": "Stripe", "relationship_type": ""}
  ]
})");

  auto report = f.pipeline.Ingest("Billing sends data to Stripe.");
  assert(report.node_outcomes(0).outcome() == ITEM_OUTCOME_FAILED);
  assert(report.nodes_created() == 2);
  assert(report.relationship_outcomes(0).outcome() == ITEM_OUTCOME_CREATED);
  assert(report.relationship_outcomes(1).outcome() == ITEM_OUTCOME_FAILED);
  assert(!report.relationship_outcomes(1).error().empty());
  assert(report.relationships_created() == 1);
}

void TestEmbeddingFailureMarksNodesFailed() {
  Fixture f;
  f.generator->Push(R"({"nodes": [{"id": "CRM", "type": "Asset"}], "relationships": []})");
  f.embedder->fail = true;

  auto report = f.pipeline.Ingest("CRM.");
  assert(report.nodes_extracted() == 1);
  assert(report.nodes_created() == 0);
  assert(report.node_outcomes(0).outcome() == ITEM_OUTCOME_FAILED);
  assert(f.TotalEntities() == 0);
}

void TestDuplicateNamesMapToLatestNode() {
  Fixture f;
  f.generator->Push(R"({
  "nodes": [
    {"id": "Email", "type": "DataElement"},
    {"id": "Email", "type": "DataElement"},
    {"id": "CRM", "type": "Asset"}
  ],
  "relationships": [{"source": "CRM", "target": "Email", "relationship_type": "CONTAINS"}]
})");

  auto report = f.pipeline.Ingest("CRM holds Email.");
  assert(report.nodes_created() == 3);
  const auto second_email = report.node_outcomes(1).entity_id();
  auto       edges        = f.relationships->Get(second_email, std::nullopt);
  assert(edges.size() == 1);
}

void TestBlankDocumentRejectedBeforeExtraction() {
  Fixture f;
  assert(Throws<util::InvalidArgument>([&] { f.pipeline.Ingest(""); }));
  assert(Throws<util::InvalidArgument>([&] { f.pipeline.Ingest(" \n\t "); }));
  assert(f.generator->prompts.empty());
}

void TestExtractionFailureWritesNothing() {
  Fixture f;
  f.generator->Push("I could not find anything.");
  f.generator->Push(R"({"nodes": [], "relationships": [{"source":"a","target":"b","relationship_type":"X"}]})");

  assert(Throws<util::ExtractionError>([&] { f.pipeline.Ingest("some text"); }));
  assert(Throws<util::ExtractionError>([&] { f.pipeline.Ingest("some text"); }));
  assert(f.TotalEntities() == 0);
  assert(f.relationships->Count() == 0);
}

} // namespace

int main() {
  TestAcmeDocument();
  TestUnknownTypesAndUnresolvedEdgesAreSkipped();
  TestNodeFailuresDoNotStopIngestion();
  TestEmbeddingFailureMarksNodesFailed();
  TestDuplicateNamesMapToLatestNode();
  TestBlankDocumentRejectedBeforeExtraction();
  TestExtractionFailureWritesNothing();

  std::cout << "datagraph_unit_ingestion_pipeline: pass\n";
  return 0;
}
