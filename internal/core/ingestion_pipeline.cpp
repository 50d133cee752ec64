#include "ingestion_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace datagraph::core {

using namespace datagraph::graph::v1;
using observability::IntField;
using observability::StringField;

namespace {

// Node tags are type names only ("Asset"), never collection names.
EntityKind KindForTag(const std::string& tag) {
  for (auto kind : kAllEntityKinds) {
    if (tag == EntityTypeName(kind)) return kind;
  }
  return ENTITY_KIND_UNSPECIFIED;
}

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string_view OutcomeLabel(ItemOutcome outcome) {
  switch (outcome) {
    case ITEM_OUTCOME_CREATED:
      return "created";
    case ITEM_OUTCOME_SKIPPED_UNKNOWN_TYPE:
      return "skipped_unknown_type";
    case ITEM_OUTCOME_SKIPPED_UNRESOLVED:
      return "skipped_unresolved";
    case ITEM_OUTCOME_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

void RecordOutcomes(std::string_view item, const std::unordered_map<int, uint64_t>& counts) {
  for (const auto& [outcome, count] : counts) {
    observability::Metrics::Instance().RecordIngestedItems(item, OutcomeLabel(static_cast<ItemOutcome>(outcome)), count);
  }
}

} // namespace

IngestionPipeline::IngestionPipeline(std::shared_ptr<llm::GraphExtractor> extractor, std::shared_ptr<EntityStore> entities,
                                     std::shared_ptr<RelationshipStore> relationships)
    : extractor_(std::move(extractor)), entities_(std::move(entities)), relationships_(std::move(relationships)) {
}

IngestionReport IngestionPipeline::Ingest(const std::string& document_text, const std::string& source_name) {
  if (IsBlank(document_text)) {
    throw util::InvalidArgument("document text must not be empty");
  }

  observability::SpanScope span("IngestionPipeline.Ingest");
  span.SetAttribute("datagraph.ingest.source", source_name);

  auto extracted = extractor_->Extract(document_text);

  IngestionReport report;
  report.set_nodes_extracted(static_cast<uint32_t>(extracted.nodes_size()));
  report.set_relationships_extracted(static_cast<uint32_t>(extracted.relationships_size()));

  std::unordered_map<std::string, std::string> ids_by_name;
  std::unordered_map<int, uint64_t>            node_counts;
  std::unordered_map<int, uint64_t>            edge_counts;

  for (const auto& node : extracted.nodes()) {
    auto* outcome = report.add_node_outcomes();
    outcome->set_name(node.id());
    outcome->set_type(node.type());

    const auto kind = KindForTag(node.type());
    if (node.id().empty()) {
      outcome->set_outcome(ITEM_OUTCOME_FAILED);
      outcome->set_error("node has no name");
    } else if (kind == ENTITY_KIND_UNSPECIFIED) {
      outcome->set_outcome(ITEM_OUTCOME_SKIPPED_UNKNOWN_TYPE);
      outcome->set_error("unknown entity type: " + node.type());
    } else {
      std::optional<std::string>              description;
      std::optional<google::protobuf::Struct> properties;
      if (node.has_description()) description = node.description();
      if (node.has_properties()) properties = node.properties();

      try {
        auto id = entities_->Create(kind, node.id(), description, properties);
        outcome->set_outcome(ITEM_OUTCOME_CREATED);
        outcome->set_entity_id(id);
        ids_by_name[node.id()] = std::move(id);
      } catch (const std::exception& e) {
        outcome->set_outcome(ITEM_OUTCOME_FAILED);
        outcome->set_error(e.what());
      }
    }

    ++node_counts[outcome->outcome()];
    if (outcome->outcome() != ITEM_OUTCOME_CREATED) {
      DATAGRAPH_LOG_WARN("ingest node not created", {StringField("source", source_name), StringField("node", node.id()),
                                                     StringField("type", node.type()), StringField("outcome", OutcomeLabel(outcome->outcome())),
                                                     StringField("error", outcome->error())});
    }
  }

  for (const auto& edge : extracted.relationships()) {
    auto* outcome = report.add_relationship_outcomes();
    outcome->set_source(edge.source());
    outcome->set_target(edge.target());
    outcome->set_relationship_type(edge.relationship_type());

    auto source = ids_by_name.find(edge.source());
    auto target = ids_by_name.find(edge.target());
    if (source == ids_by_name.end() || target == ids_by_name.end()) {
      outcome->set_outcome(ITEM_OUTCOME_SKIPPED_UNRESOLVED);
      outcome->set_error("endpoint was not created in this document");
    } else {
      std::optional<google::protobuf::Struct> properties;
      if (edge.has_properties()) properties = edge.properties();

      try {
        outcome->set_relationship_id(relationships_->Create(source->second, target->second, edge.relationship_type(), properties));
        outcome->set_outcome(ITEM_OUTCOME_CREATED);
      } catch (const std::exception& e) {
        outcome->set_outcome(ITEM_OUTCOME_FAILED);
        outcome->set_error(e.what());
      }
    }

    ++edge_counts[outcome->outcome()];
    if (outcome->outcome() != ITEM_OUTCOME_CREATED) {
      DATAGRAPH_LOG_WARN("ingest relationship not created",
                         {StringField("source", source_name), StringField("from", edge.source()), StringField("to", edge.target()),
                          StringField("type", edge.relationship_type()), StringField("outcome", OutcomeLabel(outcome->outcome())),
                          StringField("error", outcome->error())});
    }
  }

  report.set_nodes_created(static_cast<uint32_t>(node_counts[ITEM_OUTCOME_CREATED]));
  report.set_relationships_created(static_cast<uint32_t>(edge_counts[ITEM_OUTCOME_CREATED]));

  RecordOutcomes("node", node_counts);
  RecordOutcomes("relationship", edge_counts);
  span.SetAttribute("datagraph.ingest.nodes_created", static_cast<std::int64_t>(report.nodes_created()));
  span.SetAttribute("datagraph.ingest.relationships_created", static_cast<std::int64_t>(report.relationships_created()));

  DATAGRAPH_LOG_INFO("document ingested", {StringField("source", source_name), IntField("nodes_extracted", report.nodes_extracted()),
                                           IntField("nodes_created", report.nodes_created()),
                                           IntField("relationships_extracted", report.relationships_extracted()),
                                           IntField("relationships_created", report.relationships_created())});
  return report;
}

} // namespace datagraph::core
