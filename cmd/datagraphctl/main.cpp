#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "api/datagraph/graph/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using namespace datagraph::graph::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  datagraphctl [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "  health\n"
            << "  stats\n"
            << "  create <kind> <name> [description] [properties_json]\n"
            << "  get <kind> <id>\n"
            << "  update <kind> <id> [--name N] [--description D] [--properties JSON]\n"
            << "  delete <kind> <id>\n"
            << "  list <kind> [limit]\n"
            << "  similar <kind> <name> [description] [limit]\n"
            << "  relate <source_id> <target_id> <type> [properties_json]\n"
            << "  relationships [entity_id] [type]\n"
            << "  relationship <id>\n"
            << "  between <source_id> <target_id>\n"
            << "  retype <id> <type>\n"
            << "  unrelate <id>\n"
            << "  unrelate-pair <source_id> <target_id> [type]\n"
            << "  edges [limit] [--details]\n"
            << "  types\n"
            << "  properties <entity_type>\n"
            << "  ontology\n"
            << "  validate <kind> <properties_json>\n"
            << "  check <source_kind> <target_kind> <type>\n"
            << "  ingest <file|->\n"
            << "\n"
            << "  kind: Asset | ProcessingActivity | DataElement | DataSubjectType | Vendor\n";
}

static EntityKind ParseKind(const std::string& value) {
  auto kind = EntityKindFromName(value);
  if (kind == ENTITY_KIND_UNSPECIFIED) {
    std::cerr << "unknown entity kind: " << value << "\n";
    std::exit(1);
  }
  return kind;
}

static google::protobuf::Struct ParseProperties(const std::string& json) {
  google::protobuf::Struct properties;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &properties);
  if (!status.ok()) {
    std::cerr << "invalid properties json: " << status.message() << "\n";
    std::exit(1);
  }
  return properties;
}

static std::string ReadDocument(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream in(path);
  if (!in) {
    std::cerr << "cannot read " << path << "\n";
    std::exit(1);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Prints the response as JSON. Exit code 2 when the status is not OK.
template <typename Response>
static int Print(const Response& resp) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot print response: " << status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return resp.status().code() == STATUS_CODE_OK ? 0 : 2;
}

static void ShutdownObservability() {
  datagraph::observability::ShutdownLogging();
  datagraph::observability::ShutdownMetrics();
  datagraph::observability::ShutdownTracing();
}

static int Run(const datagraph::factory::Application& app, const std::vector<std::string>& args) {
  const auto& cmd  = args[0];
  const auto  argc = args.size();

  // ------------------------------------------------------------

  if (cmd == "health") {
    return Print(app.admin_service->Health(HealthRequest{}));
  }

  if (cmd == "stats") {
    return Print(app.admin_service->Stats(StatsRequest{}));
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 3) return 1;

    CreateEntityRequest req;
    req.set_kind(ParseKind(args[1]));
    req.set_name(args[2]);
    if (argc >= 4) req.set_description(args[3]);
    if (argc >= 5) *req.mutable_properties() = ParseProperties(args[4]);

    return Print(app.entity_service->CreateEntity(req));
  }

  if (cmd == "get") {
    if (argc < 3) return 1;

    GetEntityRequest req;
    req.set_kind(ParseKind(args[1]));
    req.set_id(args[2]);

    return Print(app.entity_service->GetEntity(req));
  }

  if (cmd == "update") {
    if (argc < 3) return 1;

    UpdateEntityRequest req;
    req.set_kind(ParseKind(args[1]));
    req.set_id(args[2]);
    for (std::size_t i = 3; i + 1 < argc; i += 2) {
      if (args[i] == "--name") {
        req.set_name(args[i + 1]);
      } else if (args[i] == "--description") {
        req.set_description(args[i + 1]);
      } else if (args[i] == "--properties") {
        *req.mutable_properties() = ParseProperties(args[i + 1]);
      } else {
        std::cerr << "unknown update flag: " << args[i] << "\n";
        return 1;
      }
    }

    return Print(app.entity_service->UpdateEntity(req));
  }

  if (cmd == "delete") {
    if (argc < 3) return 1;

    DeleteEntityRequest req;
    req.set_kind(ParseKind(args[1]));
    req.set_id(args[2]);

    return Print(app.entity_service->DeleteEntity(req));
  }

  if (cmd == "list") {
    if (argc < 2) return 1;

    ListEntitiesRequest req;
    req.set_kind(ParseKind(args[1]));
    if (argc >= 3) req.set_limit(static_cast<uint32_t>(std::stoul(args[2])));

    return Print(app.entity_service->ListEntities(req));
  }

  if (cmd == "similar") {
    if (argc < 3) return 1;

    FindSimilarRequest req;
    req.set_kind(ParseKind(args[1]));
    req.set_name(args[2]);
    if (argc >= 4 && !args[3].empty()) req.set_description(args[3]);
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(args[4])));

    return Print(app.search_service->FindSimilar(req));
  }

  // ------------------------------------------------------------

  if (cmd == "relate") {
    if (argc < 4) return 1;

    CreateRelationshipRequest req;
    req.set_source_id(args[1]);
    req.set_target_id(args[2]);
    req.set_relationship_type(args[3]);
    if (argc >= 5) *req.mutable_properties() = ParseProperties(args[4]);

    return Print(app.relationship_service->CreateRelationship(req));
  }

  if (cmd == "relationships") {
    GetRelationshipsRequest req;
    if (argc >= 2 && !args[1].empty()) req.set_entity_id(args[1]);
    if (argc >= 3) req.set_relationship_type(args[2]);

    return Print(app.relationship_service->GetRelationships(req));
  }

  if (cmd == "relationship") {
    if (argc < 2) return 1;

    GetRelationshipRequest req;
    req.set_id(args[1]);

    return Print(app.relationship_service->GetRelationship(req));
  }

  if (cmd == "between") {
    if (argc < 3) return 1;

    ListRelationshipsBetweenRequest req;
    req.mutable_pair()->set_source_id(args[1]);
    req.mutable_pair()->set_target_id(args[2]);

    return Print(app.relationship_service->ListRelationshipsBetween(req));
  }

  if (cmd == "retype") {
    if (argc < 3) return 1;

    UpdateRelationshipRequest req;
    req.set_id(args[1]);
    req.set_relationship_type(args[2]);

    return Print(app.relationship_service->UpdateRelationship(req));
  }

  if (cmd == "unrelate") {
    if (argc < 2) return 1;

    DeleteRelationshipRequest req;
    req.set_id(args[1]);

    return Print(app.relationship_service->DeleteRelationship(req));
  }

  if (cmd == "unrelate-pair") {
    if (argc < 3) return 1;

    DeleteRelationshipRequest req;
    req.mutable_pair()->set_source_id(args[1]);
    req.mutable_pair()->set_target_id(args[2]);
    if (argc >= 4) req.set_relationship_type(args[3]);

    return Print(app.relationship_service->DeleteRelationship(req));
  }

  if (cmd == "edges") {
    ListAllRelationshipsRequest req;
    for (std::size_t i = 1; i < argc; ++i) {
      if (args[i] == "--details") {
        req.set_with_entity_details(true);
      } else {
        req.set_limit(static_cast<uint32_t>(std::stoul(args[i])));
      }
    }

    return Print(app.relationship_service->ListAllRelationships(req));
  }

  // ------------------------------------------------------------

  if (cmd == "types") {
    return Print(app.ontology_service->ListEntityTypes(ListEntityTypesRequest{}));
  }

  if (cmd == "properties") {
    if (argc < 2) return 1;

    ListEntityTypePropertiesRequest req;
    req.set_entity_type(args[1]);

    return Print(app.ontology_service->ListEntityTypeProperties(req));
  }

  if (cmd == "ontology") {
    return Print(app.ontology_service->ListRelationshipOntology(ListRelationshipOntologyRequest{}));
  }

  if (cmd == "validate") {
    if (argc < 3) return 1;

    ValidateEntityPropertiesRequest req;
    req.set_kind(ParseKind(args[1]));
    *req.mutable_properties() = ParseProperties(args[2]);

    return Print(app.ontology_service->ValidateEntityProperties(req));
  }

  if (cmd == "check") {
    if (argc < 4) return 1;

    CheckRelationshipRequest req;
    req.set_source_kind(ParseKind(args[1]));
    req.set_target_kind(ParseKind(args[2]));
    req.set_relationship_type(args[3]);

    return Print(app.ontology_service->CheckRelationship(req));
  }

  // ------------------------------------------------------------

  if (cmd == "ingest") {
    if (argc < 2) return 1;

    IngestDocumentRequest req;
    req.set_document_text(ReadDocument(args[1]));
    req.set_source_name(args[1]);

    return Print(app.ingest_service->IngestDocument(req));
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? datagraph::config::ConfigLoader::Defaults() : datagraph::config::ConfigLoader::LoadFromYaml(config_path);

    datagraph::observability::InitializeTracing(config);
    datagraph::observability::InitializeMetrics(config);
    datagraph::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = datagraph::factory::Build(config);

    const int rc = Run(app, args);
    if (rc == 1) Usage();

    ShutdownObservability();
    return rc;
  } catch (const std::exception& e) {
    DATAGRAPH_LOG_ERROR("Fatal error", {datagraph::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }
}
