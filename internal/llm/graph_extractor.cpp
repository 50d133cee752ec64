#include "graph_extractor.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace datagraph::llm {

namespace {

constexpr const char* kPromptHead =
    R"(You are an expert at building knowledge graphs for data governance and privacy regulations. Your task is to extract information from the provided document according to a specific schema.

**Schema & Topology Rules:**
1.  Identify and classify entities into one of five types:
    - **Asset**: A system, application, or database (e.g., 'CRM Platform', 'Production Aurora DB').
    - **ProcessingActivity**: A business process that uses data (e.g., 'User Authentication', 'Monthly Newsletter Campaign').
    - **DataElement**: A specific category of personal data (e.g., 'Contact Info', 'Financial Info', 'IP Address').
    - **DataSubjectType**: A category of individual (e.g., 'Customer', 'Employee', 'Patient').
    - **Vendor**: A third-party company or service.
2.  Identify the relationships between these entities. Common relationships include:
    - A 'ProcessingActivity' **PROCESSES_DATA_FROM** an 'Asset'.
    - An 'Asset' **CONTAINS** 'DataElements'.
    - A 'DataElement' **BELONGS_TO** a 'DataSubjectType'.
    - An 'Asset' **TRANSFERS_TO** a 'Vendor'.

**Output Format:**
- Return a single, valid JSON object with 'nodes' and 'relationships' keys. Do not include any other text.
- 'nodes' is a list of objects, each with 'id' (a unique name) and 'type'. A node may also carry a 'description' and a 'properties' object.
- 'relationships' is a list of objects, each with 'source' (name), 'target' (name), and 'relationship_type'.

**Document:**
---
)";

constexpr const char* kPromptTail = R"(
---
)";

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

void EraseAll(std::string& s, const std::string& token) {
  for (auto pos = s.find(token); pos != std::string::npos; pos = s.find(token, pos)) {
    s.erase(pos, token.size());
  }
}

} // namespace

GraphExtractor::GraphExtractor(std::shared_ptr<TextGenerator> generator) : generator_(std::move(generator)) {
}

std::string GraphExtractor::BuildPrompt(const std::string& document_text) {
  return std::string(kPromptHead) + document_text + kPromptTail;
}

std::string GraphExtractor::StripFences(const std::string& reply) {
  std::string cleaned = Trim(reply);
  EraseAll(cleaned, "```json");
  EraseAll(cleaned, "```");
  return Trim(cleaned);
}

graph::v1::ExtractedGraph GraphExtractor::Extract(const std::string& document_text) {
  std::string reply;
  try {
    reply = generator_->Generate(BuildPrompt(document_text));
  } catch (const std::exception& e) {
    throw util::ExtractionError(std::string("text generation failed: ") + e.what());
  }

  const auto cleaned = StripFences(reply);

  graph::v1::ExtractedGraph                graph;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(cleaned, &graph, options);
  if (!status.ok()) {
    DATAGRAPH_LOG_WARN("unparseable extraction reply", {observability::StringField("error", std::string(status.message())),
                                                        observability::IntField("reply_bytes", static_cast<int64_t>(reply.size()))});
    throw util::ExtractionError("could not parse extraction reply: " + std::string(status.message()));
  }

  if (graph.nodes_size() == 0) {
    throw util::ExtractionError("extraction returned no nodes");
  }

  return graph;
}

} // namespace datagraph::llm
