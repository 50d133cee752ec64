#pragma once

#include <memory>
#include <string>

#include "datagraph/graph/v1/ingest.pb.h"
#include "text_generator.hpp"

namespace datagraph::llm {

/*
  Turns a document into an ExtractedGraph by prompting the text generator
  with the fixed extraction prompt.

  Throws util::ExtractionError when the generator fails, when the reply is
  not a JSON graph, or when it contains no nodes.
*/
class GraphExtractor {
 public:
  explicit GraphExtractor(std::shared_ptr<TextGenerator> generator);

  graph::v1::ExtractedGraph Extract(const std::string& document_text);

  static std::string BuildPrompt(const std::string& document_text);

  // Trims whitespace and removes ```json / ``` fences.
  static std::string StripFences(const std::string& reply);

 private:
  std::shared_ptr<TextGenerator> generator_;
};

} // namespace datagraph::llm
