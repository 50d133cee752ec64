#pragma once

#include <string>

namespace datagraph::llm {

// Single-turn prompt completion. Throws util::UpstreamError on failure.
class TextGenerator {
 public:
  virtual ~TextGenerator() = default;

  virtual std::string Generate(const std::string& prompt) = 0;

  virtual std::string Name() const = 0;
};

} // namespace datagraph::llm
