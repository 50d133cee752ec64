#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace datagraph::embedding {

/*
  Maps text to a fixed-size float vector.

  Implementations must be safe to call from several threads and must return
  exactly Dimensions() values. Failures are thrown (util::UpstreamError for
  remote providers).
*/
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> Embed(const std::string& text) = 0;

  virtual std::size_t Dimensions() const = 0;

  // "hashing", "gemini", ...
  virtual std::string Name() const = 0;
};

// Text embedded for an entity: the name, or "name: description" when a
// non-empty description exists.
inline std::string EmbeddingText(const std::string& name, const std::optional<std::string>& description) {
  if (!description || description->empty()) {
    return name;
  }
  return name + ": " + *description;
}

} // namespace datagraph::embedding
