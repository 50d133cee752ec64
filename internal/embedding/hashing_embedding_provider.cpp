#include "hashing_embedding_provider.hpp"

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include "internal/util/vector_math.hpp"

namespace datagraph::embedding {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ull;
constexpr uint64_t kFnvPrime  = 1099511628211ull;

uint64_t Fnv1a(std::string_view data, uint64_t seed = kFnvOffset) {
  uint64_t hash = seed;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

std::string Lower(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(std::size_t dimensions) : dimensions_(dimensions) {
  if (dimensions_ == 0) {
    throw std::invalid_argument("hashing embedder needs at least one dimension");
  }
}

std::vector<float> HashingEmbeddingProvider::Embed(const std::string& text) {
  std::vector<float> v(dimensions_, 0.0f);
  const std::string  lowered = Lower(text);

  auto add = [&](std::string_view feature, float weight) {
    const uint64_t h      = Fnv1a(feature);
    const auto     bucket = static_cast<std::size_t>(h % dimensions_);
    // top bit selects the sign
    const float sign = (h >> 63) ? -1.0f : 1.0f;
    v[bucket] += sign * weight;
  };

  // word tokens
  std::size_t i = 0;
  while (i < lowered.size()) {
    while (i < lowered.size() && !std::isalnum(static_cast<unsigned char>(lowered[i]))) ++i;
    std::size_t start = i;
    while (i < lowered.size() && std::isalnum(static_cast<unsigned char>(lowered[i]))) ++i;
    if (i > start) add(std::string_view(lowered).substr(start, i - start), 1.0f);
  }

  // character trigrams over the padded text
  const std::string padded = " " + lowered + " ";
  for (std::size_t k = 0; k + 3 <= padded.size(); ++k) {
    add(std::string_view(padded).substr(k, 3), 0.5f);
  }

  util::Normalize(v);
  return v;
}

} // namespace datagraph::embedding
