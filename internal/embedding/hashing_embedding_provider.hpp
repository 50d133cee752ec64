#pragma once

#include "embedding_provider.hpp"

namespace datagraph::embedding {

/*
  Deterministic local embedder.

  Lower-cases the text, then hashes every word token and every character
  trigram (FNV-1a) into a signed bucket. The result is L2-normalized, so
  texts sharing most words and trigrams land close in cosine distance.
  Needs no network and no model files.
*/
class HashingEmbeddingProvider final : public EmbeddingProvider {
 public:
  static constexpr std::size_t kDefaultDimensions = 768;

  explicit HashingEmbeddingProvider(std::size_t dimensions = kDefaultDimensions);

  std::vector<float> Embed(const std::string& text) override;

  std::size_t Dimensions() const override {
    return dimensions_;
  }

  std::string Name() const override {
    return "hashing";
  }

 private:
  std::size_t dimensions_;
};

} // namespace datagraph::embedding
