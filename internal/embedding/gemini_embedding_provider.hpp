#pragma once

#include <memory>

#include "config/config.pb.h"
#include "embedding_provider.hpp"
#include "internal/net/http_client.hpp"

namespace datagraph::embedding {

/*
  Gemini embedContent client.

    POST {base_url}/models/{model}:embedContent
    header x-goog-api-key: <key>
*/
class GeminiEmbeddingProvider final : public EmbeddingProvider {
 public:
  static constexpr const char* kDefaultModel   = "text-embedding-004";
  static constexpr const char* kDefaultBaseUrl = "https://generativelanguage.googleapis.com/v1beta";
  static constexpr const char* kDefaultKeyEnv  = "GEMINI_API_KEY";

  // Throws util::NotReady when the API key variable is unset or empty.
  GeminiEmbeddingProvider(const runtime::config::EmbeddingConfig& config, std::shared_ptr<net::HttpClient> http);

  std::vector<float> Embed(const std::string& text) override;

  std::size_t Dimensions() const override {
    return dimensions_;
  }

  std::string Name() const override {
    return "gemini";
  }

 private:
  std::shared_ptr<net::HttpClient> http_;
  std::string                      model_;
  std::string                      url_;
  std::string                      api_key_;
  std::size_t                      dimensions_;
  net::RetryPolicy                 retry_;
};

} // namespace datagraph::embedding
