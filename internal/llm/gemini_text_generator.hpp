#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/net/http_client.hpp"
#include "text_generator.hpp"

namespace datagraph::llm {

/*
  Gemini generateContent client.

    POST {base_url}/models/{model}:generateContent
    header x-goog-api-key: <key>

  Requests JSON output (responseMimeType application/json) and returns the
  concatenated text parts of the first candidate.
*/
class GeminiTextGenerator final : public TextGenerator {
 public:
  static constexpr const char* kDefaultModel   = "gemini-2.5-flash-lite";
  static constexpr const char* kDefaultBaseUrl = "https://generativelanguage.googleapis.com/v1beta";
  static constexpr const char* kDefaultKeyEnv  = "GEMINI_API_KEY";

  // Throws util::NotReady when the API key variable is unset or empty.
  GeminiTextGenerator(const runtime::config::GenerationConfig& config, std::shared_ptr<net::HttpClient> http);

  std::string Generate(const std::string& prompt) override;

  std::string Name() const override {
    return "gemini";
  }

 private:
  std::shared_ptr<net::HttpClient> http_;
  std::string                      url_;
  std::string                      api_key_;
  double                           temperature_;
  uint32_t                         max_output_tokens_;
  net::RetryPolicy                 retry_;
};

} // namespace datagraph::llm
