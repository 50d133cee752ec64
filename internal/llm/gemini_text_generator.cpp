#include "gemini_text_generator.hpp"

#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>

#include "datagraph/llm/v1/gemini.pb.h"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace datagraph::llm {

namespace {

std::string ValueOr(const std::string& value, const char* fallback) {
  return value.empty() ? std::string(fallback) : value;
}

} // namespace

GeminiTextGenerator::GeminiTextGenerator(const runtime::config::GenerationConfig& config, std::shared_ptr<net::HttpClient> http)
    : http_(std::move(http)),
      temperature_(config.temperature()),
      max_output_tokens_(config.max_output_tokens() > 0 ? config.max_output_tokens() : 8192) {
  const auto  key_env = ValueOr(config.api_key_env(), kDefaultKeyEnv);
  const char* key     = std::getenv(key_env.c_str());
  if (!key || !*key) {
    throw util::NotReady("generation API key not set: " + key_env);
  }
  api_key_ = key;
  url_     = ValueOr(config.base_url(), kDefaultBaseUrl) + "/models/" + ValueOr(config.model(), kDefaultModel) + ":generateContent";

  // generation is slower than embedding
  retry_.timeout = std::chrono::milliseconds(config.timeout_ms() > 0 ? config.timeout_ms() : 120000);
  if (config.max_retries() > 0) retry_.max_retries = config.max_retries();
}

std::string GeminiTextGenerator::Generate(const std::string& prompt) {
  v1::GenerateContentRequest request;
  auto*                      content = request.add_contents();
  content->set_role("user");
  content->add_parts()->set_text(prompt);
  request.mutable_generation_config()->set_temperature(temperature_);
  request.mutable_generation_config()->set_max_output_tokens(max_output_tokens_);
  request.mutable_generation_config()->set_response_mime_type("application/json");

  std::string body;
  auto        status = google::protobuf::util::MessageToJsonString(request, &body);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode generate request: " + std::string(status.message()));
  }

  const auto start = std::chrono::steady_clock::now();
  auto response_body = net::PostWithRetry(*http_, url_, body, {"Content-Type: application/json", "x-goog-api-key: " + api_key_}, retry_,
                                          "gemini generateContent");
  observability::Metrics::Instance().ObserveProviderLatencyMs(
      "gemini", "generate", std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());

  v1::GenerateContentResponse              response;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  status = google::protobuf::util::JsonStringToMessage(response_body, &response, options);
  if (!status.ok()) {
    throw util::UpstreamError("malformed generateContent response: " + std::string(status.message()));
  }
  if (response.candidates_size() == 0) {
    throw util::UpstreamError("generateContent returned no candidates");
  }

  std::string text;
  for (const auto& part : response.candidates(0).content().parts()) {
    text += part.text();
  }
  return text;
}

} // namespace datagraph::llm
