#include "gemini_embedding_provider.hpp"

#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>

#include "datagraph/llm/v1/gemini.pb.h"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace datagraph::embedding {

namespace {

std::string ValueOr(const std::string& value, const char* fallback) {
  return value.empty() ? std::string(fallback) : value;
}

} // namespace

GeminiEmbeddingProvider::GeminiEmbeddingProvider(const runtime::config::EmbeddingConfig& config, std::shared_ptr<net::HttpClient> http)
    : http_(std::move(http)),
      model_(ValueOr(config.model(), kDefaultModel)),
      dimensions_(config.dimensions() > 0 ? config.dimensions() : 768) {
  const auto key_env = ValueOr(config.api_key_env(), kDefaultKeyEnv);
  const char* key    = std::getenv(key_env.c_str());
  if (!key || !*key) {
    throw util::NotReady("embedding API key not set: " + key_env);
  }
  api_key_ = key;
  url_     = ValueOr(config.base_url(), kDefaultBaseUrl) + "/models/" + model_ + ":embedContent";

  if (config.timeout_ms() > 0) retry_.timeout = std::chrono::milliseconds(config.timeout_ms());
  if (config.max_retries() > 0) retry_.max_retries = config.max_retries();
}

std::vector<float> GeminiEmbeddingProvider::Embed(const std::string& text) {
  llm::v1::EmbedContentRequest request;
  request.set_model("models/" + model_);
  request.mutable_content()->add_parts()->set_text(text);
  request.set_output_dimensionality(static_cast<uint32_t>(dimensions_));

  std::string body;
  auto        status = google::protobuf::util::MessageToJsonString(request, &body);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode embed request: " + std::string(status.message()));
  }

  const auto start = std::chrono::steady_clock::now();
  auto response_body =
      net::PostWithRetry(*http_, url_, body, {"Content-Type: application/json", "x-goog-api-key: " + api_key_}, retry_, "gemini embedContent");
  observability::Metrics::Instance().ObserveProviderLatencyMs(
      "gemini", "embed", std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());

  llm::v1::EmbedContentResponse response;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  status = google::protobuf::util::JsonStringToMessage(response_body, &response, options);
  if (!status.ok()) {
    throw util::UpstreamError("malformed embedContent response: " + std::string(status.message()));
  }

  const auto& values = response.embedding().values();
  if (static_cast<std::size_t>(values.size()) != dimensions_) {
    throw util::UpstreamError("embedContent returned " + std::to_string(values.size()) + " values, expected " + std::to_string(dimensions_));
  }
  return {values.begin(), values.end()};
}

} // namespace datagraph::embedding
