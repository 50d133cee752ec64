#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/embedding/gemini_embedding_provider.hpp"
#include "internal/embedding/hashing_embedding_provider.hpp"
#include "internal/llm/gemini_text_generator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/vector_math.hpp"
#include "tests/support/fakes.hpp"

namespace {

using datagraph::embedding::EmbeddingText;
using datagraph::embedding::GeminiEmbeddingProvider;
using datagraph::embedding::HashingEmbeddingProvider;
using datagraph::llm::GeminiTextGenerator;
using datagraph::testing::FakeHttpClient;
using datagraph::testing::Throws;
namespace net    = datagraph::net;
namespace util   = datagraph::util;
namespace config = datagraph::runtime::config;

constexpr const char* kKeyEnv = "DATAGRAPH_TEST_GEMINI_KEY";

bool HasHeader(const datagraph::testing::RecordedRequest& request, const std::string& header) {
  for (const auto& h : request.headers) {
    if (h == header) return true;
  }
  return false;
}

void TestEmbeddingText() {
  assert(EmbeddingText("CRM", std::nullopt) == "CRM");
  assert(EmbeddingText("CRM", std::string()) == "CRM");
  assert(EmbeddingText("CRM", std::string("sales")) == "CRM: sales");
}

void TestHashingEmbedderIsDeterministicAndNormalized() {
  HashingEmbeddingProvider embedder;
  assert(embedder.Dimensions() == HashingEmbeddingProvider::kDefaultDimensions);

  auto a = embedder.Embed("Customer Database");
  auto b = embedder.Embed("Customer Database");
  assert(a == b);
  assert(a.size() == 768);

  double norm = 0.0;
  for (float x : a) norm += static_cast<double>(x) * x;
  assert(std::fabs(norm - 1.0) < 1e-4);
}

void TestHashingEmbedderDistances() {
  HashingEmbeddingProvider embedder;

  auto near      = util::CosineDistance(embedder.Embed("AWS RDS"), embedder.Embed("AWS RDS Database"));
  auto case_only = util::CosineDistance(embedder.Embed("aws rds"), embedder.Embed("AWS RDS"));
  auto far       = util::CosineDistance(embedder.Embed("AWS RDS"), embedder.Embed("Employee Payroll Spreadsheet"));
  assert(near && case_only && far);
  assert(*near < 0.3);
  assert(*case_only < 1e-5);
  assert(*far > *near);
}

void TestHashingEmbedderRejectsZeroDimensions() {
  assert(Throws<std::invalid_argument>([] { HashingEmbeddingProvider embedder(0); }));
}

void TestGeminiEmbeddingRequiresKey() {
  unsetenv(kKeyEnv);
  config::EmbeddingConfig cfg;
  cfg.set_api_key_env(kKeyEnv);
  assert(Throws<util::NotReady>([&] { GeminiEmbeddingProvider provider(cfg, std::make_shared<FakeHttpClient>()); }));
}

void TestGeminiEmbeddingRequestAndResponse() {
  setenv(kKeyEnv, "secret", 1);
  config::EmbeddingConfig cfg;
  cfg.set_api_key_env(kKeyEnv);
  cfg.set_dimensions(3);
  cfg.set_base_url("http://gemini.test/v1beta");

  auto http = std::make_shared<FakeHttpClient>();
  http->Push(200, R"({"embedding":{"values":[0.5,-0.25,1.0]}})");

  GeminiEmbeddingProvider provider(cfg, http);
  assert(provider.Name() == "gemini");
  auto v = provider.Embed("CRM: sales");
  assert(v.size() == 3);
  assert(v[1] == -0.25f);

  assert(http->requests.size() == 1);
  const auto& request = http->requests[0];
  assert(request.url == "http://gemini.test/v1beta/models/text-embedding-004:embedContent");
  assert(HasHeader(request, "x-goog-api-key: secret"));
  assert(request.body.find("\"model\":\"models/text-embedding-004\"") != std::string::npos);
  assert(request.body.find("\"outputDimensionality\":3") != std::string::npos);
  assert(request.body.find("CRM: sales") != std::string::npos);
}

void TestGeminiEmbeddingDimensionMismatch() {
  setenv(kKeyEnv, "secret", 1);
  config::EmbeddingConfig cfg;
  cfg.set_api_key_env(kKeyEnv);
  cfg.set_dimensions(4);

  auto http = std::make_shared<FakeHttpClient>();
  http->Push(200, R"({"embedding":{"values":[0.5]}})");
  GeminiEmbeddingProvider provider(cfg, http);
  assert(Throws<util::UpstreamError>([&] { provider.Embed("x"); }));
}

void TestGeminiGeneratorConcatenatesParts() {
  setenv(kKeyEnv, "secret", 1);
  config::GenerationConfig cfg;
  cfg.set_api_key_env(kKeyEnv);
  cfg.set_base_url("http://gemini.test/v1beta");
  cfg.set_temperature(0.1);

  auto http = std::make_shared<FakeHttpClient>();
  http->Push(200, R"({"candidates":[{"content":{"role":"model","parts":[{"text":"{\"nodes\""},{"text":":[]}"}]},"finishReason":"STOP"}],"modelVersion":"x"})");

  GeminiTextGenerator generator(cfg, http);
  assert(generator.Generate("hello") == R"({"nodes":[]})");

  const auto& request = http->requests[0];
  assert(request.url == "http://gemini.test/v1beta/models/gemini-2.5-flash-lite:generateContent");
  assert(request.body.find("\"responseMimeType\":\"application/json\"") != std::string::npos);
  assert(request.body.find("\"maxOutputTokens\":8192") != std::string::npos);
  assert(request.body.find("\"role\":\"user\"") != std::string::npos);
}

void TestGeminiGeneratorWithoutCandidatesFails() {
  setenv(kKeyEnv, "secret", 1);
  config::GenerationConfig cfg;
  cfg.set_api_key_env(kKeyEnv);

  auto http = std::make_shared<FakeHttpClient>();
  http->Push(200, R"({"candidates":[]})");
  GeminiTextGenerator generator(cfg, http);
  assert(Throws<util::UpstreamError>([&] { generator.Generate("hello"); }));
}

void TestRetryOnTransientFailures() {
  net::RetryPolicy policy;
  policy.initial_backoff = std::chrono::milliseconds(1);
  policy.max_retries     = 3;

  FakeHttpClient http;
  http.Push(503, "busy");
  http.Push(429, "slow down");
  http.Push(200, "ok");
  assert(net::PostWithRetry(http, "http://x", "{}", {}, policy, "test") == "ok");
  assert(http.requests.size() == 3);
}

void TestNoRetryOnClientErrors() {
  net::RetryPolicy policy;
  policy.initial_backoff = std::chrono::milliseconds(1);

  FakeHttpClient http;
  http.Push(400, R"({"error":{"code":400,"message":"bad"}})");
  http.Push(200, "never reached");
  assert(Throws<util::UpstreamError>([&] { net::PostWithRetry(http, "http://x", "{}", {}, policy, "test"); }));
  assert(http.requests.size() == 1);
}

void TestRetriesAreBounded() {
  net::RetryPolicy policy;
  policy.initial_backoff = std::chrono::milliseconds(1);
  policy.max_retries     = 2;

  // no queued responses: every attempt is a transport error
  FakeHttpClient http;
  assert(Throws<util::UpstreamError>([&] { net::PostWithRetry(http, "http://x", "{}", {}, policy, "test"); }));
  assert(http.requests.size() == 3);

  assert(net::IsRetryableStatus(500));
  assert(net::IsRetryableStatus(429));
  assert(!net::IsRetryableStatus(404));
}

} // namespace

int main() {
  TestEmbeddingText();
  TestHashingEmbedderIsDeterministicAndNormalized();
  TestHashingEmbedderDistances();
  TestHashingEmbedderRejectsZeroDimensions();
  TestGeminiEmbeddingRequiresKey();
  TestGeminiEmbeddingRequestAndResponse();
  TestGeminiEmbeddingDimensionMismatch();
  TestGeminiGeneratorConcatenatesParts();
  TestGeminiGeneratorWithoutCandidatesFails();
  TestRetryOnTransientFailures();
  TestNoRetryOnClientErrors();
  TestRetriesAreBounded();

  std::cout << "datagraph_unit_providers: pass\n";
  return 0;
}
