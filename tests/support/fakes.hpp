#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/embedding/embedding_provider.hpp"
#include "internal/embedding/hashing_embedding_provider.hpp"
#include "internal/llm/text_generator.hpp"
#include "internal/net/http_client.hpp"
#include "internal/util/errors.hpp"

namespace datagraph::testing {

// Hashing embedder that counts calls and can be switched to fail.
class FakeEmbeddingProvider final : public embedding::EmbeddingProvider {
 public:
  explicit FakeEmbeddingProvider(std::size_t dimensions = 64) : inner_(dimensions) {
  }

  std::vector<float> Embed(const std::string& text) override {
    ++calls;
    if (fail) {
      throw util::UpstreamError("embedding unavailable");
    }
    last_text = text;
    return inner_.Embed(text);
  }

  std::size_t Dimensions() const override {
    return inner_.Dimensions();
  }

  std::string Name() const override {
    return "fake";
  }

  std::atomic<int>  calls{0};
  std::atomic<bool> fail{false};
  std::string       last_text;

 private:
  embedding::HashingEmbeddingProvider inner_;
};

// Replies with queued texts in order; an empty queue is a transport failure.
class ScriptedTextGenerator final : public llm::TextGenerator {
 public:
  void Push(std::string reply) {
    replies_.push_back(std::move(reply));
  }

  std::string Generate(const std::string& prompt) override {
    prompts.push_back(prompt);
    if (replies_.empty()) {
      throw util::UpstreamError("no scripted reply");
    }
    auto reply = std::move(replies_.front());
    replies_.pop_front();
    return reply;
  }

  std::string Name() const override {
    return "scripted";
  }

  std::vector<std::string> prompts;

 private:
  std::deque<std::string> replies_;
};

struct RecordedRequest {
  std::string              url;
  std::string              body;
  std::vector<std::string> headers;
};

// Returns queued responses; throws like a transport error when none is left.
class FakeHttpClient final : public net::HttpClient {
 public:
  void Push(long status, std::string body) {
    std::scoped_lock lock(mutex_);
    responses_.push_back({status, std::move(body)});
  }

  net::HttpResponse Post(const std::string& url, const std::string& body, const std::vector<std::string>& headers,
                         std::chrono::milliseconds) override {
    std::scoped_lock lock(mutex_);
    requests.push_back({url, body, headers});
    if (responses_.empty()) {
      throw std::runtime_error("connection refused");
    }
    auto response = std::move(responses_.front());
    responses_.pop_front();
    return response;
  }

  std::vector<RecordedRequest> requests;

 private:
  std::mutex                    mutex_;
  std::deque<net::HttpResponse> responses_;
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

} // namespace datagraph::testing
