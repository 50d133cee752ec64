#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace datagraph::net {

struct HttpResponse {
  long        status = 0;
  std::string body;
};

/*
  Minimal blocking HTTP client used by the hosted model providers.

  Post() throws std::runtime_error on transport failures only; any HTTP
  status is returned to the caller.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Post(const std::string& url, const std::string& body, const std::vector<std::string>& headers,
                            std::chrono::milliseconds timeout) = 0;
};

class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient();

  HttpResponse Post(const std::string& url, const std::string& body, const std::vector<std::string>& headers,
                    std::chrono::milliseconds timeout) override;
};

struct RetryPolicy {
  std::chrono::milliseconds timeout{30000};
  uint32_t                  max_retries = 3;
  std::chrono::milliseconds initial_backoff{500};
};

// 429 and 5xx are worth another attempt; other statuses are final.
bool IsRetryableStatus(long status);

/*
  POST with exponential backoff. Transport errors and retryable statuses are
  retried up to policy.max_retries extra attempts. Returns the body of a 2xx
  response, throws util::UpstreamError otherwise.
*/
std::string PostWithRetry(HttpClient& client, const std::string& url, const std::string& body, const std::vector<std::string>& headers,
                          const RetryPolicy& policy, const std::string& operation);

} // namespace datagraph::net
