#include "http_client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace datagraph::net {

namespace {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  size_t total_size = size * nmemb;
  userp->append(static_cast<char*>(contents), total_size);
  return total_size;
}

std::once_flag g_curl_init;

// Bounded excerpt of an upstream body for logs and error messages.
std::string Truncate(const std::string& body) {
  constexpr std::size_t kMax = 512;
  if (body.size() <= kMax) return body;
  return body.substr(0, kMax) + "...";
}

} // namespace

CurlHttpClient::CurlHttpClient() {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpClient::Post(const std::string& url, const std::string& body, const std::vector<std::string>& headers,
                                  std::chrono::milliseconds timeout) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize CURL");
  }

  HttpResponse       response;
  struct curl_slist* header_list = nullptr;

  for (const auto& header : headers) {
    header_list = curl_slist_append(header_list, header.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl);

  if (header_list) {
    curl_slist_free_all(header_list);
  }

  if (res != CURLE_OK) {
    std::string error = curl_easy_strerror(res);
    curl_easy_cleanup(curl);
    throw std::runtime_error("CURL request failed: " + error);
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  curl_easy_cleanup(curl);
  return response;
}

bool IsRetryableStatus(long status) {
  return status == 429 || (status >= 500 && status < 600);
}

std::string PostWithRetry(HttpClient& client, const std::string& url, const std::string& body, const std::vector<std::string>& headers,
                          const RetryPolicy& policy, const std::string& operation) {
  auto        backoff = policy.initial_backoff;
  std::string last_error;

  for (uint32_t attempt = 0; attempt <= policy.max_retries; ++attempt) {
    if (attempt > 0) {
      DATAGRAPH_LOG_WARN("retrying upstream call", {observability::StringField("operation", operation),
                                                    observability::IntField("attempt", attempt), observability::StringField("error", last_error)});
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }

    HttpResponse response;
    try {
      response = client.Post(url, body, headers, policy.timeout);
    } catch (const std::runtime_error& e) {
      last_error = e.what();
      continue;
    }

    if (response.status >= 200 && response.status < 300) {
      return std::move(response.body);
    }

    last_error = "HTTP " + std::to_string(response.status) + ": " + Truncate(response.body);
    if (!IsRetryableStatus(response.status)) {
      break;
    }
  }

  throw util::UpstreamError(operation + " failed: " + last_error);
}

} // namespace datagraph::net
