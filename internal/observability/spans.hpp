#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace datagraph::runtime::config {
class RuntimeConfig;
}

namespace datagraph::observability {

/*
  Tracing and metrics.

  Without ENABLE_OTEL every entry point is an inline no-op. With it, spans and
  instruments export over OTLP as configured in the observability block.
  Initialize* return false when the block leaves that signal disabled.
*/

bool InitializeTracing(const datagraph::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const datagraph::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the enclosing scope; ended on destruction.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  // marks the span failed
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // service calls, by route
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // outbound embedding and generation calls
  void ObserveProviderLatencyMs(std::string_view provider, std::string_view op, double latency_ms);
  // item is "node" or "relationship"; outcome is the report label
  void RecordIngestedItems(std::string_view item, std::string_view outcome, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const datagraph::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const datagraph::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveProviderLatencyMs(std::string_view, std::string_view, double) {
}

inline void Metrics::RecordIngestedItems(std::string_view, std::string_view, std::uint64_t) {
}
#endif

} // namespace datagraph::observability
