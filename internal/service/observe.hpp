#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "service_context.hpp"
#include "status.hpp"

namespace datagraph::service {

/*
  Runs one operation inside a span, records request count and latency, and
  logs failures with the route. Exceptions are rethrown.
*/
template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  datagraph::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool ok) {
    datagraph::observability::Metrics::Instance().RecordRequest(route, ok);
    datagraph::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DATAGRAPH_LOG_ERROR("operation failed", {datagraph::observability::StringField("route", route),
                                             datagraph::observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

/*
  Builds a Response for route: checks readiness, lets fn fill the response
  and sets status OK, or replaces the response with one carrying only the
  failure status.
*/
template <typename Response, typename Fn>
Response Respond(const ServiceContext& ctx, std::string_view route, Fn&& fn) {
  Response resp;
  try {
    ObserveCall(route, [&] {
      ctx.RequireReady();
      fn(resp);
    });
    *resp.mutable_status() = OkStatus();
  } catch (const std::exception& ex) {
    resp.Clear();
    *resp.mutable_status() = ToStatus(ex);
  }
  return resp;
}

} // namespace datagraph::service
