#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace availability::service {

/*
  Runs one RPC body under a span, records request count and latency, and
  logs failures before rethrowing them to the transport layer.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& instructor_id, Fn&& fn) {
  availability::observability::SpanScope span(route);
  if (!instructor_id.empty()) {
    span.SetAttribute("instructor.id", instructor_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    availability::observability::Metrics::Instance().RecordRequest(route, success);
    availability::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    AVAILABILITY_LOG_ERROR("RPC failed", {availability::observability::StringField("route", route),
                                          availability::observability::StringField("instructor_id", instructor_id),
                                          availability::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace availability::service
