#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace slotkeeper::service {

// One span per route; request count and latency are recorded on both paths. Errors are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };
  const auto record = [&](bool success) {
    const auto latency = elapsed_ms();
    observability::Metrics::Instance().RecordRequest(route, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, latency);
    return latency;
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      const auto latency = record(true);
      SLOTKEEPER_LOG_DEBUG("RPC ok", {observability::StringField("route", route),
                                      observability::IntField("latency_ms", static_cast<int64_t>(latency))});
      return;
    } else {
      auto       result  = fn();
      const auto latency = record(true);
      SLOTKEEPER_LOG_DEBUG("RPC ok", {observability::StringField("route", route),
                                      observability::IntField("latency_ms", static_cast<int64_t>(latency))});
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    const auto latency = record(false);
    SLOTKEEPER_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                        observability::IntField("latency_ms", static_cast<int64_t>(latency))});
    throw;
  }
}

} // namespace slotkeeper::service
