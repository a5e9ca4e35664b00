#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"

namespace heartbeat::service {

// Rejected input and failed auth are the caller's problem: warn, not error.
inline bool IsCallerError(const std::exception& ex) {
  return dynamic_cast<const util::ValidationError*>(&ex) != nullptr || dynamic_cast<const util::AuthError*>(&ex) != nullptr ||
         dynamic_cast<const util::NotFound*>(&ex) != nullptr;
}

/*
  Wraps one service call with a span, request metrics and a log line on
  failure. Exceptions are rethrown unchanged for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& tenant, Fn&& fn) {
  namespace obs = heartbeat::observability;

  obs::SpanScope span(route);
  span.SetAttribute("tenant", tenant);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    auto& metrics = obs::Metrics::Instance();
    metrics.RecordRequest(route, success);
    metrics.ObserveRequestLatencyMs(route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    const auto fields = {obs::StringField("route", route), obs::StringField("tenant", tenant), obs::StringField("error", ex.what())};
    if (IsCallerError(ex)) {
      obs::LogWarn("RPC rejected", fields);
    } else {
      obs::LogError("RPC failed", fields);
    }
    finish(false);
    throw;
  }
}

} // namespace heartbeat::service
