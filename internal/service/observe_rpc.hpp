#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sessionkeeper::service {

/*
  Wraps one RPC body with a span, request metrics and an error log line.
  Exceptions propagate unchanged to the transport adapter.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& session_id, Fn&& fn) {
  sessionkeeper::observability::SpanScope span(route);
  if (!session_id.empty()) {
    span.SetAttribute("session.id", session_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    sessionkeeper::observability::Metrics::Instance().RecordRequest(route, success);
    sessionkeeper::observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    SESSIONKEEPER_LOG_ERROR("RPC failed", {sessionkeeper::observability::StringField("route", route),
                                           sessionkeeper::observability::StringField("error", ex.what()),
                                           sessionkeeper::observability::StringField("session_id", session_id)});
    finish(false);
    throw;
  }
}

} // namespace sessionkeeper::service
