#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace alo::service {

// Runs one RPC body under a span, recording request count and latency.
// Exceptions are logged and rethrown for the transport to translate.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view campaign_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!campaign_id.empty()) {
    span.SetAttribute("campaign.id", campaign_id);
  }

  auto&      metrics    = observability::Metrics::Instance();
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ALO_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                observability::StringField("campaign_id", campaign_id)});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace alo::service
