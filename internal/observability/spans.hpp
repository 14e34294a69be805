#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace alo::runtime::config {
class RuntimeConfig;
}

namespace alo::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"alo-campaignd"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const alo::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const alo::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span: started on construction, ended on destruction, active for
  the enclosing scope. A no-op when built without ENABLE_OTEL or when no
  tracer provider is installed.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
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

  // RPC surface
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // delivery
  void RecordDeliveryOutcome(std::string_view status, std::uint64_t count = 1);
  void RecordCampaignFinished(std::string_view status);
  void ObserveBatchDurationMs(double duration_ms);

  // scheduler
  void RecordSweepPromotions(std::uint64_t promoted, std::uint64_t race_lost);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const alo::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const alo::runtime::config::RuntimeConfig&) {
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

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
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

inline void Metrics::RecordDeliveryOutcome(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordCampaignFinished(std::string_view) {
}

inline void Metrics::ObserveBatchDurationMs(double) {
}

inline void Metrics::RecordSweepPromotions(std::uint64_t, std::uint64_t) {
}
#endif

} // namespace alo::observability
