#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sessionkeeper::runtime::config {
class RuntimeConfig;
}

namespace sessionkeeper::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"sessionkeeper"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const sessionkeeper::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const sessionkeeper::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

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
  // Safe to call from several threads while the scope is alive.
  void AddSessionEvent(std::string_view name, std::string_view session_id);
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

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  // kind is the transition event name, e.g. "resume-claimed".
  void RecordTransition(std::string_view kind);
  void ObserveResumeDurationMs(std::string_view outcome, double duration_ms);
  void SetLiveSessions(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const sessionkeeper::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const sessionkeeper::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::AddSessionEvent(std::string_view, std::string_view) {
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

inline void Metrics::RecordTransition(std::string_view) {
}

inline void Metrics::ObserveResumeDurationMs(std::string_view, double) {
}

inline void Metrics::SetLiveSessions(std::uint64_t) {
}
#endif

} // namespace sessionkeeper::observability
