#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace graphdoc::runtime::config {
class RuntimeConfig;
}

namespace graphdoc::observability {

/*
  Tracing and metrics facade.

  Built with ENABLE_OTEL these export through OpenTelemetry OTLP;
  otherwise every type here is an inline no-op so call sites need no
  conditional compilation.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string               service_name{"graphdoc"};
  std::string               endpoint{};
  OtlpTransport             transport{OtlpTransport::kGrpc};
  bool                      insecure{true};
  std::chrono::milliseconds export_interval{1000};
};

OtlpConfig ToOtlpConfig(const graphdoc::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const graphdoc::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const graphdoc::runtime::config::RuntimeConfig& config);
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

  // outcome: "ok", "not_found" or the error class
  void RecordRequest(std::string_view operation, std::string_view outcome);
  void ObserveRequestLatencyMs(std::string_view operation, double latency_ms);
  void RecordStandardizerRepair(std::string_view shape);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const graphdoc::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const graphdoc::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordRequest(std::string_view, std::string_view) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordStandardizerRepair(std::string_view) {
}
#endif

} // namespace graphdoc::observability
