#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace infragraph::runtime::config {
class RuntimeConfig;
}

namespace infragraph::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string   service_name{"infragraph"};
  std::string   service_version{"0.1.0"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig OtlpConfigFrom(const infragraph::runtime::config::RuntimeConfig& config);

// Both return false (and leave the no-op provider installed) when the
// matching observability switch is off.
bool InitializeTracing(const infragraph::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const infragraph::runtime::config::RuntimeConfig& config);
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

  void RecordOperation(std::string_view operation, bool success);
  void ObserveOperationLatencyMs(std::string_view operation, double latency_ms);
  // rows moved up one tier by save / apply
  void AddPromotedRows(std::string_view to_tier, std::uint64_t rows);
  void AddPublishedEvents(std::uint64_t events);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline OtlpConfig OtlpConfigFrom(const infragraph::runtime::config::RuntimeConfig&) {
  return {};
}

inline bool InitializeTracing(const infragraph::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const infragraph::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::AddPromotedRows(std::string_view, std::uint64_t) {
}

inline void Metrics::AddPublishedEvents(std::uint64_t) {
}
#endif

} // namespace infragraph::observability
