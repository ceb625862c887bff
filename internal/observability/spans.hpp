#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace forge::runtime::config {
class RuntimeConfig;
}

namespace forge::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"forge-orchestrator"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const forge::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const forge::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// OTLP resource attributes shared by the trace and metric providers:
// service identity plus the persistence and status backends in use.
std::vector<std::pair<std::string, std::string>> ServiceResourceAttributes(const forge::runtime::config::RuntimeConfig& config);

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

  // outcome is "completed" or "failed".
  void RecordFlowOutcome(std::string_view outcome);
  void ObserveNodeLatencyMs(std::string_view provider, double latency_ms);
  void RecordNodeUsage(std::string_view provider, std::int64_t input_tokens, std::int64_t output_tokens, double cost);
  void RecordDroppedMessage();
  void SetAttachedObservers(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const forge::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const forge::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordFlowOutcome(std::string_view) {
}

inline void Metrics::ObserveNodeLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordNodeUsage(std::string_view, std::int64_t, std::int64_t, double) {
}

inline void Metrics::RecordDroppedMessage() {
}

inline void Metrics::SetAttachedObservers(std::uint64_t) {
}
#endif

} // namespace forge::observability
