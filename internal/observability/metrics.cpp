#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace forge::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> flow_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      node_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> node_tokens;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<double>>        node_cost;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dropped_messages;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   observers_gauge;

  std::atomic<std::int64_t> attached_observers{0};
};

bool InitializeMetrics(const forge::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == forge::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attributes;
  for (const auto& [key, value] : ServiceResourceAttributes(config)) {
    attributes.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }
  auto res   = resource::Resource::Create(attributes);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("forge-orchestrator", "0.1.0");

  impl_->flow_outcomes    = impl_->meter->CreateUInt64Counter("forge.flow.outcomes", "Finished flow executions by outcome", "1");
  impl_->node_latency_ms  = impl_->meter->CreateDoubleHistogram("forge.node.latency_ms", "Generation latency per agent node", "ms");
  impl_->node_tokens      = impl_->meter->CreateUInt64Counter("forge.node.tokens", "Tokens consumed by agent nodes", "1");
  impl_->node_cost        = impl_->meter->CreateDoubleCounter("forge.node.cost_usd", "Estimated spend of agent nodes", "USD");
  impl_->dropped_messages = impl_->meter->CreateUInt64Counter("forge.hub.dropped_messages", "Hub messages dropped on full observer queues", "1");
  impl_->observers_gauge  = impl_->meter->CreateInt64ObservableGauge("forge.hub.observers", "Observers attached to the hub", "1");
  impl_->observers_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->attached_observers.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordFlowOutcome(std::string_view outcome) {
  if (!impl_ || !impl_->flow_outcomes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->flow_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveNodeLatencyMs(std::string_view provider, double latency_ms) {
  if (!impl_ || !impl_->node_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"provider", std::string(provider)}};
  RecordWithAttributes(impl_->node_latency_ms, latency_ms, attributes);
}

void Metrics::RecordNodeUsage(std::string_view provider, std::int64_t input_tokens, std::int64_t output_tokens, double cost) {
  if (!impl_ || !impl_->node_tokens || !impl_->node_cost) {
    return;
  }

  const std::string provider_label(provider);
  if (input_tokens > 0) {
    const std::initializer_list<AttributePair> attributes = {{"provider", provider_label}, {"direction", "input"}};
    AddWithAttributes(impl_->node_tokens, static_cast<std::uint64_t>(input_tokens), attributes);
  }
  if (output_tokens > 0) {
    const std::initializer_list<AttributePair> attributes = {{"provider", provider_label}, {"direction", "output"}};
    AddWithAttributes(impl_->node_tokens, static_cast<std::uint64_t>(output_tokens), attributes);
  }
  if (cost > 0.0) {
    const std::initializer_list<AttributePair> attributes = {{"provider", provider_label}};
    AddWithAttributes(impl_->node_cost, cost, attributes);
  }
}

void Metrics::RecordDroppedMessage() {
  if (!impl_ || !impl_->dropped_messages) {
    return;
  }

  AddWithAttributes(impl_->dropped_messages, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::SetAttachedObservers(std::uint64_t count) {
  if (!impl_) {
    return;
  }

  impl_->attached_observers.store(static_cast<std::int64_t>(count));
}

} // namespace forge::observability

#endif
