#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define SESSIONKEEPER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define SESSIONKEEPER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace sessionkeeper::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::chrono::milliseconds g_export_interval{1000};

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

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      resume_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   live_sessions_gauge;

  std::atomic<std::int64_t> live_sessions{0};
};

bool InitializeMetrics(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = g_export_interval;
#ifdef SESSIONKEEPER_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const sessionkeeper::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == sessionkeeper::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  if (observability.metrics_export_interval_ms() > 0) {
    g_export_interval = std::chrono::milliseconds(observability.metrics_export_interval_ms());
  }

  return InitializeMetrics(otlp_config);
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
  impl_->meter  = provider->GetMeter("sessionkeeper", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("sessionkeeper.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("sessionkeeper.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->transition_count   = impl_->meter->CreateUInt64Counter("sessionkeeper.session.transitions", "1", "Session state transitions by kind");
  impl_->resume_duration_ms = impl_->meter->CreateDoubleHistogram("sessionkeeper.recovery.resume_ms", "ms", "Driver resume duration in milliseconds");
  impl_->live_sessions_gauge = impl_->meter->CreateInt64ObservableGauge("sessionkeeper.session.live", "Sessions with a live handle in this process", "1");
  impl_->live_sessions_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->live_sessions.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordTransition(std::string_view kind) {
  if (!impl_ || !impl_->transition_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  AddWithAttributes(impl_->transition_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveResumeDurationMs(std::string_view outcome, double duration_ms) {
  if (!impl_ || !impl_->resume_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  RecordWithAttributes(impl_->resume_duration_ms, duration_ms, attributes);
}

void Metrics::SetLiveSessions(std::uint64_t count) {
  if (!impl_) {
    return;
  }
  impl_->live_sessions.store(static_cast<std::int64_t>(count));
}

} // namespace sessionkeeper::observability

#endif
