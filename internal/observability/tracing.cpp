#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace sessionkeeper::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace nostd     = opentelemetry::nostd;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName    = "sessionkeeper";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider> g_sdk_provider;
nostd::shared_ptr<trace_api::Tracer>      g_tracer;

// Explicit config first, then the standard OTLP variables, then the collector default.
std::string TracesEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) return value;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = TracesEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions http;
    http.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(http);
  }
  otlp::OtlpGrpcExporterOptions grpc;
  grpc.endpoint            = endpoint;
  grpc.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(grpc);
}

// Falls back to a provider someone else installed, e.g. a test harness.
nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});

  resource::ResourceAttributes attributes = {{"service.name", config.service_name}, {"service.version", std::string(kTracerVersion)}};

  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attributes));
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const sessionkeeper::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == sessionkeeper::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                            : OtlpTransport::kGrpc;
  return InitializeTracing(otlp_config);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
    g_sdk_provider.reset();
  }
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>  scope;

  bool Active() const { return static_cast<bool>(span); }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->Active()) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (!impl_ || !impl_->Active()) return;
  impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (!impl_ || !impl_->Active()) return;
  impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddSessionEvent(std::string_view name, std::string_view session_id) {
  if (!impl_ || !impl_->Active()) return;
  impl_->span->AddEvent(std::string(name), {{"session.id", nostd::string_view(session_id.data(), session_id.size())}});
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->Active()) return;
  const std::string message(description);
  impl_->span->AddEvent("exception", {{"exception.message", nostd::string_view(message)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace sessionkeeper::observability

#endif
