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

#include <mutex>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_settings.hpp"

namespace fleet::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

using TracerPtr = opentelemetry::nostd::shared_ptr<trace_api::Tracer>;

std::mutex                                g_tracing_mutex;
std::shared_ptr<sdktrace::TracerProvider> g_tracer_provider;
TracerPtr                                 g_tracer;

TracerPtr CurrentTracer() {
  std::lock_guard lock(g_tracing_mutex);
  return g_tracer;
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.tls;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const fleet::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveOtlpSettings(config, OtlpSignal::kTraces);
  if (!settings.enabled) {
    ShutdownTracing();
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  std::shared_ptr<sdktrace::TracerProvider> provider = sdktrace::TracerProviderFactory::Create(
      std::move(processor), opentelemetry::sdk::resource::Resource::Create({{"service.name", settings.service_name}}));

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));
  {
    std::lock_guard lock(g_tracing_mutex);
    g_tracer_provider = provider;
    g_tracer          = provider->GetTracer("fleet-orchestrator", "0.1.0");
  }

  FLEET_LOG_INFO("tracing enabled", {StringField("endpoint", settings.endpoint), BoolField("http", settings.http)});
  return true;
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard lock(g_tracing_mutex);
    provider = std::move(g_tracer_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 active;

  bool live() const {
    return span != nullptr;
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  impl_->span = tracer->StartSpan(std::string(name));
  for (const auto& field : CurrentLogContext()) {
    impl_->span->SetAttribute(field.key, field.value);
  }
  impl_->active = std::make_unique<trace_api::Scope>(impl_->span);
}

SpanScope::~SpanScope() {
  if (!impl_ || !impl_->live()) return;
  impl_->active.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->live()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->live()) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->live()) return;
  const std::string text(description);
  impl_->span->AddEvent("exception", {{"exception.message", text}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, text);
}

} // namespace fleet::observability

#else

namespace fleet::observability {

struct SpanScope::Impl {};

bool InitializeTracing(const fleet::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownTracing() {
}

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

void SpanScope::SetAttribute(std::string_view, double) {
}

void SpanScope::AddEvent(std::string_view) {
}

void SpanScope::RecordException(std::string_view) {
}

} // namespace fleet::observability

#endif
