#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

// The reader factory moved between SDK releases.
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#define FLEET_HAS_READER_FACTORY 1
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#define FLEET_HAS_READER_FACTORY 1
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include <initializer_list>
#include <mutex>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_settings.hpp"

namespace fleet::observability {
namespace otel  = opentelemetry;
namespace sdkm  = opentelemetry::sdk::metrics;
namespace mapi  = opentelemetry::metrics;

namespace {

using Label   = std::pair<otel::nostd::string_view, otel::common::AttributeValue>;
using Labels  = std::initializer_list<Label>;
using Counter = otel::nostd::shared_ptr<mapi::Counter<std::uint64_t>>;
using Timer   = otel::nostd::shared_ptr<mapi::Histogram<double>>;

std::mutex                           g_meter_mutex;
std::shared_ptr<sdkm::MeterProvider> g_meter_provider;

std::unique_ptr<sdkm::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otel::exporter::otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otel::exporter::otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otel::exporter::otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.tls;
  return otel::exporter::otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkm::MetricReader> MakeReader(const OtlpSettings& settings) {
  sdkm::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = settings.export_interval;
  // an export must finish before the next collection starts
  options.export_timeout_millis = settings.export_interval / 2;
#ifdef FLEET_HAS_READER_FACTORY
  return sdkm::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), options);
#else
  return std::make_unique<sdkm::PeriodicExportingMetricReader>(MakeExporter(settings), options);
#endif
}

// Older SDKs take the reader as shared_ptr and the instruments without a context.
template <typename Provider>
void Attach(Provider& provider, std::unique_ptr<sdkm::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkm::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument>
void Bump(const Instrument& counter, std::uint64_t by, Labels labels) {
  if (!counter) return;
  if constexpr (requires { counter->Add(by, labels, otel::context::Context{}); }) {
    counter->Add(by, labels, otel::context::Context{});
  } else {
    counter->Add(by, labels);
  }
}

template <typename Instrument>
void Observe(const Instrument& timer, double ms, Labels labels) {
  if (!timer) return;
  if constexpr (requires { timer->Record(ms, labels, otel::context::Context{}); }) {
    timer->Record(ms, labels, otel::context::Context{});
  } else {
    timer->Record(ms, labels);
  }
}

std::string S(std::string_view text) {
  return std::string(text);
}

} // namespace

struct Metrics::Impl {
  otel::nostd::shared_ptr<mapi::Meter> meter;

  Counter requests;
  Timer   request_ms;
  Counter transitions;
  Timer   job_tick_ms;
  Counter job_claimed;
  Counter routing;
  Timer   provider_call_ms;
  Counter commands;
};

bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveOtlpSettings(config, OtlpSignal::kMetrics);
  if (!settings.enabled) {
    ShutdownMetrics();
    return false;
  }

  auto provider = std::make_shared<sdkm::MeterProvider>(
      std::unique_ptr<sdkm::ViewRegistry>(new sdkm::ViewRegistry()),
      otel::sdk::resource::Resource::Create({{"service.name", settings.service_name}}));
  Attach(*provider, MakeReader(settings));
  mapi::Provider::SetMeterProvider(otel::nostd::shared_ptr<mapi::MeterProvider>(provider));
  {
    std::lock_guard lock(g_meter_mutex);
    g_meter_provider = std::move(provider);
  }

  FLEET_LOG_INFO("metrics enabled", {StringField("endpoint", settings.endpoint),
                                     IntField("interval_ms", static_cast<std::int64_t>(settings.export_interval.count()))});
  return true;
}

void ShutdownMetrics() {
  std::shared_ptr<sdkm::MeterProvider> provider;
  {
    std::lock_guard lock(g_meter_mutex);
    provider = std::move(g_meter_provider);
  }
  if (!provider) return;
  provider->ForceFlush();
  provider->Shutdown();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto& m = *impl_;
  m.meter = mapi::Provider::GetMeterProvider()->GetMeter("fleet-orchestrator", "0.1.0");

  m.requests         = m.meter->CreateUInt64Counter("fleet.request.count", "1", "RPCs served");
  m.request_ms       = m.meter->CreateDoubleHistogram("fleet.request.latency_ms", "ms", "RPC latency");
  m.transitions      = m.meter->CreateUInt64Counter("fleet.instance.transitions", "1", "Applied lifecycle transitions");
  m.job_tick_ms      = m.meter->CreateDoubleHistogram("fleet.job.tick_ms", "ms", "Reconciliation job tick duration");
  m.job_claimed      = m.meter->CreateUInt64Counter("fleet.job.claimed", "1", "Instances claimed by reconciliation jobs");
  m.routing          = m.meter->CreateUInt64Counter("fleet.routing.selections", "1", "Worker selection outcomes");
  m.provider_call_ms = m.meter->CreateDoubleHistogram("fleet.provider.call_ms", "ms", "Cloud provider call latency");
  m.commands         = m.meter->CreateUInt64Counter("fleet.commands", "1", "Commands published to the bus");
}

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics metrics;
  return metrics;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  Bump(impl_->requests, 1, {{"route", S(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Observe(impl_->request_ms, latency_ms, {{"route", S(route)}});
}

void Metrics::RecordTransition(std::string_view from, std::string_view to) {
  Bump(impl_->transitions, 1, {{"from", S(from)}, {"to", S(to)}});
}

void Metrics::ObserveJobTickMs(std::string_view job, double duration_ms) {
  Observe(impl_->job_tick_ms, duration_ms, {{"job", S(job)}});
}

void Metrics::RecordJobItems(std::string_view job, std::uint64_t claimed) {
  if (claimed > 0) Bump(impl_->job_claimed, claimed, {{"job", S(job)}});
}

void Metrics::RecordRouting(std::string_view outcome) {
  Bump(impl_->routing, 1, {{"outcome", S(outcome)}});
}

void Metrics::ObserveProviderCallMs(std::string_view provider, std::string_view op, double duration_ms, bool success) {
  Observe(impl_->provider_call_ms, duration_ms, {{"provider", S(provider)}, {"op", S(op)}, {"success", success}});
}

void Metrics::RecordCommand(std::string_view kind, bool accepted) {
  Bump(impl_->commands, 1, {{"kind", S(kind)}, {"accepted", accepted}});
}

} // namespace fleet::observability

#else

namespace fleet::observability {

struct Metrics::Impl {};

bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownMetrics() {
}

Metrics::Metrics() = default;

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view, bool) {
}

void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

void Metrics::RecordTransition(std::string_view, std::string_view) {
}

void Metrics::ObserveJobTickMs(std::string_view, double) {
}

void Metrics::RecordJobItems(std::string_view, std::uint64_t) {
}

void Metrics::RecordRouting(std::string_view) {
}

void Metrics::ObserveProviderCallMs(std::string_view, std::string_view, double, bool) {
}

void Metrics::RecordCommand(std::string_view, bool) {
}

} // namespace fleet::observability

#endif
