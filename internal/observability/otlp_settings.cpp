#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace fleet::observability {
namespace {

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

} // namespace

OtlpSettings ResolveOtlpSettings(const fleet::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& section = config.observability();
  const bool  traces  = signal == OtlpSignal::kTraces;

  OtlpSettings settings;
  settings.enabled = traces ? section.tracing_enabled() : section.metrics_enabled();
  settings.http    = section.transport() == fleet::runtime::config::OTLP_TRANSPORT_HTTP;
  settings.tls     = section.otlp_tls();

  if (const char* name = Env("OTEL_SERVICE_NAME")) {
    settings.service_name = name;
  } else {
    settings.service_name = section.service_name().empty() ? "fleet-orchestrator" : section.service_name();
  }

  if (!section.otlp_endpoint().empty()) {
    settings.endpoint = section.otlp_endpoint();
  } else if (const char* ep = Env(traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    settings.endpoint = ep;
  } else if (const char* ep = Env("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = ep;
  } else if (settings.http) {
    settings.endpoint = traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    settings.endpoint = "localhost:4317";
  }

  if (section.metrics_export_interval_ms() > 0) {
    settings.export_interval = std::chrono::milliseconds(section.metrics_export_interval_ms());
  }
  return settings;
}

} // namespace fleet::observability
