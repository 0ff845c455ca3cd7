#pragma once

#include <chrono>
#include <string>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpSettings {
  bool                      enabled{false};
  std::string               service_name;
  std::string               endpoint;
  bool                      http{false};
  bool                      tls{false};
  std::chrono::milliseconds export_interval{10000};
};

/*
  Resolves where and how one signal is exported. The endpoint comes from
  the config file, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the chosen
  transport. OTEL_SERVICE_NAME overrides the configured service name.
*/
OtlpSettings ResolveOtlpSettings(const fleet::runtime::config::RuntimeConfig& config, OtlpSignal signal);

} // namespace fleet::observability
