#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_settings.hpp"

namespace {

using fleet::observability::BoolField;
using fleet::observability::DoubleField;
using fleet::observability::IntField;
using fleet::observability::OtlpSignal;
using fleet::observability::RenderFields;
using fleet::observability::ResolveOtlpSettings;
using fleet::observability::ScopedLogContext;
using fleet::observability::StringField;

void TestFieldRendering() {
  assert(RenderFields({}).empty());
  assert(RenderFields({StringField("zone", "fr-par-2"), IntField("retry_count", 3)}) == "zone=fr-par-2 retry_count=3");
  assert(RenderFields({BoolField("accepted", false), DoubleField("ms", 1.5)}) == "accepted=false ms=1.500");
}

void TestValuesAreQuotedWhenAmbiguous() {
  assert(RenderFields({StringField("reason", "scale down")}) == "reason=\"scale down\"");
  assert(RenderFields({StringField("error", "")}) == "error=\"\"");
  assert(RenderFields({StringField("error", "bad \"token\"")}) == "error=\"bad \\\"token\\\"\"");
  assert(RenderFields({StringField("query", "a=b")}) == "query=\"a=b\"");
}

void TestContextNestsAndUnwinds() {
  {
    ScopedLogContext job({StringField("job", "watch_dog")});
    assert(RenderFields({}) == "job=watch_dog");
    {
      ScopedLogContext row({StringField("instance_id", "i-1")});
      assert(RenderFields({StringField("server_id", "s-9")}) == "server_id=s-9 job=watch_dog instance_id=i-1");
    }
    assert(RenderFields({}) == "job=watch_dog");
  }
  assert(RenderFields({}).empty());
}

void TestContextIsPerThread() {
  ScopedLogContext outer({StringField("command_id", "c-1")});
  std::string      other;
  std::thread      worker([&] { other = RenderFields({IntField("n", 1)}); });
  worker.join();
  assert(other == "n=1");
  assert(RenderFields({IntField("n", 1)}) == "n=1 command_id=c-1");
}

void TestLinesReachDefaultLogger() {
  std::ostringstream out;
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_st>(out);
  auto logger = std::make_shared<spdlog::logger>("fleet-logging-test", sink);
  logger->set_pattern("%l %v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);

  {
    ScopedLogContext ctx({StringField("instance_id", "i-7")});
    FLEET_LOG_INFO("instance ready", {StringField("ip", "10.0.0.4")});
    FLEET_LOG_DEBUG("filtered out");
  }
  FLEET_LOG_WARN("bus full");
  logger->flush();

  assert(out.str() == "info instance ready ip=10.0.0.4 instance_id=i-7\nwarning bus full\n");
  spdlog::drop("fleet-logging-test");
}

void ClearOtelEnv() {
  unsetenv("OTEL_SERVICE_NAME");
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

void TestOtlpDefaultsPerSignal() {
  ClearOtelEnv();
  fleet::runtime::config::RuntimeConfig config;
  config.mutable_observability()->set_metrics_enabled(true);
  config.mutable_observability()->set_transport(fleet::runtime::config::OTLP_TRANSPORT_HTTP);

  auto traces  = ResolveOtlpSettings(config, OtlpSignal::kTraces);
  auto metrics = ResolveOtlpSettings(config, OtlpSignal::kMetrics);
  assert(!traces.enabled);
  assert(metrics.enabled);
  assert(traces.endpoint == "http://localhost:4318/v1/traces");
  assert(metrics.endpoint == "http://localhost:4318/v1/metrics");
  assert(metrics.service_name == "fleet-orchestrator");
  assert(metrics.export_interval.count() == 10000);

  config.mutable_observability()->set_transport(fleet::runtime::config::OTLP_TRANSPORT_GRPC);
  assert(ResolveOtlpSettings(config, OtlpSignal::kTraces).endpoint == "localhost:4317");
}

void TestOtlpEndpointPrecedence() {
  ClearOtelEnv();
  fleet::runtime::config::RuntimeConfig config;
  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "collector:4317", 1);
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "traces:4317", 1);
  setenv("OTEL_SERVICE_NAME", "fleet-eu", 1);

  assert(ResolveOtlpSettings(config, OtlpSignal::kTraces).endpoint == "traces:4317");
  assert(ResolveOtlpSettings(config, OtlpSignal::kMetrics).endpoint == "collector:4317");
  assert(ResolveOtlpSettings(config, OtlpSignal::kMetrics).service_name == "fleet-eu");

  // The config file beats the environment.
  config.mutable_observability()->set_otlp_endpoint("otel.internal:4317");
  config.mutable_observability()->set_metrics_export_interval_ms(2500);
  auto metrics = ResolveOtlpSettings(config, OtlpSignal::kMetrics);
  assert(metrics.endpoint == "otel.internal:4317");
  assert(metrics.export_interval.count() == 2500);
  ClearOtelEnv();
}

} // namespace

int main() {
  TestFieldRendering();
  TestValuesAreQuotedWhenAmbiguous();
  TestContextNestsAndUnwinds();
  TestContextIsPerThread();
  TestLinesReachDefaultLogger();
  TestOtlpDefaultsPerSignal();
  TestOtlpEndpointPrecedence();
  std::cout << "fleet_unit_observability: pass\n";
  return 0;
}
