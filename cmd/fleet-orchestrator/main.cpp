#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

using fleet::observability::IntField;
using fleet::observability::StringField;

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
  g_stop_signal = signal;
}

struct Options {
  std::string config_path;
  bool        check_only{false};
};

void PrintUsage() {
  std::cerr << "usage: fleet-orchestrator [--check] [--config] <config.yaml>\n"
               "  --check   validate the configuration and exit\n"
               "  FLEET_CONFIG is used when no path is given\n";
}

bool ParseArgs(int argc, char** argv, Options& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      options.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return false;
    }
  }
  if (options.config_path.empty()) {
    if (const char* env = std::getenv("FLEET_CONFIG")) options.config_path = env;
  }
  return !options.config_path.empty();
}

void PrintSummary(const fleet::config::Settings& settings) {
  std::cout << "bind_address: " << settings.bind_address << "\n"
            << "providers: " << settings.providers.size() << "\n";
  for (const auto& provider : settings.providers) {
    std::cout << "  - " << provider.code() << " (" << provider.zones_size() << " zones)\n";
  }
  std::cout << "bus_capacity: " << settings.bus_capacity << "\n"
            << "worker_stale_seconds: " << settings.routing.worker_stale_seconds << "\n";
}

// Flushes telemetry on every exit path; logging goes last so shutdown lines are kept.
struct TelemetryGuard {
  ~TelemetryGuard() {
    fleet::observability::ShutdownMetrics();
    fleet::observability::ShutdownTracing();
    fleet::observability::ShutdownLogging();
  }
};

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, options)) {
    PrintUsage();
    return 1;
  }

  fleet::runtime::config::RuntimeConfig config;
  fleet::config::Settings               settings;
  try {
    config   = fleet::config::ConfigLoader::LoadFromYaml(options.config_path);
    settings = fleet::config::ResolveSettings(config);
  } catch (const std::exception& e) {
    std::cerr << "fleet-orchestrator: " << e.what() << "\n";
    return 1;
  }

  if (options.check_only) {
    PrintSummary(settings);
    return 0;
  }

  fleet::observability::InitializeLogging(config);
  TelemetryGuard telemetry;
  fleet::observability::InitializeTracing(config);
  fleet::observability::InitializeMetrics(config);

  try {
    auto app = fleet::factory::Build(config);

    fleet::runtime::Server server(app.settings.bind_address, std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    server.Start();
    FLEET_LOG_INFO("fleet orchestrator listening", {StringField("bind_address", app.settings.bind_address),
                                                    IntField("jobs", static_cast<std::int64_t>(app.jobs.size()))});

    while (g_stop_signal == 0) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    FLEET_LOG_INFO("stopping", {IntField("signal", g_stop_signal)});
    server.Stop();
    app.StopBackground();
  } catch (const std::exception& e) {
    FLEET_LOG_ERROR("fatal", {StringField("error", e.what())});
    return 2;
  }
  return 0;
}
