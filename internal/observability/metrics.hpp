#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Orchestrator instruments. Instance() binds to whatever meter provider is
  installed at first use, so InitializeMetrics must run before the first
  recording for anything to be exported.
*/
class Metrics {
 public:
  static Metrics& Instance();
  ~Metrics();

  // gRPC surface
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordTransition(std::string_view from, std::string_view to);
  void ObserveJobTickMs(std::string_view job, double duration_ms);
  void RecordJobItems(std::string_view job, std::uint64_t claimed);

  // outcome is one of selected, sticky, no_worker
  void RecordRouting(std::string_view outcome);

  void ObserveProviderCallMs(std::string_view provider, std::string_view op, double duration_ms, bool success);
  void RecordCommand(std::string_view kind, bool accepted);

 private:
  Metrics();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace fleet::observability
