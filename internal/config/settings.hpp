#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace fleet::config {

struct JobSettings {
  bool          enabled     = true;
  std::int64_t  interval_ms = 10'000;
  std::size_t   batch_size  = 50;
};

// Per-state age after which the recovery job force-fails a row.
struct RecoverySettings {
  std::int64_t provisioning_seconds = 30 * 60;
  std::int64_t booting_seconds      = 2 * 3600 + 10 * 60;
  std::int64_t installing_seconds   = 2 * 3600 + 10 * 60;
  std::int64_t starting_seconds     = 45 * 60;
  std::int64_t draining_seconds     = 30 * 60;
  std::int64_t terminating_seconds  = 3600;
};

struct LifecycleSettings {
  std::int64_t heartbeat_trust_seconds            = 30;
  std::int64_t boot_timeout_seconds               = 2 * 3600;
  std::int64_t model_load_timeout_seconds         = 30 * 60;
  std::int64_t health_check_lease_seconds         = 10;
  std::int64_t reconciliation_lease_seconds       = 30;
  std::int64_t watch_dog_recheck_seconds          = 60;
  std::int64_t provisioning_requeue_after_seconds = 30;
  std::int32_t provisioning_max_retries           = 5;
  std::int32_t provisioning_ip_attempts           = 10;
  std::int64_t provisioning_ip_interval_ms        = 2000;
  std::int32_t startup_recovery_max_attempts      = 3;
  std::int32_t terminate_max_attempts             = 5;
  std::int32_t health_check_max_failures          = 30;
  RecoverySettings recovery;
};

struct RoutingSettings {
  std::int64_t worker_stale_seconds = 300;
};

struct WorkerSettings {
  std::uint32_t health_port         = 8080;
  std::uint32_t vllm_port           = 8000;
  std::uint32_t reachability_port   = 22;
  std::int64_t  probe_timeout_ms    = 3000;
  bool          require_worker_auth = false;
};

/*
  RuntimeConfig with every zero/absent value replaced by its default.
  Components take these plain structs, never the proto.
*/
struct Settings {
  std::string bind_address = "0.0.0.0:50051";

  JobSettings health_check;
  JobSettings terminator;
  JobSettings watch_dog;
  JobSettings provisioning_requeue;
  JobSettings recovery_job;

  LifecycleSettings lifecycle;
  RoutingSettings   routing;
  WorkerSettings    worker;

  std::size_t bus_capacity      = 1024;
  std::size_t bus_max_in_flight = 16;

  std::vector<fleet::runtime::config::ProviderConfig> providers;
};

// Throws util::InvalidArgument on inconsistent provider entries.
Settings ResolveSettings(const fleet::runtime::config::RuntimeConfig& config);

} // namespace fleet::config
