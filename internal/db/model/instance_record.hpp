#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/instance_status.hpp"

namespace fleet::db::model {

/*
  Worker-reported columns of an instance row.

  Single writer: only heartbeat/registration updates these, and lifecycle
  updates never touch them.
*/
struct WorkerFields {
  std::int64_t          last_heartbeat_ms = 0; // 0 = never reported
  std::string           status;
  std::string           model_id;
  std::uint32_t         health_port = 0; // 0 = unknown
  std::uint32_t         vllm_port   = 0;
  std::optional<std::int32_t> queue_depth;
  std::optional<double>       gpu_utilization;
  std::string           metadata_json;
};

/*
  Persistent instance row.

  IMPORTANT:
  - status is only written through guarded updates (see Repository::UpdateInstance).
  - All timestamps are unix milliseconds, 0 = not set.
*/
struct InstanceRecord {
  std::string id;

  std::string   provider_code;
  std::string   zone;
  std::string   instance_type;
  std::string   model_id;
  std::string   image_id;
  std::uint32_t data_volume_gb = 0;

  std::string provider_instance_id;
  std::string ip_address;

  fleet::model::InstanceStatus status = fleet::model::InstanceStatus::kProvisioning;

  std::int64_t created_at_ms             = 0;
  std::int64_t boot_started_at_ms        = 0;
  std::int64_t installing_started_at_ms  = 0;
  std::int64_t starting_started_at_ms    = 0;
  std::int64_t ready_at_ms               = 0;
  std::int64_t draining_started_at_ms    = 0;
  std::int64_t terminating_started_at_ms = 0;
  std::int64_t terminated_at_ms          = 0;
  std::int64_t failed_at_ms              = 0;
  std::int64_t archived_at_ms            = 0;

  std::string error_code;
  std::string error_message;

  std::int32_t retry_count           = 0;
  std::int32_t startup_recoveries    = 0;
  std::int32_t termination_attempts  = 0;
  std::int32_t health_check_failures = 0;

  // Lease columns used by the reconciliation jobs.
  std::int64_t last_health_check_ms   = 0;
  std::int64_t last_reconciliation_ms = 0;

  std::string deletion_reason;
  bool        deleted_by_provider = false;
  bool        is_archived         = false;

  WorkerFields worker;
};

} // namespace fleet::db::model
