#pragma once

#include <string>
#include <vector>

namespace fleet::db::sql {

/*
  Canonical table layout shared by the SQL backends.

  All timestamps are BIGINT unix milliseconds, NULL = not set.
  The partial unique indexes enforce:
    - one live row per (instance, provider volume)
    - one active instance per (ip, worker port)
*/

// Bumped whenever a statement below changes shape. A store stamped with a
// newer version is refused at startup.
inline constexpr int kSchemaVersion = 1;

// Column order used by every instance SELECT / RETURNING.
inline constexpr const char* kInstanceColumns =
    "id,provider_code,zone,instance_type,model_id,image_id,data_volume_gb,"
    "provider_instance_id,ip_address,status,"
    "created_at_ms,boot_started_at_ms,installing_started_at_ms,starting_started_at_ms,ready_at_ms,"
    "draining_started_at_ms,terminating_started_at_ms,terminated_at_ms,failed_at_ms,archived_at_ms,"
    "error_code,error_message,retry_count,startup_recoveries,termination_attempts,health_check_failures,"
    "last_health_check_ms,last_reconciliation_ms,deletion_reason,deleted_by_provider,is_archived,"
    "worker_last_heartbeat_ms,worker_status,worker_model_id,worker_health_port,worker_vllm_port,"
    "worker_queue_depth,worker_gpu_utilization,worker_metadata";

inline constexpr const char* kVolumeColumns =
    "id,instance_id,provider_volume_id,volume_name,volume_type,size_bytes,is_boot,delete_on_terminate,"
    "status,created_at_ms,attached_at_ms,deleted_at_ms,reconciled_at_ms,error_message";

// Columns 1..kInstanceLifecycleColumnCount of kInstanceColumns are lifecycle
// columns, the rest are worker columns.
inline constexpr int kInstanceLifecycleColumnCount = 31;
inline constexpr int kInstanceColumnCount          = 39;

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS instances ("
      " id TEXT PRIMARY KEY, provider_code TEXT NOT NULL, zone TEXT NOT NULL, instance_type TEXT NOT NULL,"
      " model_id TEXT, image_id TEXT, data_volume_gb INTEGER NOT NULL DEFAULT 0,"
      " provider_instance_id TEXT, ip_address TEXT, status TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL, boot_started_at_ms INTEGER, installing_started_at_ms INTEGER,"
      " starting_started_at_ms INTEGER, ready_at_ms INTEGER, draining_started_at_ms INTEGER,"
      " terminating_started_at_ms INTEGER, terminated_at_ms INTEGER, failed_at_ms INTEGER, archived_at_ms INTEGER,"
      " error_code TEXT, error_message TEXT,"
      " retry_count INTEGER NOT NULL DEFAULT 0, startup_recoveries INTEGER NOT NULL DEFAULT 0,"
      " termination_attempts INTEGER NOT NULL DEFAULT 0, health_check_failures INTEGER NOT NULL DEFAULT 0,"
      " last_health_check_ms INTEGER, last_reconciliation_ms INTEGER,"
      " deletion_reason TEXT, deleted_by_provider INTEGER NOT NULL DEFAULT 0, is_archived INTEGER NOT NULL DEFAULT 0,"
      " worker_last_heartbeat_ms INTEGER, worker_status TEXT, worker_model_id TEXT,"
      " worker_health_port INTEGER, worker_vllm_port INTEGER, worker_queue_depth INTEGER,"
      " worker_gpu_utilization REAL, worker_metadata TEXT);",
      "CREATE INDEX IF NOT EXISTS ix_instances_status ON instances(status);",
      "CREATE INDEX IF NOT EXISTS ix_instances_provider_resource ON instances(provider_code, provider_instance_id);",
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_instances_ip_health_port ON instances(ip_address, worker_health_port)"
      " WHERE status IN ('booting','installing','starting','ready','draining')"
      " AND ip_address IS NOT NULL AND worker_health_port IS NOT NULL;",
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_instances_ip_vllm_port ON instances(ip_address, worker_vllm_port)"
      " WHERE status IN ('booting','installing','starting','ready','draining')"
      " AND ip_address IS NOT NULL AND worker_vllm_port IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS instance_state_history ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT, instance_id TEXT NOT NULL REFERENCES instances(id),"
      " from_status TEXT NOT NULL, to_status TEXT NOT NULL, reason TEXT, metadata TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ix_state_history_instance ON instance_state_history(instance_id, id);",
      "CREATE TABLE IF NOT EXISTS instance_volumes ("
      " id TEXT PRIMARY KEY, instance_id TEXT NOT NULL REFERENCES instances(id), provider_volume_id TEXT NOT NULL,"
      " volume_name TEXT, volume_type TEXT, size_bytes INTEGER NOT NULL DEFAULT 0,"
      " is_boot INTEGER NOT NULL DEFAULT 0, delete_on_terminate INTEGER NOT NULL DEFAULT 1, status TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL, attached_at_ms INTEGER, deleted_at_ms INTEGER, reconciled_at_ms INTEGER,"
      " error_message TEXT);",
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_instance_volumes_live ON instance_volumes(instance_id, provider_volume_id)"
      " WHERE status <> 'deleted';",
      "CREATE TABLE IF NOT EXISTS worker_auth_tokens ("
      " instance_id TEXT PRIMARY KEY REFERENCES instances(id), token_hash TEXT NOT NULL, token_prefix TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL, last_seen_at_ms INTEGER, revoked_at_ms INTEGER);",
      "CREATE TABLE IF NOT EXISTS action_logs ("
      " id TEXT PRIMARY KEY, instance_id TEXT NOT NULL, action_type TEXT NOT NULL, status TEXT NOT NULL,"
      " error_message TEXT, metadata TEXT, created_at_ms INTEGER NOT NULL, completed_at_ms INTEGER, duration_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS ix_action_logs_instance ON action_logs(instance_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS catalog_instance_types ("
      " provider_code TEXT NOT NULL, zone TEXT NOT NULL, code TEXT NOT NULL, name TEXT, cost_per_hour REAL,"
      " cpu_count INTEGER, ram_gb INTEGER, gpu_count INTEGER, vram_per_gpu_gb INTEGER, bandwidth_bps INTEGER,"
      " updated_at_ms INTEGER NOT NULL, PRIMARY KEY(provider_code, zone, code));"};
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS instances ("
      " id TEXT PRIMARY KEY, provider_code TEXT NOT NULL, zone TEXT NOT NULL, instance_type TEXT NOT NULL,"
      " model_id TEXT, image_id TEXT, data_volume_gb INTEGER NOT NULL DEFAULT 0,"
      " provider_instance_id TEXT, ip_address TEXT, status TEXT NOT NULL,"
      " created_at_ms BIGINT NOT NULL, boot_started_at_ms BIGINT, installing_started_at_ms BIGINT,"
      " starting_started_at_ms BIGINT, ready_at_ms BIGINT, draining_started_at_ms BIGINT,"
      " terminating_started_at_ms BIGINT, terminated_at_ms BIGINT, failed_at_ms BIGINT, archived_at_ms BIGINT,"
      " error_code TEXT, error_message TEXT,"
      " retry_count INTEGER NOT NULL DEFAULT 0, startup_recoveries INTEGER NOT NULL DEFAULT 0,"
      " termination_attempts INTEGER NOT NULL DEFAULT 0, health_check_failures INTEGER NOT NULL DEFAULT 0,"
      " last_health_check_ms BIGINT, last_reconciliation_ms BIGINT,"
      " deletion_reason TEXT, deleted_by_provider BOOLEAN NOT NULL DEFAULT FALSE, is_archived BOOLEAN NOT NULL DEFAULT FALSE,"
      " worker_last_heartbeat_ms BIGINT, worker_status TEXT, worker_model_id TEXT,"
      " worker_health_port INTEGER, worker_vllm_port INTEGER, worker_queue_depth INTEGER,"
      " worker_gpu_utilization DOUBLE PRECISION, worker_metadata TEXT);",
      "CREATE INDEX IF NOT EXISTS ix_instances_status ON instances(status);",
      "CREATE INDEX IF NOT EXISTS ix_instances_provider_resource ON instances(provider_code, provider_instance_id);",
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_instances_ip_health_port ON instances(ip_address, worker_health_port)"
      " WHERE status IN ('booting','installing','starting','ready','draining')"
      " AND ip_address IS NOT NULL AND worker_health_port IS NOT NULL;",
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_instances_ip_vllm_port ON instances(ip_address, worker_vllm_port)"
      " WHERE status IN ('booting','installing','starting','ready','draining')"
      " AND ip_address IS NOT NULL AND worker_vllm_port IS NOT NULL;",
      "CREATE TABLE IF NOT EXISTS instance_state_history ("
      " id BIGSERIAL PRIMARY KEY, instance_id TEXT NOT NULL REFERENCES instances(id),"
      " from_status TEXT NOT NULL, to_status TEXT NOT NULL, reason TEXT, metadata TEXT, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ix_state_history_instance ON instance_state_history(instance_id, id);",
      "CREATE TABLE IF NOT EXISTS instance_volumes ("
      " id TEXT PRIMARY KEY, instance_id TEXT NOT NULL REFERENCES instances(id), provider_volume_id TEXT NOT NULL,"
      " volume_name TEXT, volume_type TEXT, size_bytes BIGINT NOT NULL DEFAULT 0,"
      " is_boot BOOLEAN NOT NULL DEFAULT FALSE, delete_on_terminate BOOLEAN NOT NULL DEFAULT TRUE, status TEXT NOT NULL,"
      " created_at_ms BIGINT NOT NULL, attached_at_ms BIGINT, deleted_at_ms BIGINT, reconciled_at_ms BIGINT,"
      " error_message TEXT, seq BIGSERIAL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_instance_volumes_live ON instance_volumes(instance_id, provider_volume_id)"
      " WHERE status <> 'deleted';",
      "CREATE TABLE IF NOT EXISTS worker_auth_tokens ("
      " instance_id TEXT PRIMARY KEY REFERENCES instances(id), token_hash TEXT NOT NULL, token_prefix TEXT NOT NULL,"
      " created_at_ms BIGINT NOT NULL, last_seen_at_ms BIGINT, revoked_at_ms BIGINT);",
      "CREATE TABLE IF NOT EXISTS action_logs ("
      " id TEXT PRIMARY KEY, instance_id TEXT NOT NULL, action_type TEXT NOT NULL, status TEXT NOT NULL,"
      " error_message TEXT, metadata TEXT, created_at_ms BIGINT NOT NULL, completed_at_ms BIGINT, duration_ms BIGINT,"
      " seq BIGSERIAL);",
      "CREATE INDEX IF NOT EXISTS ix_action_logs_instance ON action_logs(instance_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS catalog_instance_types ("
      " provider_code TEXT NOT NULL, zone TEXT NOT NULL, code TEXT NOT NULL, name TEXT, cost_per_hour DOUBLE PRECISION,"
      " cpu_count INTEGER, ram_gb INTEGER, gpu_count INTEGER, vram_per_gpu_gb INTEGER, bandwidth_bps BIGINT,"
      " updated_at_ms BIGINT NOT NULL, PRIMARY KEY(provider_code, zone, code));"};
  return kStatements;
}

} // namespace fleet::db::sql
