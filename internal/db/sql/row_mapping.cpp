#include "row_mapping.hpp"

#include <sstream>
#include <stdexcept>

#include "schema.hpp"

namespace fleet::db::sql {

using fleet::model::InstanceStatus;

namespace {

InstanceStatus StatusFromColumn(const Row& row, int col) {
  const auto text   = row.GetText(col);
  auto       status = fleet::model::ParseInstanceStatus(text);
  if (!status) {
    throw std::runtime_error("unknown instance status in store: " + text);
  }
  return *status;
}

} // namespace

const std::vector<std::string>& InstanceColumnNames() {
  static const std::vector<std::string> kNames = [] {
    std::vector<std::string> names;
    std::stringstream        in(kInstanceColumns);
    std::string              name;
    while (std::getline(in, name, ',')) {
      names.push_back(name);
    }
    return names;
  }();
  return kNames;
}

Params InstanceParams(const model::InstanceRecord& r) {
  Params params = {
      r.id,
      r.provider_code,
      r.zone,
      r.instance_type,
      NullableText(r.model_id),
      NullableText(r.image_id),
      static_cast<int32_t>(r.data_volume_gb),
      NullableText(r.provider_instance_id),
      NullableText(r.ip_address),
      std::string(fleet::model::ToString(r.status)),
      r.created_at_ms,
      NullableMillis(r.boot_started_at_ms),
      NullableMillis(r.installing_started_at_ms),
      NullableMillis(r.starting_started_at_ms),
      NullableMillis(r.ready_at_ms),
      NullableMillis(r.draining_started_at_ms),
      NullableMillis(r.terminating_started_at_ms),
      NullableMillis(r.terminated_at_ms),
      NullableMillis(r.failed_at_ms),
      NullableMillis(r.archived_at_ms),
      NullableText(r.error_code),
      NullableText(r.error_message),
      r.retry_count,
      r.startup_recoveries,
      r.termination_attempts,
      r.health_check_failures,
      NullableMillis(r.last_health_check_ms),
      NullableMillis(r.last_reconciliation_ms),
      NullableText(r.deletion_reason),
      r.deleted_by_provider,
      r.is_archived,
  };
  auto worker = WorkerParams(r.worker);
  params.insert(params.end(), worker.begin(), worker.end());
  return params;
}

Params WorkerParams(const model::WorkerFields& w) {
  return {
      NullableMillis(w.last_heartbeat_ms),
      NullableText(w.status),
      NullableText(w.model_id),
      NullablePort(w.health_port),
      NullablePort(w.vllm_port),
      Nullable(w.queue_depth),
      Nullable(w.gpu_utilization),
      NullableText(w.metadata_json),
  };
}

Params VolumeParams(const model::VolumeRecord& r) {
  return {
      r.id,
      r.instance_id,
      r.provider_volume_id,
      NullableText(r.volume_name),
      NullableText(r.volume_type),
      static_cast<int64_t>(r.size_bytes),
      r.is_boot,
      r.delete_on_terminate,
      std::string(fleet::model::ToString(r.status)),
      r.created_at_ms,
      NullableMillis(r.attached_at_ms),
      NullableMillis(r.deleted_at_ms),
      NullableMillis(r.reconciled_at_ms),
      NullableText(r.error_message),
  };
}

model::InstanceRecord ReadInstance(const Row& row, int c) {
  model::InstanceRecord r;
  r.id                        = row.GetText(c + 0);
  r.provider_code             = row.GetText(c + 1);
  r.zone                      = row.GetText(c + 2);
  r.instance_type             = row.GetText(c + 3);
  r.model_id                  = row.GetText(c + 4);
  r.image_id                  = row.GetText(c + 5);
  r.data_volume_gb            = static_cast<uint32_t>(row.GetInt64(c + 6));
  r.provider_instance_id      = row.GetText(c + 7);
  r.ip_address                = row.GetText(c + 8);
  r.status                    = StatusFromColumn(row, c + 9);
  r.created_at_ms             = row.GetInt64(c + 10);
  r.boot_started_at_ms        = row.GetInt64(c + 11);
  r.installing_started_at_ms  = row.GetInt64(c + 12);
  r.starting_started_at_ms    = row.GetInt64(c + 13);
  r.ready_at_ms               = row.GetInt64(c + 14);
  r.draining_started_at_ms    = row.GetInt64(c + 15);
  r.terminating_started_at_ms = row.GetInt64(c + 16);
  r.terminated_at_ms          = row.GetInt64(c + 17);
  r.failed_at_ms              = row.GetInt64(c + 18);
  r.archived_at_ms            = row.GetInt64(c + 19);
  r.error_code                = row.GetText(c + 20);
  r.error_message             = row.GetText(c + 21);
  r.retry_count               = row.GetInt(c + 22);
  r.startup_recoveries        = row.GetInt(c + 23);
  r.termination_attempts      = row.GetInt(c + 24);
  r.health_check_failures     = row.GetInt(c + 25);
  r.last_health_check_ms      = row.GetInt64(c + 26);
  r.last_reconciliation_ms    = row.GetInt64(c + 27);
  r.deletion_reason           = row.GetText(c + 28);
  r.deleted_by_provider       = row.GetBool(c + 29);
  r.is_archived               = row.GetBool(c + 30);

  auto& w             = r.worker;
  w.last_heartbeat_ms = row.GetInt64(c + 31);
  w.status            = row.GetText(c + 32);
  w.model_id          = row.GetText(c + 33);
  w.health_port       = static_cast<uint32_t>(row.GetInt64(c + 34));
  w.vllm_port         = static_cast<uint32_t>(row.GetInt64(c + 35));
  if (!row.IsNull(c + 36)) w.queue_depth = row.GetInt(c + 36);
  if (!row.IsNull(c + 37)) w.gpu_utilization = row.GetDouble(c + 37);
  w.metadata_json = row.GetText(c + 38);
  return r;
}

model::VolumeRecord ReadVolume(const Row& row, int c) {
  model::VolumeRecord r;
  r.id                  = row.GetText(c + 0);
  r.instance_id         = row.GetText(c + 1);
  r.provider_volume_id  = row.GetText(c + 2);
  r.volume_name         = row.GetText(c + 3);
  r.volume_type         = row.GetText(c + 4);
  r.size_bytes          = row.GetU64(c + 5);
  r.is_boot             = row.GetBool(c + 6);
  r.delete_on_terminate = row.GetBool(c + 7);

  const auto status = fleet::model::ParseVolumeStatus(row.GetText(c + 8));
  if (!status) {
    throw std::runtime_error("unknown volume status in store: " + row.GetText(c + 8));
  }
  r.status           = *status;
  r.created_at_ms    = row.GetInt64(c + 9);
  r.attached_at_ms   = row.GetInt64(c + 10);
  r.deleted_at_ms    = row.GetInt64(c + 11);
  r.reconciled_at_ms = row.GetInt64(c + 12);
  r.error_message    = row.GetText(c + 13);
  return r;
}

// id,instance_id,from_status,to_status,reason,metadata,created_at_ms
model::StateHistoryRecord ReadStateHistory(const Row& row) {
  model::StateHistoryRecord r;
  r.id            = row.GetInt64(0);
  r.instance_id   = row.GetText(1);
  r.from_status   = StatusFromColumn(row, 2);
  r.to_status     = StatusFromColumn(row, 3);
  r.reason        = row.GetText(4);
  r.metadata_json = row.GetText(5);
  r.created_at_ms = row.GetInt64(6);
  return r;
}

// instance_id,token_hash,token_prefix,created_at_ms,last_seen_at_ms,revoked_at_ms
model::WorkerTokenRecord ReadWorkerToken(const Row& row) {
  model::WorkerTokenRecord r;
  r.instance_id     = row.GetText(0);
  r.token_hash      = row.GetText(1);
  r.token_prefix    = row.GetText(2);
  r.created_at_ms   = row.GetInt64(3);
  r.last_seen_at_ms = row.GetInt64(4);
  r.revoked_at_ms   = row.GetInt64(5);
  return r;
}

// id,instance_id,action_type,status,error_message,metadata,created_at_ms,completed_at_ms,duration_ms
model::ActionLogRecord ReadActionLog(const Row& row) {
  model::ActionLogRecord r;
  r.id              = row.GetText(0);
  r.instance_id     = row.GetText(1);
  r.action_type     = row.GetText(2);
  r.status          = fleet::model::ParseActionStatus(row.GetText(3));
  r.error_message   = row.GetText(4);
  r.metadata_json   = row.GetText(5);
  r.created_at_ms   = row.GetInt64(6);
  r.completed_at_ms = row.GetInt64(7);
  r.duration_ms     = row.GetInt64(8);
  return r;
}

// provider_code,zone,code,name,cost_per_hour,cpu_count,ram_gb,gpu_count,vram_per_gpu_gb,bandwidth_bps,updated_at_ms
model::CatalogInstanceTypeRecord ReadCatalogInstanceType(const Row& row) {
  model::CatalogInstanceTypeRecord r;
  r.provider_code   = row.GetText(0);
  r.zone            = row.GetText(1);
  r.code            = row.GetText(2);
  r.name            = row.GetText(3);
  r.cost_per_hour   = row.GetDouble(4);
  r.cpu_count       = static_cast<uint32_t>(row.GetInt64(5));
  r.ram_gb          = static_cast<uint32_t>(row.GetInt64(6));
  r.gpu_count       = static_cast<uint32_t>(row.GetInt64(7));
  r.vram_per_gpu_gb = static_cast<uint32_t>(row.GetInt64(8));
  r.bandwidth_bps   = row.GetU64(9);
  r.updated_at_ms   = row.GetInt64(10);
  return r;
}

} // namespace fleet::db::sql
