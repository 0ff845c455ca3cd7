#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace fleet::db::memory {

using fleet::model::InstanceStatus;
using fleet::model::VolumeStatus;

namespace {

std::string CatalogKey(const std::string& provider_code, const std::string& zone, const std::string& code) {
  return provider_code + "#" + zone + "#" + code;
}

std::int64_t LeaseValue(const model::InstanceRecord& r, LeaseColumn lease) {
  return lease == LeaseColumn::kLastHealthCheck ? r.last_health_check_ms : r.last_reconciliation_ms;
}

// Mirrors the partial unique indexes of the SQL backends.
bool NetworkIdentityTaken(const std::unordered_map<std::string, model::InstanceRecord>& instances, const std::string& self_id,
                          const std::string& ip, InstanceStatus status, const model::WorkerFields& worker) {
  if (ip.empty() || !fleet::model::HoldsNetworkIdentity(status)) {
    return false;
  }
  for (const auto& [id, other] : instances) {
    if (id == self_id || other.ip_address != ip || !fleet::model::HoldsNetworkIdentity(other.status)) {
      continue;
    }
    if (worker.health_port != 0 && other.worker.health_port == worker.health_port) return true;
    if (worker.vllm_port != 0 && other.worker.vllm_port == worker.vllm_port) return true;
  }
  return false;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result MemoryRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.instances.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "instance " + r.id);
  if (NetworkIdentityTaken(s.instances, r.id, r.ip_address, r.status, r.worker)) {
    return Result::Err(ErrorCode::ConstraintViolation, "ip/port already held by an active instance");
  }
  s.instances[r.id] = r;
  return Result::Ok();
}

std::optional<model::InstanceRecord> MemoryRepository::GetInstance(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.instances.find(id);
  if (it == s.instances.end()) return std::nullopt;
  return it->second;
}

std::optional<model::InstanceRecord> MemoryRepository::LockInstance(Transaction& t, const std::string& id) {
  // the transaction already holds the store exclusively
  return GetInstance(t, id);
}

std::optional<model::InstanceRecord> MemoryRepository::FindInstanceByProviderId(Transaction& t, const std::string& provider_code,
                                                                                const std::string& provider_instance_id) {
  for (const auto& [_, record] : TX(t).View().instances) {
    if (record.provider_code == provider_code && record.provider_instance_id == provider_instance_id) {
      return record;
    }
  }
  return std::nullopt;
}

std::vector<model::InstanceRecord> MemoryRepository::ListInstancesByStatus(Transaction& t, const std::vector<InstanceStatus>& statuses) {
  std::vector<model::InstanceRecord> out;
  for (const auto& [_, record] : TX(t).View().instances) {
    if (std::find(statuses.begin(), statuses.end(), record.status) != statuses.end()) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r, InstanceStatus expected_status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.instances.find(r.id);
  if (it == s.instances.end()) return Result::Err(ErrorCode::NotFound, "instance " + r.id);
  if (it->second.is_archived) return Result::Err(ErrorCode::Immutable, "instance " + r.id + " is archived");
  if (it->second.status != expected_status) return Result::Err(ErrorCode::Conflict, "instance " + r.id + " status moved");
  if (NetworkIdentityTaken(s.instances, r.id, r.ip_address, r.status, it->second.worker)) {
    return Result::Err(ErrorCode::ConstraintViolation, "ip/port already held by an active instance");
  }

  const auto worker = it->second.worker;
  it->second        = r;
  it->second.worker = worker;
  return Result::Ok();
}

Result MemoryRepository::UpdateWorkerFields(Transaction& t, const std::string& id, const model::WorkerFields& worker) {
  auto& s  = TX(t).Mutable();
  auto  it = s.instances.find(id);
  if (it == s.instances.end()) return Result::Err(ErrorCode::NotFound, "instance " + id);
  if (it->second.is_archived) return Result::Err(ErrorCode::Immutable, "instance " + id + " is archived");
  if (NetworkIdentityTaken(s.instances, id, it->second.ip_address, it->second.status, worker)) {
    return Result::Err(ErrorCode::ConstraintViolation, "ip/port already held by an active instance");
  }
  it->second.worker = worker;
  return Result::Ok();
}

std::vector<model::InstanceRecord> MemoryRepository::ClaimInstances(Transaction& t, const ClaimQuery& q) {
  auto& s = TX(t).Mutable();

  std::vector<model::InstanceRecord*> candidates;
  for (auto& [_, record] : s.instances) {
    if (std::find(q.statuses.begin(), q.statuses.end(), record.status) == q.statuses.end()) continue;
    const auto lease = LeaseValue(record, q.lease);
    if (lease != 0 && lease >= q.lease_expired_before_ms) continue;
    if (q.created_before_ms != 0 && record.created_at_ms >= q.created_before_ms) continue;
    if (q.require_provider_instance_id && record.provider_instance_id.empty()) continue;
    if (q.retry_count_below && record.retry_count >= *q.retry_count_below) continue;
    if (q.termination_attempts_below && record.termination_attempts >= *q.termination_attempts_below) continue;
    candidates.push_back(&record);
  }

  std::sort(candidates.begin(), candidates.end(), [&](const auto* a, const auto* b) {
    const auto la = LeaseValue(*a, q.lease);
    const auto lb = LeaseValue(*b, q.lease);
    if (la != lb) return la < lb;
    return a->created_at_ms < b->created_at_ms;
  });
  if (candidates.size() > q.limit) candidates.resize(q.limit);

  std::vector<model::InstanceRecord> out;
  out.reserve(candidates.size());
  for (auto* record : candidates) {
    if (q.lease == LeaseColumn::kLastHealthCheck) {
      record->last_health_check_ms = q.now_ms;
    } else {
      record->last_reconciliation_ms = q.now_ms;
    }
    if (q.increment_retry_count) {
      ++record->retry_count;
    }
    out.push_back(*record);
  }
  return out;
}

Result MemoryRepository::ReleaseLease(Transaction& t, const std::string& id, LeaseColumn lease) {
  auto& s  = TX(t).Mutable();
  auto  it = s.instances.find(id);
  if (it == s.instances.end()) return Result::Err(ErrorCode::NotFound, "instance " + id);
  if (lease == LeaseColumn::kLastHealthCheck) {
    it->second.last_health_check_ms = 0;
  } else {
    it->second.last_reconciliation_ms = 0;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result MemoryRepository::InsertStateHistory(Transaction& t, model::StateHistoryRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_history_id++;
  s.history.push_back(r);
  return Result::Ok();
}

std::vector<model::StateHistoryRecord> MemoryRepository::ListStateHistory(Transaction& t, const std::string& instance_id) {
  std::vector<model::StateHistoryRecord> out;
  for (const auto& entry : TX(t).View().history)
    if (entry.instance_id == instance_id) out.push_back(entry);
  return out;
}

// ------------------------------------------------------------------
// Volumes
// ------------------------------------------------------------------

Result MemoryRepository::InsertVolume(Transaction& t, const model::VolumeRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.volumes.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "volume " + r.id);
  for (const auto& [_, existing] : s.volumes) {
    if (existing.instance_id == r.instance_id && existing.provider_volume_id == r.provider_volume_id &&
        existing.status != VolumeStatus::kDeleted) {
      return Result::Err(ErrorCode::AlreadyExists, "volume " + r.provider_volume_id + " already tracked");
    }
  }
  s.volumes[r.id] = r;
  s.volume_order.push_back(r.id);
  return Result::Ok();
}

std::vector<model::VolumeRecord> MemoryRepository::ListVolumes(Transaction& t, const std::string& instance_id) {
  const auto&                      s = TX(t).View();
  std::vector<model::VolumeRecord> out;
  for (const auto& id : s.volume_order) {
    const auto& volume = s.volumes.at(id);
    if (volume.instance_id == instance_id) out.push_back(volume);
  }
  return out;
}

Result MemoryRepository::UpdateVolumeStatus(Transaction& t, const std::string& volume_id, VolumeStatus expected, VolumeStatus next,
                                            std::int64_t now_ms, const std::string& error_message) {
  auto& s  = TX(t).Mutable();
  auto  it = s.volumes.find(volume_id);
  if (it == s.volumes.end()) return Result::Err(ErrorCode::NotFound, "volume " + volume_id);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "volume " + volume_id + " status moved");

  it->second.status           = next;
  it->second.reconciled_at_ms = now_ms;
  it->second.error_message    = error_message;
  if (next == VolumeStatus::kDeleted) {
    it->second.deleted_at_ms = now_ms;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Worker tokens
// ------------------------------------------------------------------

Result MemoryRepository::InsertWorkerToken(Transaction& t, const model::WorkerTokenRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.tokens.contains(r.instance_id)) return Result::Err(ErrorCode::AlreadyExists, "token for " + r.instance_id);
  s.tokens[r.instance_id] = r;
  return Result::Ok();
}

std::optional<model::WorkerTokenRecord> MemoryRepository::GetWorkerToken(Transaction& t, const std::string& instance_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tokens.find(instance_id);
  if (it == s.tokens.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::TouchWorkerToken(Transaction& t, const std::string& instance_id, std::int64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tokens.find(instance_id);
  if (it == s.tokens.end()) return Result::Err(ErrorCode::NotFound, "token for " + instance_id);
  it->second.last_seen_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::RevokeWorkerToken(Transaction& t, const std::string& instance_id, std::int64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tokens.find(instance_id);
  if (it == s.tokens.end()) return Result::Err(ErrorCode::NotFound, "token for " + instance_id);
  if (it->second.revoked_at_ms == 0) {
    it->second.revoked_at_ms = now_ms;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Action logs
// ------------------------------------------------------------------

Result MemoryRepository::InsertActionLog(Transaction& t, const model::ActionLogRecord& r) {
  TX(t).Mutable().action_logs.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::CompleteActionLog(Transaction& t, const model::ActionLogRecord& r) {
  for (auto& entry : TX(t).Mutable().action_logs) {
    if (entry.id != r.id) continue;
    entry.status          = r.status;
    entry.error_message   = r.error_message;
    entry.metadata_json   = r.metadata_json;
    entry.completed_at_ms = r.completed_at_ms;
    entry.duration_ms     = r.duration_ms;
    return Result::Ok();
  }
  return Result::Err(ErrorCode::NotFound, "action log " + r.id);
}

std::vector<model::ActionLogRecord> MemoryRepository::ListActionLogs(Transaction& t, const std::string& instance_id) {
  std::vector<model::ActionLogRecord> out;
  for (const auto& entry : TX(t).View().action_logs)
    if (entry.instance_id == instance_id) out.push_back(entry);
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCatalogInstanceType(Transaction& t, const model::CatalogInstanceTypeRecord& r) {
  TX(t).Mutable().catalog[CatalogKey(r.provider_code, r.zone, r.code)] = r;
  return Result::Ok();
}

std::vector<model::CatalogInstanceTypeRecord> MemoryRepository::ListCatalogInstanceTypes(Transaction& t, const std::string& provider_code) {
  std::vector<model::CatalogInstanceTypeRecord> out;
  for (const auto& [_, record] : TX(t).View().catalog)
    if (provider_code.empty() || record.provider_code == provider_code) out.push_back(record);
  return out;
}

} // namespace fleet::db::memory
