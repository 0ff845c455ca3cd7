#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fleet::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and single-replica deployments.

  Transactions are serialized (one open at a time), which gives the same
  isolation the SQLite backend gets from BEGIN IMMEDIATE. A thread must
  never open a second transaction while holding one.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertInstance(Transaction&, const model::InstanceRecord&) override;
  std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string&) override;
  std::optional<model::InstanceRecord> LockInstance(Transaction&, const std::string&) override;
  std::optional<model::InstanceRecord> FindInstanceByProviderId(Transaction&, const std::string& provider_code,
                                                                const std::string& provider_instance_id) override;
  std::vector<model::InstanceRecord> ListInstancesByStatus(Transaction&,
                                                           const std::vector<fleet::model::InstanceStatus>& statuses) override;
  Result UpdateInstance(Transaction&, const model::InstanceRecord&, fleet::model::InstanceStatus expected_status) override;
  Result UpdateWorkerFields(Transaction&, const std::string& id, const model::WorkerFields&) override;
  std::vector<model::InstanceRecord> ClaimInstances(Transaction&, const ClaimQuery&) override;
  Result ReleaseLease(Transaction&, const std::string& id, LeaseColumn lease) override;

  Result InsertStateHistory(Transaction&, model::StateHistoryRecord&) override;
  std::vector<model::StateHistoryRecord> ListStateHistory(Transaction&, const std::string& instance_id) override;

  Result InsertVolume(Transaction&, const model::VolumeRecord&) override;
  std::vector<model::VolumeRecord> ListVolumes(Transaction&, const std::string& instance_id) override;
  Result UpdateVolumeStatus(Transaction&, const std::string& volume_id, fleet::model::VolumeStatus expected,
                            fleet::model::VolumeStatus next, std::int64_t now_ms, const std::string& error_message) override;

  Result InsertWorkerToken(Transaction&, const model::WorkerTokenRecord&) override;
  std::optional<model::WorkerTokenRecord> GetWorkerToken(Transaction&, const std::string& instance_id) override;
  Result TouchWorkerToken(Transaction&, const std::string& instance_id, std::int64_t now_ms) override;
  Result RevokeWorkerToken(Transaction&, const std::string& instance_id, std::int64_t now_ms) override;

  Result InsertActionLog(Transaction&, const model::ActionLogRecord&) override;
  Result CompleteActionLog(Transaction&, const model::ActionLogRecord&) override;
  std::vector<model::ActionLogRecord> ListActionLogs(Transaction&, const std::string& instance_id) override;

  Result UpsertCatalogInstanceType(Transaction&, const model::CatalogInstanceTypeRecord&) override;
  std::vector<model::CatalogInstanceTypeRecord> ListCatalogInstanceTypes(Transaction&, const std::string& provider_code) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::InstanceRecord> instances;
    std::vector<model::StateHistoryRecord>                  history;
    std::int64_t                                            next_history_id = 1;

    // ordered by insertion so listings are stable
    std::map<std::string, model::VolumeRecord>         volumes;
    std::vector<std::string>                           volume_order;
    std::unordered_map<std::string, model::WorkerTokenRecord> tokens;
    std::vector<model::ActionLogRecord>                action_logs;
    std::map<std::string, model::CatalogInstanceTypeRecord> catalog;
  };

  std::mutex mutex_;
  State      committed_;
};

}
