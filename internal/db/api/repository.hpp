#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/claim.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/action_log_record.hpp"
#include "internal/db/model/catalog_record.hpp"
#include "internal/db/model/instance_record.hpp"
#include "internal/db/model/state_history_record.hpp"
#include "internal/db/model/volume_record.hpp"
#include "internal/db/model/worker_token_record.hpp"

namespace fleet::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Status writes are compare-and-swap on the current status
  - Archived instances are immutable
  - Worker columns and lifecycle columns have separate writers

  The DB is the single cross-process source of truth for:
    instance lifecycle state
    volumes
    worker credentials
    audit history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Instances
  // ---------------------------------------------------------------------

  virtual Result InsertInstance(Transaction&, const model::InstanceRecord&) = 0;

  virtual std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string& id) = 0;

  // Same as GetInstance but takes a row lock where the backend has them.
  virtual std::optional<model::InstanceRecord> LockInstance(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::InstanceRecord> FindInstanceByProviderId(Transaction&, const std::string& provider_code,
                                                                        const std::string& provider_instance_id) = 0;

  virtual std::vector<model::InstanceRecord> ListInstancesByStatus(Transaction&,
                                                                   const std::vector<fleet::model::InstanceStatus>& statuses) = 0;

  // Writes every lifecycle column of the record, guarded on
  // `status = expected_status`. Worker columns are left untouched.
  // Conflict when the guard fails, Immutable when the row is archived.
  virtual Result UpdateInstance(Transaction&, const model::InstanceRecord&, fleet::model::InstanceStatus expected_status) = 0;

  // Writes worker columns only. Never changes status.
  virtual Result UpdateWorkerFields(Transaction&, const std::string& id, const model::WorkerFields&) = 0;

  virtual std::vector<model::InstanceRecord> ClaimInstances(Transaction&, const ClaimQuery&) = 0;

  // Clears a lease column so the next tick retries the row.
  virtual Result ReleaseLease(Transaction&, const std::string& id, LeaseColumn lease) = 0;

  // ---------------------------------------------------------------------
  // State history (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertStateHistory(Transaction&, model::StateHistoryRecord&) = 0;

  virtual std::vector<model::StateHistoryRecord> ListStateHistory(Transaction&, const std::string& instance_id) = 0;

  // ---------------------------------------------------------------------
  // Volumes
  // ---------------------------------------------------------------------

  virtual Result InsertVolume(Transaction&, const model::VolumeRecord&) = 0;

  virtual std::vector<model::VolumeRecord> ListVolumes(Transaction&, const std::string& instance_id) = 0;

  // Guarded status change; Conflict when the volume is not in `expected`.
  virtual Result UpdateVolumeStatus(Transaction&, const std::string& volume_id, fleet::model::VolumeStatus expected,
                                    fleet::model::VolumeStatus next, std::int64_t now_ms, const std::string& error_message) = 0;

  // ---------------------------------------------------------------------
  // Worker credentials
  // ---------------------------------------------------------------------

  // AlreadyExists when the instance already has a token.
  virtual Result InsertWorkerToken(Transaction&, const model::WorkerTokenRecord&) = 0;

  virtual std::optional<model::WorkerTokenRecord> GetWorkerToken(Transaction&, const std::string& instance_id) = 0;

  virtual Result TouchWorkerToken(Transaction&, const std::string& instance_id, std::int64_t now_ms) = 0;

  virtual Result RevokeWorkerToken(Transaction&, const std::string& instance_id, std::int64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Action logs
  // ---------------------------------------------------------------------

  virtual Result InsertActionLog(Transaction&, const model::ActionLogRecord&) = 0;

  // Updates status, error, metadata, completion time and duration by id.
  virtual Result CompleteActionLog(Transaction&, const model::ActionLogRecord&) = 0;

  virtual std::vector<model::ActionLogRecord> ListActionLogs(Transaction&, const std::string& instance_id) = 0;

  // ---------------------------------------------------------------------
  // Catalog
  // ---------------------------------------------------------------------

  virtual Result UpsertCatalogInstanceType(Transaction&, const model::CatalogInstanceTypeRecord&) = 0;

  virtual std::vector<model::CatalogInstanceTypeRecord> ListCatalogInstanceTypes(Transaction&, const std::string& provider_code) = 0;
};

} // namespace fleet::db
