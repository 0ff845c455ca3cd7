#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fleet::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertInstance(Transaction&, const model::InstanceRecord&) override;
  std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string& id) override;
  std::optional<model::InstanceRecord> LockInstance(Transaction&, const std::string& id) override;
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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  // Runs a write statement; `changes` receives sqlite3_changes() when set.
  static Result Exec(sqlite3* db, const std::string& statement, const sql::Params& params, int* changes = nullptr);
};

}
