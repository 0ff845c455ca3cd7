#include "pg_repository.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

#include "internal/db/sql/row_mapping.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace fleet::db::postgres {

using fleet::model::InstanceStatus;
using fleet::model::VolumeStatus;

namespace {

class PgRow final : public sql::Row {
public:
  explicit PgRow(pqxx::row row) : row_(std::move(row)) {}

  std::string GetText(int col) const override {
    return row_[col].is_null() ? std::string{} : std::string(row_[col].c_str());
  }

  int64_t GetInt64(int col) const override {
    return row_[col].is_null() ? 0 : row_[col].as<int64_t>();
  }

  double GetDouble(int col) const override {
    return row_[col].is_null() ? 0.0 : row_[col].as<double>();
  }

  bool GetBool(int col) const override {
    return !row_[col].is_null() && row_[col].as<bool>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

private:
  pqxx::row row_;
};

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else if constexpr (std::is_same_v<T, uint64_t>) {
            out.append(static_cast<int64_t>(v));
          } else {
            out.append(v);
          }
        },
        param);
  }
  return out;
}

std::string Status(InstanceStatus status) {
  return std::string(fleet::model::ToString(status));
}

std::string Status(VolumeStatus status) {
  return std::string(fleet::model::ToString(status));
}

std::optional<model::InstanceRecord> FirstInstance(const pqxx::result& res) {
  if (res.empty()) return std::nullopt;
  return sql::ReadInstance(PgRow(res[0]));
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    const std::string what = e.what();
    if (what.find("_pkey") != std::string::npos) return Result::Err(ErrorCode::AlreadyExists, what);
    return Result::Err(ErrorCode::ConstraintViolation, what);
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::Exec(Transaction& t, std::string_view statement, const sql::Params& params, std::size_t* affected) {
  try {
    auto res = TX(t).Work().exec_params(sql::ForPostgres(statement), ToPqxx(params));
    if (affected) *affected = static_cast<std::size_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result PgRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  try {
    TX(t).Work().exec_prepared(PgPool::kInsertInstance, ToPqxx(sql::InstanceParams(r)));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::InstanceRecord> PgRepository::GetInstance(Transaction& t, const std::string& id) {
  return FirstInstance(TX(t).Work().exec_prepared(PgPool::kGetInstance, id));
}

std::optional<model::InstanceRecord> PgRepository::LockInstance(Transaction& t, const std::string& id) {
  return FirstInstance(TX(t).Work().exec_prepared(PgPool::kLockInstance, id));
}

std::optional<model::InstanceRecord> PgRepository::FindInstanceByProviderId(Transaction& t, const std::string& provider_code,
                                                                            const std::string& provider_instance_id) {
  static const std::string kSql = sql::ForPostgres(sql::SelectInstanceByProviderIdSql());
  return FirstInstance(TX(t).Work().exec_params(kSql, provider_code, provider_instance_id));
}

std::vector<model::InstanceRecord> PgRepository::ListInstancesByStatus(Transaction& t, const std::vector<InstanceStatus>& statuses) {
  std::vector<model::InstanceRecord> out;
  if (statuses.empty()) return out;

  sql::Params params;
  for (auto status : statuses) params.emplace_back(Status(status));

  auto res = TX(t).Work().exec_params(sql::ForPostgres(sql::SelectInstancesByStatusSql(statuses.size())), ToPqxx(params));
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(sql::ReadInstance(PgRow(row)));
  return out;
}

Result PgRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r, InstanceStatus expected_status) {
  auto params = sql::InstanceParams(r);
  params.resize(sql::kInstanceLifecycleColumnCount);
  params.emplace_back(Status(expected_status));

  try {
    auto res = TX(t).Work().exec_prepared(PgPool::kUpdateInstance, ToPqxx(params));
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  auto current = GetInstance(t, r.id);
  if (!current) return Result::Err(ErrorCode::NotFound, "instance " + r.id);
  if (current->is_archived) return Result::Err(ErrorCode::Immutable, "instance " + r.id + " is archived");
  return Result::Err(ErrorCode::Conflict, "instance " + r.id + " status moved");
}

Result PgRepository::UpdateWorkerFields(Transaction& t, const std::string& id, const model::WorkerFields& worker) {
  sql::Params params{id};
  auto        fields = sql::WorkerParams(worker);
  params.insert(params.end(), fields.begin(), fields.end());

  try {
    auto res = TX(t).Work().exec_prepared(PgPool::kUpdateWorkerFields, ToPqxx(params));
    if (res.affected_rows() > 0) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (!GetInstance(t, id)) return Result::Err(ErrorCode::NotFound, "instance " + id);
  return Result::Err(ErrorCode::Immutable, "instance " + id + " is archived");
}

std::vector<model::InstanceRecord> PgRepository::ClaimInstances(Transaction& t, const ClaimQuery& q) {
  if (q.statuses.empty() || q.limit == 0) return {};

  // picked rows stay locked until commit; concurrent claimers skip them
  sql::Params params;
  const auto  select = sql::ClaimSelectSql(q, params);
  params.emplace_back(q.now_ms);
  const int now_index = static_cast<int>(params.size());

  const std::string statement = "WITH picked AS (" + select + " FOR UPDATE SKIP LOCKED)" + " UPDATE instances SET " +
                                sql::ClaimStampSql(q, now_index) + " WHERE id IN (SELECT id FROM picked) RETURNING " +
                                sql::kInstanceColumns + ";";

  auto res = TX(t).Work().exec_params(sql::ForPostgres(statement), ToPqxx(params));

  std::vector<model::InstanceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(sql::ReadInstance(PgRow(row)));
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

Result PgRepository::ReleaseLease(Transaction& t, const std::string& id, LeaseColumn lease) {
  std::size_t affected = 0;
  auto res = Exec(t, lease == LeaseColumn::kLastHealthCheck ? sql::RELEASE_HEALTH_LEASE : sql::RELEASE_RECONCILIATION_LEASE, {id},
                  &affected);
  if (res && affected == 0) return Result::Err(ErrorCode::NotFound, "instance " + id);
  return res;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result PgRepository::InsertStateHistory(Transaction& t, model::StateHistoryRecord& r) {
  static const std::string kSql = sql::ForPostgres(std::string(sql::INSERT_STATE_HISTORY) + " RETURNING id;");
  try {
    auto res = TX(t).Work().exec_params(kSql, ToPqxx({r.instance_id, Status(r.from_status), Status(r.to_status),
                                                      sql::NullableText(r.reason), sql::NullableText(r.metadata_json),
                                                      r.created_at_ms}));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::StateHistoryRecord> PgRepository::ListStateHistory(Transaction& t, const std::string& instance_id) {
  static const std::string kSql = sql::ForPostgres(sql::SELECT_STATE_HISTORY);
  auto                     res  = TX(t).Work().exec_params(kSql, instance_id);

  std::vector<model::StateHistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(sql::ReadStateHistory(PgRow(row)));
  return out;
}

// ------------------------------------------------------------------
// Volumes
// ------------------------------------------------------------------

Result PgRepository::InsertVolume(Transaction& t, const model::VolumeRecord& r) {
  static const std::string kSql = sql::InsertVolumeSql();
  auto                     res  = Exec(t, kSql, sql::VolumeParams(r));
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  return res;
}

std::vector<model::VolumeRecord> PgRepository::ListVolumes(Transaction& t, const std::string& instance_id) {
  static const std::string kSql = sql::ForPostgres(sql::SelectVolumesSql("seq"));
  auto                     res  = TX(t).Work().exec_params(kSql, instance_id);

  std::vector<model::VolumeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(sql::ReadVolume(PgRow(row)));
  return out;
}

Result PgRepository::UpdateVolumeStatus(Transaction& t, const std::string& volume_id, VolumeStatus expected, VolumeStatus next,
                                        std::int64_t now_ms, const std::string& error_message) {
  std::size_t affected = 0;
  auto res = Exec(t, sql::UPDATE_VOLUME_STATUS, {volume_id, Status(expected), Status(next), now_ms, sql::NullableText(error_message)},
                  &affected);
  if (!res || affected > 0) return res;

  static const std::string kSql = sql::ForPostgres(sql::SELECT_VOLUME_STATUS);
  if (TX(t).Work().exec_params(kSql, volume_id).empty()) return Result::Err(ErrorCode::NotFound, "volume " + volume_id);
  return Result::Err(ErrorCode::Conflict, "volume " + volume_id + " status moved");
}

// ------------------------------------------------------------------
// Worker tokens
// ------------------------------------------------------------------

Result PgRepository::InsertWorkerToken(Transaction& t, const model::WorkerTokenRecord& r) {
  return Exec(t, sql::INSERT_WORKER_TOKEN,
              {r.instance_id, r.token_hash, r.token_prefix, r.created_at_ms, sql::NullableMillis(r.last_seen_at_ms),
               sql::NullableMillis(r.revoked_at_ms)});
}

std::optional<model::WorkerTokenRecord> PgRepository::GetWorkerToken(Transaction& t, const std::string& instance_id) {
  static const std::string kSql = sql::ForPostgres(sql::SELECT_WORKER_TOKEN);
  auto                     res  = TX(t).Work().exec_params(kSql, instance_id);
  if (res.empty()) return std::nullopt;
  return sql::ReadWorkerToken(PgRow(res[0]));
}

Result PgRepository::TouchWorkerToken(Transaction& t, const std::string& instance_id, std::int64_t now_ms) {
  std::size_t affected = 0;
  auto        res      = Exec(t, sql::TOUCH_WORKER_TOKEN, {instance_id, now_ms}, &affected);
  if (res && affected == 0) return Result::Err(ErrorCode::NotFound, "token for " + instance_id);
  return res;
}

Result PgRepository::RevokeWorkerToken(Transaction& t, const std::string& instance_id, std::int64_t now_ms) {
  std::size_t affected = 0;
  auto        res      = Exec(t, sql::REVOKE_WORKER_TOKEN, {instance_id, now_ms}, &affected);
  if (res && affected == 0) return Result::Err(ErrorCode::NotFound, "token for " + instance_id);
  return res;
}

// ------------------------------------------------------------------
// Action logs
// ------------------------------------------------------------------

Result PgRepository::InsertActionLog(Transaction& t, const model::ActionLogRecord& r) {
  return Exec(t, sql::INSERT_ACTION_LOG,
              {r.id, r.instance_id, r.action_type, std::string(fleet::model::ToString(r.status)), sql::NullableText(r.error_message),
               sql::NullableText(r.metadata_json), r.created_at_ms, sql::NullableMillis(r.completed_at_ms),
               sql::NullableMillis(r.duration_ms)});
}

Result PgRepository::CompleteActionLog(Transaction& t, const model::ActionLogRecord& r) {
  std::size_t affected = 0;
  auto        res      = Exec(t, sql::COMPLETE_ACTION_LOG,
                              {r.id, std::string(fleet::model::ToString(r.status)), sql::NullableText(r.error_message),
                               sql::NullableText(r.metadata_json), sql::NullableMillis(r.completed_at_ms), r.duration_ms},
                              &affected);
  if (res && affected == 0) return Result::Err(ErrorCode::NotFound, "action log " + r.id);
  return res;
}

std::vector<model::ActionLogRecord> PgRepository::ListActionLogs(Transaction& t, const std::string& instance_id) {
  static const std::string kSql = sql::ForPostgres(sql::SelectActionLogsSql("seq"));
  auto                     res  = TX(t).Work().exec_params(kSql, instance_id);

  std::vector<model::ActionLogRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(sql::ReadActionLog(PgRow(row)));
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result PgRepository::UpsertCatalogInstanceType(Transaction& t, const model::CatalogInstanceTypeRecord& r) {
  return Exec(t, sql::UPSERT_CATALOG_INSTANCE_TYPE,
              {r.provider_code, r.zone, r.code, sql::NullableText(r.name), r.cost_per_hour, static_cast<int32_t>(r.cpu_count),
               static_cast<int32_t>(r.ram_gb), static_cast<int32_t>(r.gpu_count), static_cast<int32_t>(r.vram_per_gpu_gb),
               static_cast<int64_t>(r.bandwidth_bps), r.updated_at_ms});
}

std::vector<model::CatalogInstanceTypeRecord> PgRepository::ListCatalogInstanceTypes(Transaction& t, const std::string& provider_code) {
  static const std::string kSql = sql::ForPostgres(sql::SELECT_CATALOG);
  auto                     res  = TX(t).Work().exec_params(kSql, provider_code);

  std::vector<model::CatalogInstanceTypeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(sql::ReadCatalogInstanceType(PgRow(row)));
  return out;
}

}
