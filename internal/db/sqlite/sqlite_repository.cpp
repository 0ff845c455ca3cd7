#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include "internal/db/sql/row_mapping.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace fleet::db::sqlite {

using fleet::db::ErrorCode;
using fleet::db::Result;
using fleet::model::InstanceStatus;
using fleet::model::VolumeStatus;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

class SqliteRow final : public sql::Row {
public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {}

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool GetBool(int col) const override {
    return sqlite3_column_int(st_, col) != 0;
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

private:
  sqlite3_stmt* st_;
};

void BindParam(sqlite3_stmt* st, int idx, const sql::Param& param) {
  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, bool>) {
          sqlite3_bind_int(st, idx, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          sqlite3_bind_int(st, idx, v);
        } else if constexpr (std::is_same_v<T, double>) {
          sqlite3_bind_double(st, idx, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
          sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        }
      },
      param);
}

Stmt Prepare(sqlite3* db, const std::string& statement, const sql::Params& params) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, statement.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return nullptr;
  }
  Stmt st(raw);
  for (std::size_t i = 0; i < params.size(); ++i) {
    BindParam(st.get(), static_cast<int>(i) + 1, params[i]);
  }
  return st;
}

// Reads have no Result channel; driver failures surface as exceptions.
void Query(sqlite3* db, const std::string& statement, const sql::Params& params, const std::function<void(const sql::Row&)>& on_row) {
  auto st = Prepare(db, statement, params);
  if (!st) {
    throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
  }
  SqliteRow row(st.get());
  int       rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    on_row(row);
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite query failed: ") + sqlite3_errmsg(db));
  }
}

std::optional<model::InstanceRecord> QueryInstance(sqlite3* db, const std::string& statement, const sql::Params& params) {
  std::optional<model::InstanceRecord> out;
  Query(db, statement, params, [&](const sql::Row& row) {
    if (!out) out = sql::ReadInstance(row);
  });
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::Exec(sqlite3* db, const std::string& statement, const sql::Params& params, int* changes) {
  auto st = Prepare(db, statement, params);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int rc = sqlite3_step(st.get());
  if (changes) *changes = sqlite3_changes(db);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result SqliteRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  static const std::string kSql = sql::InsertInstanceSql();
  return Exec(TX(t).Handle(), kSql, sql::InstanceParams(r));
}

std::optional<model::InstanceRecord> SqliteRepository::GetInstance(Transaction& t, const std::string& id) {
  static const std::string kSql = sql::SelectInstanceSql();
  return QueryInstance(TX(t).Handle(), kSql, {id});
}

std::optional<model::InstanceRecord> SqliteRepository::LockInstance(Transaction& t, const std::string& id) {
  // BEGIN IMMEDIATE already holds the database write lock
  return GetInstance(t, id);
}

std::optional<model::InstanceRecord> SqliteRepository::FindInstanceByProviderId(Transaction& t, const std::string& provider_code,
                                                                                const std::string& provider_instance_id) {
  static const std::string kSql = sql::SelectInstanceByProviderIdSql();
  return QueryInstance(TX(t).Handle(), kSql, {provider_code, provider_instance_id});
}

std::vector<model::InstanceRecord> SqliteRepository::ListInstancesByStatus(Transaction& t, const std::vector<InstanceStatus>& statuses) {
  std::vector<model::InstanceRecord> out;
  if (statuses.empty()) return out;

  sql::Params params;
  for (auto status : statuses) params.emplace_back(std::string(fleet::model::ToString(status)));

  Query(TX(t).Handle(), sql::SelectInstancesByStatusSql(statuses.size()), params,
        [&](const sql::Row& row) { out.push_back(sql::ReadInstance(row)); });
  return out;
}

Result SqliteRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r, InstanceStatus expected_status) {
  static const std::string kSql = sql::UpdateInstanceSql();

  auto params = sql::InstanceParams(r);
  params.resize(sql::kInstanceLifecycleColumnCount);
  params.emplace_back(std::string(fleet::model::ToString(expected_status)));

  int  changes = 0;
  auto res     = Exec(TX(t).Handle(), kSql, params, &changes);
  if (!res || changes > 0) return res;

  auto current = GetInstance(t, r.id);
  if (!current) return Result::Err(ErrorCode::NotFound, "instance " + r.id);
  if (current->is_archived) return Result::Err(ErrorCode::Immutable, "instance " + r.id + " is archived");
  return Result::Err(ErrorCode::Conflict, "instance " + r.id + " status moved");
}

Result SqliteRepository::UpdateWorkerFields(Transaction& t, const std::string& id, const model::WorkerFields& worker) {
  static const std::string kSql = sql::UpdateWorkerFieldsSql();

  sql::Params params{id};
  auto        fields = sql::WorkerParams(worker);
  params.insert(params.end(), fields.begin(), fields.end());

  int  changes = 0;
  auto res     = Exec(TX(t).Handle(), kSql, params, &changes);
  if (!res || changes > 0) return res;

  auto current = GetInstance(t, id);
  if (!current) return Result::Err(ErrorCode::NotFound, "instance " + id);
  return Result::Err(ErrorCode::Immutable, "instance " + id + " is archived");
}

std::vector<model::InstanceRecord> SqliteRepository::ClaimInstances(Transaction& t, const ClaimQuery& q) {
  auto*                    db = TX(t).Handle();
  std::vector<std::string> ids;
  if (q.statuses.empty() || q.limit == 0) return {};

  sql::Params params;
  const auto  select = sql::ClaimSelectSql(q, params);
  Query(db, select, params, [&](const sql::Row& row) { ids.push_back(row.GetText(0)); });

  const std::string stamp = "UPDATE instances SET " + sql::ClaimStampSql(q, 2) + " WHERE id=?1;";

  std::vector<model::InstanceRecord> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    auto res = Exec(db, stamp, {id, q.now_ms});
    if (!res) {
      throw std::runtime_error("claim stamp failed: " + res.message);
    }
    if (auto record = GetInstance(t, id)) out.push_back(std::move(*record));
  }
  return out;
}

Result SqliteRepository::ReleaseLease(Transaction& t, const std::string& id, LeaseColumn lease) {
  int  changes = 0;
  auto res     = Exec(TX(t).Handle(),
                      lease == LeaseColumn::kLastHealthCheck ? sql::RELEASE_HEALTH_LEASE : sql::RELEASE_RECONCILIATION_LEASE, {id},
                      &changes);
  if (res && changes == 0) return Result::Err(ErrorCode::NotFound, "instance " + id);
  return res;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::InsertStateHistory(Transaction& t, model::StateHistoryRecord& r) {
  auto* db  = TX(t).Handle();
  auto  res = Exec(db, std::string(sql::INSERT_STATE_HISTORY) + ";",
                   {r.instance_id, std::string(fleet::model::ToString(r.from_status)),
                    std::string(fleet::model::ToString(r.to_status)), sql::NullableText(r.reason),
                    sql::NullableText(r.metadata_json), r.created_at_ms});
  if (res) r.id = sqlite3_last_insert_rowid(db);
  return res;
}

std::vector<model::StateHistoryRecord> SqliteRepository::ListStateHistory(Transaction& t, const std::string& instance_id) {
  std::vector<model::StateHistoryRecord> out;
  Query(TX(t).Handle(), sql::SELECT_STATE_HISTORY, {instance_id},
        [&](const sql::Row& row) { out.push_back(sql::ReadStateHistory(row)); });
  return out;
}

// ------------------------------------------------------------------
// Volumes
// ------------------------------------------------------------------

Result SqliteRepository::InsertVolume(Transaction& t, const model::VolumeRecord& r) {
  static const std::string kSql = sql::InsertVolumeSql();
  auto res = Exec(TX(t).Handle(), kSql, sql::VolumeParams(r));
  // the live (instance, provider volume) index
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  return res;
}

std::vector<model::VolumeRecord> SqliteRepository::ListVolumes(Transaction& t, const std::string& instance_id) {
  static const std::string         kSql = sql::SelectVolumesSql("rowid");
  std::vector<model::VolumeRecord> out;
  Query(TX(t).Handle(), kSql, {instance_id}, [&](const sql::Row& row) { out.push_back(sql::ReadVolume(row)); });
  return out;
}

Result SqliteRepository::UpdateVolumeStatus(Transaction& t, const std::string& volume_id, VolumeStatus expected, VolumeStatus next,
                                            std::int64_t now_ms, const std::string& error_message) {
  auto* db      = TX(t).Handle();
  int   changes = 0;
  auto  res     = Exec(db, sql::UPDATE_VOLUME_STATUS,
                       {volume_id, std::string(fleet::model::ToString(expected)), std::string(fleet::model::ToString(next)), now_ms,
                        sql::NullableText(error_message)},
                       &changes);
  if (!res || changes > 0) return res;

  bool exists = false;
  Query(db, sql::SELECT_VOLUME_STATUS, {volume_id}, [&](const sql::Row&) { exists = true; });
  if (!exists) return Result::Err(ErrorCode::NotFound, "volume " + volume_id);
  return Result::Err(ErrorCode::Conflict, "volume " + volume_id + " status moved");
}

// ------------------------------------------------------------------
// Worker tokens
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorkerToken(Transaction& t, const model::WorkerTokenRecord& r) {
  return Exec(TX(t).Handle(), sql::INSERT_WORKER_TOKEN,
              {r.instance_id, r.token_hash, r.token_prefix, r.created_at_ms, sql::NullableMillis(r.last_seen_at_ms),
               sql::NullableMillis(r.revoked_at_ms)});
}

std::optional<model::WorkerTokenRecord> SqliteRepository::GetWorkerToken(Transaction& t, const std::string& instance_id) {
  std::optional<model::WorkerTokenRecord> out;
  Query(TX(t).Handle(), sql::SELECT_WORKER_TOKEN, {instance_id}, [&](const sql::Row& row) { out = sql::ReadWorkerToken(row); });
  return out;
}

Result SqliteRepository::TouchWorkerToken(Transaction& t, const std::string& instance_id, std::int64_t now_ms) {
  int  changes = 0;
  auto res     = Exec(TX(t).Handle(), sql::TOUCH_WORKER_TOKEN, {instance_id, now_ms}, &changes);
  if (res && changes == 0) return Result::Err(ErrorCode::NotFound, "token for " + instance_id);
  return res;
}

Result SqliteRepository::RevokeWorkerToken(Transaction& t, const std::string& instance_id, std::int64_t now_ms) {
  int  changes = 0;
  auto res     = Exec(TX(t).Handle(), sql::REVOKE_WORKER_TOKEN, {instance_id, now_ms}, &changes);
  if (res && changes == 0) return Result::Err(ErrorCode::NotFound, "token for " + instance_id);
  return res;
}

// ------------------------------------------------------------------
// Action logs
// ------------------------------------------------------------------

Result SqliteRepository::InsertActionLog(Transaction& t, const model::ActionLogRecord& r) {
  return Exec(TX(t).Handle(), sql::INSERT_ACTION_LOG,
              {r.id, r.instance_id, r.action_type, std::string(fleet::model::ToString(r.status)), sql::NullableText(r.error_message),
               sql::NullableText(r.metadata_json), r.created_at_ms, sql::NullableMillis(r.completed_at_ms),
               sql::NullableMillis(r.duration_ms)});
}

Result SqliteRepository::CompleteActionLog(Transaction& t, const model::ActionLogRecord& r) {
  int  changes = 0;
  auto res     = Exec(TX(t).Handle(), sql::COMPLETE_ACTION_LOG,
                      {r.id, std::string(fleet::model::ToString(r.status)), sql::NullableText(r.error_message),
                       sql::NullableText(r.metadata_json), sql::NullableMillis(r.completed_at_ms), r.duration_ms},
                      &changes);
  if (res && changes == 0) return Result::Err(ErrorCode::NotFound, "action log " + r.id);
  return res;
}

std::vector<model::ActionLogRecord> SqliteRepository::ListActionLogs(Transaction& t, const std::string& instance_id) {
  static const std::string            kSql = sql::SelectActionLogsSql("rowid");
  std::vector<model::ActionLogRecord> out;
  Query(TX(t).Handle(), kSql, {instance_id}, [&](const sql::Row& row) { out.push_back(sql::ReadActionLog(row)); });
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCatalogInstanceType(Transaction& t, const model::CatalogInstanceTypeRecord& r) {
  return Exec(TX(t).Handle(), sql::UPSERT_CATALOG_INSTANCE_TYPE,
              {r.provider_code, r.zone, r.code, sql::NullableText(r.name), r.cost_per_hour, static_cast<int64_t>(r.cpu_count),
               static_cast<int64_t>(r.ram_gb), static_cast<int64_t>(r.gpu_count), static_cast<int64_t>(r.vram_per_gpu_gb),
               static_cast<int64_t>(r.bandwidth_bps), r.updated_at_ms});
}

std::vector<model::CatalogInstanceTypeRecord> SqliteRepository::ListCatalogInstanceTypes(Transaction& t,
                                                                                         const std::string& provider_code) {
  std::vector<model::CatalogInstanceTypeRecord> out;
  Query(TX(t).Handle(), sql::SELECT_CATALOG, {provider_code},
        [&](const sql::Row& row) { out.push_back(sql::ReadCatalogInstanceType(row)); });
  return out;
}

} // namespace fleet::db::sqlite
