#pragma once

#include <string>
#include <string_view>

#include "internal/db/api/claim.hpp"
#include "sql_params.hpp"

namespace fleet::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  Placeholders are written as ?N (SQLite numbered parameters).
  ForPostgres() rewrites them to $N; everything else is the common
  subset both engines accept (NOT is_archived, ON CONFLICT ... excluded).
*/

std::string ForPostgres(std::string_view sql);

std::string LeaseColumnName(LeaseColumn lease);

// instances

std::string InsertInstanceSql();
std::string SelectInstanceSql();            // WHERE id=?1
std::string SelectInstanceByProviderIdSql(); // ?1 provider_code, ?2 provider_instance_id

// SELECT ... WHERE status IN (?1..?n); binds one status per placeholder.
std::string SelectInstancesByStatusSql(std::size_t status_count);

// Lifecycle columns ?2..?31, id ?1, expected status ?32.
std::string UpdateInstanceSql();

// Worker columns ?2..?9, id ?1.
std::string UpdateWorkerFieldsSql();

// SELECT id of claimable rows, oldest lease first. Appends the binds to `params`.
std::string ClaimSelectSql(const ClaimQuery& query, Params& params);

// SET part of the lease stamp; `now_placeholder` is the index of now_ms.
std::string ClaimStampSql(const ClaimQuery& query, int now_placeholder);

static constexpr const char* RELEASE_HEALTH_LEASE =
    "UPDATE instances SET last_health_check_ms=NULL WHERE id=?1;";

static constexpr const char* RELEASE_RECONCILIATION_LEASE =
    "UPDATE instances SET last_reconciliation_ms=NULL WHERE id=?1;";

// history

static constexpr const char* INSERT_STATE_HISTORY =
    "INSERT INTO instance_state_history(instance_id,from_status,to_status,reason,metadata,created_at_ms)"
    " VALUES(?1,?2,?3,?4,?5,?6)";

static constexpr const char* SELECT_STATE_HISTORY =
    "SELECT id,instance_id,from_status,to_status,reason,metadata,created_at_ms"
    " FROM instance_state_history WHERE instance_id=?1 ORDER BY id;";

// volumes

std::string InsertVolumeSql();

// `order_column` is rowid on SQLite and seq on Postgres.
std::string SelectVolumesSql(std::string_view order_column);

static constexpr const char* UPDATE_VOLUME_STATUS =
    "UPDATE instance_volumes SET status=?3, reconciled_at_ms=?4, error_message=?5,"
    " deleted_at_ms=CASE WHEN ?3='deleted' THEN ?4 ELSE deleted_at_ms END"
    " WHERE id=?1 AND status=?2;";

static constexpr const char* SELECT_VOLUME_STATUS =
    "SELECT status FROM instance_volumes WHERE id=?1;";

// worker tokens

static constexpr const char* INSERT_WORKER_TOKEN =
    "INSERT INTO worker_auth_tokens(instance_id,token_hash,token_prefix,created_at_ms,last_seen_at_ms,revoked_at_ms)"
    " VALUES(?1,?2,?3,?4,?5,?6);";

static constexpr const char* SELECT_WORKER_TOKEN =
    "SELECT instance_id,token_hash,token_prefix,created_at_ms,last_seen_at_ms,revoked_at_ms"
    " FROM worker_auth_tokens WHERE instance_id=?1;";

static constexpr const char* TOUCH_WORKER_TOKEN =
    "UPDATE worker_auth_tokens SET last_seen_at_ms=?2 WHERE instance_id=?1;";

static constexpr const char* REVOKE_WORKER_TOKEN =
    "UPDATE worker_auth_tokens SET revoked_at_ms=COALESCE(revoked_at_ms, ?2) WHERE instance_id=?1;";

// action logs

static constexpr const char* INSERT_ACTION_LOG =
    "INSERT INTO action_logs(id,instance_id,action_type,status,error_message,metadata,created_at_ms,completed_at_ms,duration_ms)"
    " VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9);";

static constexpr const char* COMPLETE_ACTION_LOG =
    "UPDATE action_logs SET status=?2, error_message=?3, metadata=?4, completed_at_ms=?5, duration_ms=?6"
    " WHERE id=?1;";

std::string SelectActionLogsSql(std::string_view order_column);

// catalog

static constexpr const char* UPSERT_CATALOG_INSTANCE_TYPE =
    "INSERT INTO catalog_instance_types"
    "(provider_code,zone,code,name,cost_per_hour,cpu_count,ram_gb,gpu_count,vram_per_gpu_gb,bandwidth_bps,updated_at_ms)"
    " VALUES(?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11)"
    " ON CONFLICT(provider_code,zone,code) DO UPDATE SET"
    " name=excluded.name,"
    " cost_per_hour=excluded.cost_per_hour,"
    " cpu_count=excluded.cpu_count,"
    " ram_gb=excluded.ram_gb,"
    " gpu_count=excluded.gpu_count,"
    " vram_per_gpu_gb=excluded.vram_per_gpu_gb,"
    " bandwidth_bps=excluded.bandwidth_bps,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_CATALOG =
    "SELECT provider_code,zone,code,name,cost_per_hour,cpu_count,ram_gb,gpu_count,vram_per_gpu_gb,bandwidth_bps,updated_at_ms"
    " FROM catalog_instance_types WHERE (CAST(?1 AS TEXT) = '' OR provider_code=?1) ORDER BY provider_code,zone,code;";

} // namespace fleet::db::sql
