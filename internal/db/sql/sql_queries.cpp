#include "sql_queries.hpp"

#include <cctype>

#include "row_mapping.hpp"
#include "schema.hpp"

namespace fleet::db::sql {

namespace {

std::string Placeholder(int index) {
  return "?" + std::to_string(index);
}

std::string Placeholders(int first, int count) {
  std::string out;
  for (int i = 0; i < count; ++i) {
    if (i > 0) out += ",";
    out += Placeholder(first + i);
  }
  return out;
}

} // namespace

std::string ForPostgres(std::string_view sql) {
  std::string out(sql);
  for (std::size_t i = 0; i + 1 < out.size(); ++i) {
    if (out[i] == '?' && std::isdigit(static_cast<unsigned char>(out[i + 1]))) {
      out[i] = '$';
    }
  }
  return out;
}

std::string LeaseColumnName(LeaseColumn lease) {
  return lease == LeaseColumn::kLastHealthCheck ? "last_health_check_ms" : "last_reconciliation_ms";
}

std::string InsertInstanceSql() {
  return std::string("INSERT INTO instances(") + kInstanceColumns + ") VALUES(" + Placeholders(1, kInstanceColumnCount) + ");";
}

std::string SelectInstanceSql() {
  return std::string("SELECT ") + kInstanceColumns + " FROM instances WHERE id=?1;";
}

std::string SelectInstanceByProviderIdSql() {
  return std::string("SELECT ") + kInstanceColumns +
         " FROM instances WHERE provider_code=?1 AND provider_instance_id=?2 ORDER BY created_at_ms DESC LIMIT 1;";
}

std::string SelectInstancesByStatusSql(std::size_t status_count) {
  return std::string("SELECT ") + kInstanceColumns + " FROM instances WHERE status IN (" +
         Placeholders(1, static_cast<int>(status_count)) + ") ORDER BY created_at_ms, id;";
}

std::string UpdateInstanceSql() {
  const auto& names = InstanceColumnNames();

  std::string sql = "UPDATE instances SET ";
  for (int i = 1; i < kInstanceLifecycleColumnCount; ++i) {
    if (i > 1) sql += ",";
    sql += names[i] + "=" + Placeholder(i + 1);
  }
  sql += " WHERE id=?1 AND status=" + Placeholder(kInstanceLifecycleColumnCount + 1) + " AND NOT is_archived;";
  return sql;
}

std::string UpdateWorkerFieldsSql() {
  const auto& names = InstanceColumnNames();

  std::string sql = "UPDATE instances SET ";
  for (int i = kInstanceLifecycleColumnCount; i < kInstanceColumnCount; ++i) {
    if (i > kInstanceLifecycleColumnCount) sql += ",";
    sql += names[i] + "=" + Placeholder(i - kInstanceLifecycleColumnCount + 2);
  }
  sql += " WHERE id=?1 AND NOT is_archived;";
  return sql;
}

std::string ClaimSelectSql(const ClaimQuery& q, Params& params) {
  const auto lease = LeaseColumnName(q.lease);
  auto       next  = [&params](Param value) {
    params.push_back(std::move(value));
    return Placeholder(static_cast<int>(params.size()));
  };

  std::string sql = "SELECT id FROM instances WHERE status IN (";
  for (std::size_t i = 0; i < q.statuses.size(); ++i) {
    if (i > 0) sql += ",";
    sql += next(std::string(fleet::model::ToString(q.statuses[i])));
  }
  sql += ") AND (" + lease + " IS NULL OR " + lease + " < " + next(q.lease_expired_before_ms) + ")";

  if (q.created_before_ms != 0) {
    sql += " AND created_at_ms < " + next(q.created_before_ms);
  }
  if (q.require_provider_instance_id) {
    sql += " AND provider_instance_id IS NOT NULL AND provider_instance_id <> ''";
  }
  if (q.retry_count_below) {
    sql += " AND retry_count < " + next(*q.retry_count_below);
  }
  if (q.termination_attempts_below) {
    sql += " AND termination_attempts < " + next(*q.termination_attempts_below);
  }

  sql += " ORDER BY COALESCE(" + lease + ",0), created_at_ms LIMIT " + next(static_cast<int64_t>(q.limit));
  return sql;
}

std::string ClaimStampSql(const ClaimQuery& q, int now_placeholder) {
  std::string sql = LeaseColumnName(q.lease) + "=" + Placeholder(now_placeholder);
  if (q.increment_retry_count) {
    sql += ", retry_count=retry_count+1";
  }
  return sql;
}

std::string InsertVolumeSql() {
  return std::string("INSERT INTO instance_volumes(") + kVolumeColumns + ") VALUES(" + Placeholders(1, 14) + ");";
}

std::string SelectVolumesSql(std::string_view order_column) {
  return std::string("SELECT ") + kVolumeColumns + " FROM instance_volumes WHERE instance_id=?1 ORDER BY " +
         std::string(order_column) + ";";
}

std::string SelectActionLogsSql(std::string_view order_column) {
  return "SELECT id,instance_id,action_type,status,error_message,metadata,created_at_ms,completed_at_ms,duration_ms"
         " FROM action_logs WHERE instance_id=?1 ORDER BY " +
         std::string(order_column) + ";";
}

} // namespace fleet::db::sql
