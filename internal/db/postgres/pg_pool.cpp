#include "pg_pool.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace fleet::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  namespace sql = fleet::db::sql;

  conn.prepare(kInsertInstance, sql::ForPostgres(sql::InsertInstanceSql()));
  conn.prepare(kGetInstance, sql::ForPostgres(sql::SelectInstanceSql()));

  auto lock_sql = sql::ForPostgres(sql::SelectInstanceSql());
  lock_sql.insert(lock_sql.size() - 1, " FOR UPDATE");
  conn.prepare(kLockInstance, lock_sql);

  conn.prepare(kUpdateInstance, sql::ForPostgres(sql::UpdateInstanceSql()));
  conn.prepare(kUpdateWorkerFields, sql::ForPostgres(sql::UpdateWorkerFieldsSql()));
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      --live_connections_;
      delete conn;
    }
  }
  cv_.notify_one();
}

void ApplySchema(PgPool& pool) {
  namespace sql = fleet::db::sql;

  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  tx.exec("SELECT pg_advisory_xact_lock(7402150113)");
  tx.exec("CREATE TABLE IF NOT EXISTS fleet_schema (version INTEGER NOT NULL)");

  const auto rows  = tx.exec("SELECT COALESCE(MAX(version), 0) FROM fleet_schema");
  const int  found = rows[0][0].as<int>();
  if (found > sql::kSchemaVersion) {
    throw std::runtime_error("postgres schema version " + std::to_string(found) + " is newer than supported version " +
                             std::to_string(sql::kSchemaVersion));
  }
  if (found < sql::kSchemaVersion) {
    for (const auto& statement : sql::PostgresSchema()) {
      tx.exec(statement);
    }
    tx.exec("DELETE FROM fleet_schema");
    tx.exec("INSERT INTO fleet_schema (version) VALUES (" + std::to_string(sql::kSchemaVersion) + ")");
  }
  tx.commit();
}

} // namespace fleet::db::postgres
