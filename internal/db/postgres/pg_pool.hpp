#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace fleet::db::postgres {

/*
  PgPool

  Connection pool used by PgRepository.

  - Each transaction checks out its own connection.
  - libpqxx connections are NOT thread-safe, never share one.
  - Hot statements are prepared once per connection.
  - Acquire() blocks while max_connections are checked out.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction holds shared_ptr<pqxx::connection>; dropping it returns
    the connection to the pool (or closes it when the pool is gone).
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

  // Prepared statement names
  static constexpr const char* kInsertInstance     = "insert_instance";
  static constexpr const char* kGetInstance        = "get_instance";
  static constexpr const char* kLockInstance       = "lock_instance";
  static constexpr const char* kUpdateInstance     = "update_instance";
  static constexpr const char* kUpdateWorkerFields = "update_worker_fields";

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

/*
  Applies the schema under a transaction-scoped advisory lock, so replicas
  starting together do not race, and records sql::kSchemaVersion in
  fleet_schema. Throws if the database carries a newer version.
*/
void ApplySchema(PgPool& pool);

} // namespace fleet::db::postgres
