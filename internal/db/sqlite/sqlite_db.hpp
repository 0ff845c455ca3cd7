#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace fleet::db::sqlite {

struct SqliteOptions {
  std::string path;
  bool        wal_mode{true};
  int         busy_timeout_ms{5000};
};

/*
  Owns the process-wide sqlite3 connection.

  Every thread shares the handle; SqliteTransaction holds TxMutex() for
  its whole lifetime, so at most one transaction is open at a time.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  explicit SqliteDB(std::string path) : SqliteDB(SqliteOptions{std::move(path)}) {
  }
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  // Runs one or more statements without result rows; throws on error.
  void Exec(const std::string& sql);

  int  UserVersion();
  void SetUserVersion(int version);

 private:
  SqliteOptions options_;
  sqlite3*      db_ = nullptr;
  std::mutex    tx_mutex_;
};

/*
  Brings the file up to sql::kSchemaVersion inside one transaction and
  stamps PRAGMA user_version. Throws if the file was written by a newer
  schema.
*/
void ApplySchema(SqliteDB& db);

} // namespace fleet::db::sqlite
