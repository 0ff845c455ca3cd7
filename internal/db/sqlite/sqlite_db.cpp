#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"

namespace fleet::db::sqlite {

using observability::IntField;
using observability::StringField;

namespace {

constexpr int kOpenFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

std::string Describe(sqlite3* db, const std::string& path) {
  return "sqlite " + path + ": " + (db != nullptr ? sqlite3_errmsg(db) : "out of memory");
}

} // namespace

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  if (sqlite3_open_v2(options_.path.c_str(), &db_, kOpenFlags, nullptr) != SQLITE_OK) {
    const auto message = Describe(db_, options_.path);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(message);
  }

  if (sqlite3_busy_timeout(db_, options_.busy_timeout_ms) != SQLITE_OK) {
    const auto message = Describe(db_, options_.path);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(message);
  }

  // claims and lifecycle writes are short; NORMAL is durable enough under WAL
  Exec(options_.wal_mode ? "PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;" : "PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* error = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) == SQLITE_OK) {
    return;
  }
  std::string message = "sqlite " + options_.path + ": " + (error != nullptr ? error : sqlite3_errmsg(db_));
  sqlite3_free(error);
  throw std::runtime_error(message);
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error(Describe(db_, options_.path));
  }
  const int version = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
  sqlite3_finalize(stmt);
  return version;
}

void SqliteDB::SetUserVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void ApplySchema(SqliteDB& db) {
  std::lock_guard lock(db.TxMutex());

  const int found = db.UserVersion();
  if (found > sql::kSchemaVersion) {
    throw std::runtime_error("sqlite " + db.Path() + ": schema version " + std::to_string(found) +
                             " is newer than supported version " + std::to_string(sql::kSchemaVersion));
  }
  if (found == sql::kSchemaVersion) {
    return;
  }

  db.Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& statement : sql::SqliteSchema()) {
      db.Exec(statement);
    }
    db.SetUserVersion(sql::kSchemaVersion);
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(db.Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
  FLEET_LOG_INFO("sqlite schema applied", {StringField("path", db.Path()), IntField("from", found),
                                          IntField("to", sql::kSchemaVersion)});
}

} // namespace fleet::db::sqlite
