#pragma once

#include <cstdint>
#include <string>

namespace fleet::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Prevents driver types leaking into the row mapping code.
  NULL reads as empty string / zero.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual int64_t     GetInt64(int col) const = 0;
  virtual double      GetDouble(int col) const = 0;
  virtual bool        GetBool(int col) const = 0;
  virtual bool        IsNull(int col) const = 0;

  int32_t GetInt(int col) const {
    return static_cast<int32_t>(GetInt64(col));
  }

  uint64_t GetU64(int col) const {
    return static_cast<uint64_t>(GetInt64(col));
  }
};

}
