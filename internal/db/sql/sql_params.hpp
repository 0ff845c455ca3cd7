#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fleet::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ?1 ?2 ?3

  Both use ordered binding, so one Params list serves both backends.
*/

using Param = std::variant<std::nullptr_t, bool, int32_t, int64_t, uint64_t, double, std::string>;

using Params = std::vector<Param>;

// Nullable column helpers: empty / zero are stored as NULL.
inline Param NullableText(const std::string& value) {
  return value.empty() ? Param{nullptr} : Param{value};
}

inline Param NullableMillis(int64_t value) {
  return value == 0 ? Param{nullptr} : Param{value};
}

inline Param NullablePort(uint32_t value) {
  return value == 0 ? Param{nullptr} : Param{static_cast<int32_t>(value)};
}

template <typename T>
Param Nullable(const std::optional<T>& value) {
  return value ? Param{*value} : Param{nullptr};
}

} // namespace fleet::db::sql
