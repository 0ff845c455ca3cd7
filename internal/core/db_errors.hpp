#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace fleet::core {

// Raises the service-level exception matching a failed store result.
inline void ThrowIfDbError(const fleet::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + std::string(fleet::db::ToString(result.code)) + ")";
  if (!result.message.empty()) message += ": " + result.message;
  if (result.Retryable()) {
    throw fleet::util::StoreContention(message);
  }

  switch (result.code) {
    case fleet::db::ErrorCode::AlreadyExists:
    case fleet::db::ErrorCode::ConstraintViolation:
      throw fleet::util::AlreadyExists(message);
    case fleet::db::ErrorCode::NotFound:
      throw fleet::util::NotFound(message);
    case fleet::db::ErrorCode::Conflict:
    case fleet::db::ErrorCode::Immutable:
      throw fleet::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace fleet::core
