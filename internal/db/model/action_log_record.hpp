#pragma once

#include <cstdint>
#include <string>

#include "internal/model/action_type.hpp"

namespace fleet::db::model {

struct ActionLogRecord {
  std::string                id;
  std::string                instance_id;
  std::string                action_type;
  fleet::model::ActionStatus status = fleet::model::ActionStatus::kInProgress;
  std::string                error_message;
  std::string                metadata_json;
  std::int64_t               created_at_ms   = 0;
  std::int64_t               completed_at_ms = 0;
  std::int64_t               duration_ms     = 0;
};

} // namespace fleet::db::model
