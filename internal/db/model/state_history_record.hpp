#pragma once

#include <cstdint>
#include <string>

#include "internal/model/instance_status.hpp"

namespace fleet::db::model {

// Append-only audit row, one per applied transition.
struct StateHistoryRecord {
  std::int64_t id = 0; // assigned by the backend

  std::string                  instance_id;
  fleet::model::InstanceStatus from_status = fleet::model::InstanceStatus::kProvisioning;
  fleet::model::InstanceStatus to_status   = fleet::model::InstanceStatus::kProvisioning;
  std::string                  reason;
  std::string                  metadata_json;
  std::int64_t                 created_at_ms = 0;
};

} // namespace fleet::db::model
