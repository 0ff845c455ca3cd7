#pragma once

#include <cstdint>
#include <string>

#include "internal/model/instance_status.hpp"

namespace fleet::db::model {

// Block storage tracked for one instance. (instance_id, provider_volume_id)
// is unique among rows that are not deleted.
struct VolumeRecord {
  std::string id;
  std::string instance_id;
  std::string provider_volume_id;
  std::string volume_name;
  std::string volume_type;
  std::uint64_t size_bytes = 0;

  bool is_boot             = false;
  bool delete_on_terminate = true;

  fleet::model::VolumeStatus status = fleet::model::VolumeStatus::kAttached;

  std::int64_t created_at_ms    = 0;
  std::int64_t attached_at_ms   = 0;
  std::int64_t deleted_at_ms    = 0;
  std::int64_t reconciled_at_ms = 0;

  std::string error_message;
};

} // namespace fleet::db::model
