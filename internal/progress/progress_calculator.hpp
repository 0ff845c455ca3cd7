#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/instance_status.hpp"

namespace fleet::progress {

/*
  Readiness percentage (0..100) shown next to an instance.

  Derived from the status and the successful action types recorded for
  the instance. Observability only: nothing branches on it.

  Adding a completed action never lowers the result.
*/
std::uint32_t ComputeProgress(fleet::model::InstanceStatus status, const std::vector<std::string>& completed_actions);

} // namespace fleet::progress
