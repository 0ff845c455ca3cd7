#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/instance_status.hpp"

namespace fleet::db {

enum class LeaseColumn {
  kLastHealthCheck,
  kLastReconciliation,
};

/*
  Batch claim for the reconciliation jobs.

  Selects up to `limit` rows in one of `statuses` whose lease column is
  NULL or older than `lease_expired_before_ms`, stamps the lease with
  `now_ms` and returns the updated rows. Rows locked by a concurrent
  claim are skipped, so two claimers never receive the same row.
*/
struct ClaimQuery {
  std::vector<fleet::model::InstanceStatus> statuses;

  LeaseColumn  lease                   = LeaseColumn::kLastReconciliation;
  std::int64_t now_ms                  = 0;
  std::int64_t lease_expired_before_ms = 0;

  // Extra filters, unset = not applied.
  std::int64_t                created_before_ms = 0;
  bool                        require_provider_instance_id = false;
  std::optional<std::int32_t> retry_count_below;
  std::optional<std::int32_t> termination_attempts_below;

  // Claiming also bumps retry_count (provisioning requeue).
  bool increment_retry_count = false;

  std::size_t limit = 50;
};

} // namespace fleet::db
