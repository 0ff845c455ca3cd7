#pragma once

#include <optional>

#include "reconciliation_job.hpp"

namespace fleet::jobs {

/*
  Stuck-state sweeper.

  Every non-terminal phase except ready has an age limit, measured from
  the timestamp stamped when the row entered it. Rows past the limit are
  force-failed with RECOVERY_TIMEOUT: coming-up phases to startup_failed,
  the others to failed.

  The sweep takes no lease. Each transition is a compare-and-swap on the
  observed status, so a row another job moved on in the meantime is left
  alone, and the lease columns stay with the jobs that own them.
*/
class RecoveryJob final : public ReconciliationJob {
 public:
  RecoveryJob(JobContext context, config::JobSettings settings);
  ~RecoveryJob() override;

  // Age limit for `status` in ms, nullopt when the phase is never swept.
  std::optional<std::int64_t> LimitMs(fleet::model::InstanceStatus status) const;

  // Timestamp the row entered its current phase.
  static std::int64_t EnteredAtMs(const db::model::InstanceRecord& instance);

 protected:
  std::vector<db::model::InstanceRecord> Claim() override;
  void                                   Process(const db::model::InstanceRecord& instance) override;
};

} // namespace fleet::jobs
