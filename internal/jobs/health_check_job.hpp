#pragma once

#include <optional>

#include "reconciliation_job.hpp"

namespace fleet::jobs {

/*
  Drives booting -> installing -> starting -> ready.

  A fresh worker heartbeat is trusted over probing. Without one the job
  escalates probes: reachability port, then /readyz, then /v1/models.
  Coming-up phases time out into startup_failed, as does a row whose
  consecutive failed checks reach health_check_max_failures.
  startup_failed rows with a fresh heartbeat self-heal back to booting a
  bounded number of times.
*/
class HealthCheckJob final : public ReconciliationJob {
 public:
  HealthCheckJob(JobContext context, config::JobSettings settings);
  ~HealthCheckJob() override;

 protected:
  std::vector<db::model::InstanceRecord> Claim() override;
  void                                   Process(const db::model::InstanceRecord& instance) override;

 private:
  bool HeartbeatFresh(const db::model::InstanceRecord& instance) const;

  // true when the row timed out and was failed
  bool CheckTimeouts(const db::model::InstanceRecord& instance);

  // Fills in a missing IP. false when there is still none.
  bool EnsureIp(db::model::InstanceRecord& instance);

  // Next status the worker has proven it reached, if any.
  std::optional<fleet::model::InstanceStatus> NextStep(const db::model::InstanceRecord& instance, bool heartbeat_fresh);

  void SelfHeal(const db::model::InstanceRecord& instance);
  void RecordMilestones(const std::string& instance_id, fleet::model::InstanceStatus reached, bool via_heartbeat);
  void BumpFailures(const db::model::InstanceRecord& instance);
};

} // namespace fleet::jobs
