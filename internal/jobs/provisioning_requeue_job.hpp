#pragma once

#include "reconciliation_job.hpp"

namespace fleet::jobs {

/*
  Backstop for lost or failed PROVISION commands.

  Claims provisioning rows older than provisioning_requeue_after_seconds
  with retries left, bumps retry_count in the claim and re-runs the
  provisioning workflow. Rows with no retries left are failed with
  PROVISIONING_RETRIES_EXHAUSTED before the claim.
*/
class ProvisioningRequeueJob final : public ReconciliationJob {
 public:
  ProvisioningRequeueJob(JobContext context, config::JobSettings settings);
  ~ProvisioningRequeueJob() override;

 protected:
  std::vector<db::model::InstanceRecord> Claim() override;
  void                                   Process(const db::model::InstanceRecord& instance) override;

 private:
  std::size_t FailExhausted(std::int64_t now_ms);
};

} // namespace fleet::jobs
