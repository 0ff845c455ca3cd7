#pragma once

#include "reconciliation_job.hpp"

namespace fleet::jobs {

/*
  Orphan detection for serving instances.

  A ready or draining row whose server no longer exists at the provider
  is marked deleted_by_provider and moved to terminated. Live servers
  get their attached volumes imported when none are tracked yet.
*/
class WatchDogJob final : public ReconciliationJob {
 public:
  WatchDogJob(JobContext context, config::JobSettings settings);
  ~WatchDogJob() override;

 protected:
  std::vector<db::model::InstanceRecord> Claim() override;
  void                                   Process(const db::model::InstanceRecord& instance) override;

 private:
  void MarkDeletedByProvider(const db::model::InstanceRecord& instance);
};

} // namespace fleet::jobs
