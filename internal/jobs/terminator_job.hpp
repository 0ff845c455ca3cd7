#pragma once

#include "reconciliation_job.hpp"

namespace fleet::jobs {

// Finishes terminating rows: provider server, flagged volumes, token.
class TerminatorJob final : public ReconciliationJob {
 public:
  TerminatorJob(JobContext context, config::JobSettings settings);
  ~TerminatorJob() override;

 protected:
  std::vector<db::model::InstanceRecord> Claim() override;
  void                                   Process(const db::model::InstanceRecord& instance) override;
};

} // namespace fleet::jobs
