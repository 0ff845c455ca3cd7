#include "terminator_job.hpp"

namespace fleet::jobs {

using fleet::model::InstanceStatus;

TerminatorJob::TerminatorJob(JobContext context, config::JobSettings settings)
    : ReconciliationJob("terminator", std::move(context), settings) {
}

TerminatorJob::~TerminatorJob() {
  Stop();
}

std::vector<db::model::InstanceRecord> TerminatorJob::Claim() {
  const auto now = NowMs();

  db::ClaimQuery query;
  query.statuses                   = {InstanceStatus::kTerminating};
  query.lease                      = db::LeaseColumn::kLastReconciliation;
  query.now_ms                     = now;
  query.lease_expired_before_ms    = now - util::SecondsToMillis(context_.lifecycle.reconciliation_lease_seconds);
  query.termination_attempts_below = context_.lifecycle.terminate_max_attempts;
  query.limit                      = settings_.batch_size;
  return ClaimBatch(query);
}

void TerminatorJob::Process(const db::model::InstanceRecord& instance) {
  if (context_.workflows->ProcessTermination(instance.id) == core::TerminationResult::kPending) {
    // provider is still deleting; look again next tick instead of after the lease
    ReleaseLease(instance.id, db::LeaseColumn::kLastReconciliation);
  }
}

} // namespace fleet::jobs
