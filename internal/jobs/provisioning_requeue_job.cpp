#include "provisioning_requeue_job.hpp"

#include "internal/model/error_codes.hpp"
#include "internal/observability/logging.hpp"

namespace fleet::jobs {

using fleet::model::InstanceStatus;
using observability::IntField;
using observability::StringField;

ProvisioningRequeueJob::ProvisioningRequeueJob(JobContext context, config::JobSettings settings)
    : ReconciliationJob("provisioning_requeue", std::move(context), settings) {
}

ProvisioningRequeueJob::~ProvisioningRequeueJob() {
  Stop();
}

std::size_t ProvisioningRequeueJob::FailExhausted(std::int64_t now_ms) {
  const auto& lifecycle     = context_.lifecycle;
  const auto  created_limit = now_ms - util::SecondsToMillis(lifecycle.provisioning_requeue_after_seconds);
  const auto  lease_limit   = now_ms - util::SecondsToMillis(lifecycle.reconciliation_lease_seconds);

  std::vector<db::model::InstanceRecord> rows;
  {
    auto tx = context_.repository->Begin();
    rows    = context_.repository->ListInstancesByStatus(*tx, {InstanceStatus::kProvisioning});
  }

  std::size_t failed = 0;
  for (const auto& row : rows) {
    if (row.retry_count < lifecycle.provisioning_max_retries || row.created_at_ms >= created_limit) continue;
    // a worker still holds it; its own failure path decides
    if (row.last_reconciliation_ms > lease_limit) continue;

    lifecycle::TransitionRequest request;
    request.instance_id   = row.id;
    request.from          = InstanceStatus::kProvisioning;
    request.to            = InstanceStatus::kProvisioningFailed;
    request.reason        = std::string(fleet::model::error_code::kProvisioningRetriesExhausted);
    request.error_code    = std::string(fleet::model::error_code::kProvisioningRetriesExhausted);
    request.error_message = row.error_message.empty() ? "provisioning retries exhausted" : row.error_message;

    if (context_.state_machine->Transition(request) == lifecycle::TransitionOutcome::kApplied) {
      ++failed;
      FLEET_LOG_WARN("provisioning retries exhausted",
                     {StringField("instance_id", row.id), IntField("retry_count", row.retry_count)});
    }
  }
  return failed;
}

std::vector<db::model::InstanceRecord> ProvisioningRequeueJob::Claim() {
  const auto now = NowMs();
  FailExhausted(now);

  db::ClaimQuery query;
  query.statuses                = {InstanceStatus::kProvisioning};
  query.lease                   = db::LeaseColumn::kLastReconciliation;
  query.now_ms                  = now;
  query.lease_expired_before_ms = now - util::SecondsToMillis(context_.lifecycle.reconciliation_lease_seconds);
  query.created_before_ms       = now - util::SecondsToMillis(context_.lifecycle.provisioning_requeue_after_seconds);
  query.retry_count_below       = context_.lifecycle.provisioning_max_retries;
  query.increment_retry_count   = true;
  query.limit                   = settings_.batch_size;
  return ClaimBatch(query);
}

void ProvisioningRequeueJob::Process(const db::model::InstanceRecord& instance) {
  FLEET_LOG_INFO("requeueing provisioning", {IntField("retry_count", instance.retry_count)});
  context_.workflows->ResumeProvisioning(instance);
}

} // namespace fleet::jobs
