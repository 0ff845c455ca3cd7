#include "watch_dog_job.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/model/error_codes.hpp"
#include "internal/observability/logging.hpp"

namespace fleet::jobs {

using fleet::model::InstanceStatus;
using observability::StringField;

WatchDogJob::WatchDogJob(JobContext context, config::JobSettings settings)
    : ReconciliationJob("watch_dog", std::move(context), settings) {
}

WatchDogJob::~WatchDogJob() {
  Stop();
}

std::vector<db::model::InstanceRecord> WatchDogJob::Claim() {
  const auto now = NowMs();

  db::ClaimQuery query;
  query.statuses                     = {InstanceStatus::kReady, InstanceStatus::kDraining};
  query.lease                        = db::LeaseColumn::kLastReconciliation;
  query.now_ms                       = now;
  query.lease_expired_before_ms      = now - util::SecondsToMillis(context_.lifecycle.watch_dog_recheck_seconds);
  query.require_provider_instance_id = true;
  query.limit                        = settings_.batch_size;
  return ClaimBatch(query);
}

void WatchDogJob::Process(const db::model::InstanceRecord& instance) {
  auto adapter = context_.providers->Find(instance.provider_code);
  if (!adapter) {
    FLEET_LOG_WARN("watch-dog skipped, provider not configured", {StringField("provider", instance.provider_code)});
    ReleaseLease(instance.id, db::LeaseColumn::kLastReconciliation);
    return;
  }

  bool exists = true;
  auto res    = adapter->InstanceExists(instance.zone, instance.provider_instance_id, exists);
  if (!res) {
    FLEET_LOG_WARN("watch-dog existence check failed", {StringField("code", provider::ToString(res.code)),
                                                        StringField("error", res.message)});
    ReleaseLease(instance.id, db::LeaseColumn::kLastReconciliation);
    return;
  }

  if (!exists) {
    MarkDeletedByProvider(instance);
    return;
  }

  std::size_t tracked = 0;
  {
    auto tx = context_.repository->Begin();
    tracked = context_.repository->ListVolumes(*tx, instance.id).size();
  }
  if (tracked > 0) {
    return;
  }

  std::vector<provider::AttachedVolume> volumes;
  auto list = adapter->ListAttachedVolumes(instance.zone, instance.provider_instance_id, volumes);
  if (list) {
    context_.workflows->ImportVolumes(instance, volumes);
  }
}

void WatchDogJob::MarkDeletedByProvider(const db::model::InstanceRecord& instance) {
  auto tx = context_.repository->Begin();

  lifecycle::TransitionRequest request;
  request.instance_id = instance.id;
  request.from        = instance.status;
  request.to          = InstanceStatus::kTerminated;
  request.reason      = "provider_deleted";
  request.error_code  = std::string(fleet::model::error_code::kProviderDeleted);
  request.mutate      = [](db::model::InstanceRecord& record) {
    record.deleted_by_provider = true;
    record.deletion_reason     = "provider_deleted";
  };

  if (context_.state_machine->Transition(*tx, request) != lifecycle::TransitionOutcome::kApplied) {
    return;
  }

  auto revoke = context_.repository->RevokeWorkerToken(*tx, instance.id, NowMs());
  if (revoke.code != db::ErrorCode::NotFound) {
    core::ThrowIfDbError(revoke, "revoke worker token " + instance.id);
  }
  tx->Commit();

  FLEET_LOG_WARN("instance deleted at provider", {StringField("server_id", instance.provider_instance_id)});
}

} // namespace fleet::jobs
