#include "recovery_job.hpp"

#include <fmt/format.h>

#include "internal/model/error_codes.hpp"
#include "internal/observability/logging.hpp"

namespace fleet::jobs {

using fleet::model::InstanceStatus;
using observability::IntField;
using observability::StringField;

RecoveryJob::RecoveryJob(JobContext context, config::JobSettings settings)
    : ReconciliationJob("recovery", std::move(context), settings) {
}

RecoveryJob::~RecoveryJob() {
  Stop();
}

std::optional<std::int64_t> RecoveryJob::LimitMs(InstanceStatus status) const {
  const auto& limits = context_.lifecycle.recovery;
  switch (status) {
    case InstanceStatus::kProvisioning:
      return util::SecondsToMillis(limits.provisioning_seconds);
    case InstanceStatus::kBooting:
      return util::SecondsToMillis(limits.booting_seconds);
    case InstanceStatus::kInstalling:
      return util::SecondsToMillis(limits.installing_seconds);
    case InstanceStatus::kStarting:
      return util::SecondsToMillis(limits.starting_seconds);
    case InstanceStatus::kDraining:
      return util::SecondsToMillis(limits.draining_seconds);
    case InstanceStatus::kTerminating:
      return util::SecondsToMillis(limits.terminating_seconds);
    default:
      return std::nullopt;
  }
}

std::int64_t RecoveryJob::EnteredAtMs(const db::model::InstanceRecord& instance) {
  std::int64_t entered = 0;
  switch (instance.status) {
    case InstanceStatus::kBooting:
      entered = instance.boot_started_at_ms;
      break;
    case InstanceStatus::kInstalling:
      entered = instance.installing_started_at_ms;
      break;
    case InstanceStatus::kStarting:
      entered = instance.starting_started_at_ms;
      break;
    case InstanceStatus::kDraining:
      entered = instance.draining_started_at_ms;
      break;
    case InstanceStatus::kTerminating:
      entered = instance.terminating_started_at_ms;
      break;
    default:
      break;
  }
  return entered != 0 ? entered : instance.created_at_ms;
}

std::vector<db::model::InstanceRecord> RecoveryJob::Claim() {
  const auto now = NowMs();

  std::vector<db::model::InstanceRecord> rows;
  {
    auto tx = context_.repository->Begin();
    rows    = context_.repository->ListInstancesByStatus(
        *tx, {InstanceStatus::kProvisioning, InstanceStatus::kBooting, InstanceStatus::kInstalling, InstanceStatus::kStarting,
              InstanceStatus::kDraining, InstanceStatus::kTerminating});
  }

  std::vector<db::model::InstanceRecord> stuck;
  for (auto& row : rows) {
    auto limit = LimitMs(row.status);
    if (limit && now - EnteredAtMs(row) > *limit) {
      stuck.push_back(std::move(row));
    }
    if (stuck.size() >= settings_.batch_size) break;
  }
  return stuck;
}

void RecoveryJob::Process(const db::model::InstanceRecord& instance) {
  const auto age_s  = (NowMs() - EnteredAtMs(instance)) / 1000;
  const auto status = fleet::model::ToString(instance.status);

  lifecycle::TransitionRequest request;
  request.instance_id   = instance.id;
  request.from          = instance.status;
  request.to            = fleet::model::IsComingUp(instance.status) ? InstanceStatus::kStartupFailed : InstanceStatus::kFailed;
  request.reason        = fmt::format("stuck in {} for {}s", status, age_s);
  request.error_code    = std::string(fleet::model::error_code::kRecoveryTimeout);
  request.error_message = request.reason;

  if (context_.state_machine->Transition(request) == lifecycle::TransitionOutcome::kApplied) {
    FLEET_LOG_WARN("recovered stuck instance",
                   {StringField("status", status), IntField("age_s", age_s), StringField("to", fleet::model::ToString(request.to))});
  }
}

} // namespace fleet::jobs
