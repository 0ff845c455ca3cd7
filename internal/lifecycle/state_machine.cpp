#include "state_machine.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace fleet::lifecycle {

using fleet::model::InstanceStatus;
using fleet::model::ToString;

InstanceStateMachine::InstanceStateMachine(std::shared_ptr<db::Repository> repository, util::MillisClock clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

void InstanceStateMachine::ApplyEntry(db::model::InstanceRecord& record, const TransitionRequest& request, std::int64_t now_ms) const {
  record.status = request.to;

  switch (request.to) {
    case InstanceStatus::kBooting:
      // fresh attempt: new boot clock, failure counter and error reset
      record.boot_started_at_ms       = now_ms;
      record.installing_started_at_ms = 0;
      record.starting_started_at_ms   = 0;
      record.health_check_failures    = 0;
      record.error_code.clear();
      record.error_message.clear();
      break;
    case InstanceStatus::kInstalling:
      record.installing_started_at_ms = now_ms;
      break;
    case InstanceStatus::kStarting:
      record.starting_started_at_ms = now_ms;
      break;
    case InstanceStatus::kReady:
      record.ready_at_ms = now_ms;
      break;
    case InstanceStatus::kDraining:
      record.draining_started_at_ms = now_ms;
      break;
    case InstanceStatus::kTerminating:
      record.terminating_started_at_ms = now_ms;
      break;
    case InstanceStatus::kTerminated:
      record.terminated_at_ms = now_ms;
      break;
    case InstanceStatus::kArchived:
      record.archived_at_ms = now_ms;
      record.is_archived    = true;
      break;
    case InstanceStatus::kProvisioningFailed:
    case InstanceStatus::kStartupFailed:
    case InstanceStatus::kFailed:
      record.failed_at_ms = now_ms;
      break;
    case InstanceStatus::kProvisioning:
      break;
  }

  if (!request.error_code.empty()) {
    record.error_code = request.error_code;
  }
  if (!request.error_message.empty()) {
    record.error_message = request.error_message;
  }
  if (request.mutate) {
    request.mutate(record);
  }
}

TransitionOutcome InstanceStateMachine::Transition(const TransitionRequest& request) {
  auto tx      = repository_->Begin();
  auto outcome = Transition(*tx, request);
  if (outcome == TransitionOutcome::kApplied) {
    tx->Commit();
  } else {
    tx->Rollback();
  }
  return outcome;
}

TransitionOutcome InstanceStateMachine::Transition(db::Transaction& tx, const TransitionRequest& request) {
  if (!fleet::model::CanTransition(request.from, request.to)) {
    throw util::InvalidState("illegal transition " + std::string(ToString(request.from)) + " -> " +
                             std::string(ToString(request.to)) + " for instance " + request.instance_id);
  }

  auto current = repository_->LockInstance(tx, request.instance_id);
  if (!current) {
    return TransitionOutcome::kNotFound;
  }
  if (current->status != request.from || current->is_archived) {
    return TransitionOutcome::kAlreadyApplied;
  }

  const auto now_ms = clock_();
  auto       record = *current;
  ApplyEntry(record, request, now_ms);

  auto res = repository_->UpdateInstance(tx, record, request.from);
  if (res.code == db::ErrorCode::Conflict || res.code == db::ErrorCode::Immutable) {
    return TransitionOutcome::kAlreadyApplied;
  }
  core::ThrowIfDbError(res, "transition instance " + request.instance_id);

  db::model::StateHistoryRecord history;
  history.instance_id   = request.instance_id;
  history.from_status   = request.from;
  history.to_status     = request.to;
  history.reason        = request.reason;
  history.metadata_json = request.metadata_json;
  history.created_at_ms = now_ms;
  core::ThrowIfDbError(repository_->InsertStateHistory(tx, history), "record history for " + request.instance_id);

  observability::Metrics::Instance().RecordTransition(ToString(request.from), ToString(request.to));
  FLEET_LOG_INFO("instance transition", {observability::StringField("instance_id", request.instance_id),
                                         observability::StringField("from", ToString(request.from)),
                                         observability::StringField("to", ToString(request.to)),
                                         observability::StringField("reason", request.reason)});
  return TransitionOutcome::kApplied;
}

TransitionOutcome InstanceStateMachine::Archive(const std::string& instance_id, const std::string& reason) {
  auto tx      = repository_->Begin();
  auto current = repository_->LockInstance(*tx, instance_id);
  if (!current) {
    return TransitionOutcome::kNotFound;
  }
  if (current->status == InstanceStatus::kArchived) {
    return TransitionOutcome::kAlreadyApplied;
  }

  TransitionRequest request;
  request.instance_id = instance_id;
  request.from        = current->status;
  request.to          = InstanceStatus::kArchived;
  request.reason      = reason;

  auto outcome = Transition(*tx, request);
  if (outcome == TransitionOutcome::kApplied) {
    tx->Commit();
  }
  return outcome;
}

std::vector<db::model::StateHistoryRecord> InstanceStateMachine::History(const std::string& instance_id) {
  auto tx      = repository_->Begin();
  auto history = repository_->ListStateHistory(*tx, instance_id);
  tx->Commit();
  return history;
}

} // namespace fleet::lifecycle
