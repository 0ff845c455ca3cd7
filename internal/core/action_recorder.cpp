#include "action_recorder.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace fleet::core {

using fleet::model::ActionStatus;

ActionRecorder::ActionRecorder(std::shared_ptr<db::Repository> repository, util::MillisClock clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

ActionHandle ActionRecorder::Begin(const std::string& instance_id, std::string_view action_type, const std::string& metadata_json) {
  ActionHandle handle{util::NewId(), instance_id, std::string(action_type), clock_()};

  db::model::ActionLogRecord record;
  record.id            = handle.id;
  record.instance_id   = instance_id;
  record.action_type   = handle.action_type;
  record.status        = ActionStatus::kInProgress;
  record.metadata_json = metadata_json;
  record.created_at_ms = handle.started_at_ms;

  auto tx  = repository_->Begin();
  auto res = repository_->InsertActionLog(*tx, record);
  if (res) {
    tx->Commit();
  } else {
    FLEET_LOG_WARN("action log insert failed", {observability::StringField("instance_id", instance_id),
                                                observability::StringField("action", handle.action_type),
                                                observability::StringField("error", res.message)});
  }
  return handle;
}

void ActionRecorder::Complete(const ActionHandle& handle, ActionStatus status, const std::string& error_message,
                              const std::string& metadata_json) {
  const auto now_ms = clock_();

  db::model::ActionLogRecord record;
  record.id              = handle.id;
  record.instance_id     = handle.instance_id;
  record.action_type     = handle.action_type;
  record.status          = status;
  record.error_message   = error_message;
  record.metadata_json   = metadata_json;
  record.completed_at_ms = now_ms;
  record.duration_ms     = now_ms - handle.started_at_ms;

  auto tx  = repository_->Begin();
  auto res = repository_->CompleteActionLog(*tx, record);
  if (res) {
    tx->Commit();
    return;
  }
  FLEET_LOG_WARN("action log completion failed", {observability::StringField("instance_id", handle.instance_id),
                                                  observability::StringField("action", handle.action_type),
                                                  observability::StringField("error", res.message)});
}

void ActionRecorder::Succeed(const ActionHandle& handle, const std::string& metadata_json) {
  Complete(handle, ActionStatus::kSuccess, {}, metadata_json);
}

void ActionRecorder::Fail(const ActionHandle& handle, const std::string& error_message) {
  Complete(handle, ActionStatus::kFailed, error_message, {});
}

void ActionRecorder::RecordSuccess(const std::string& instance_id, std::string_view action_type, const std::string& metadata_json) {
  Succeed(Begin(instance_id, action_type, metadata_json), metadata_json);
}

std::vector<std::string> ActionRecorder::CompletedActions(const std::string& instance_id) {
  auto tx   = repository_->Begin();
  auto logs = repository_->ListActionLogs(*tx, instance_id);
  tx->Commit();

  std::vector<std::string> out;
  for (const auto& log : logs) {
    if (log.status == ActionStatus::kSuccess) {
      out.push_back(log.action_type);
    }
  }
  return out;
}

} // namespace fleet::core
