#include "heartbeat_service.hpp"

#include <algorithm>
#include <cctype>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace fleet::worker {

using observability::IntField;
using observability::StringField;

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

HeartbeatService::HeartbeatService(std::shared_ptr<db::Repository> repository, std::shared_ptr<WorkerAuth> auth,
                                   util::MillisClock clock, bool require_auth)
    : repository_(std::move(repository)), auth_(std::move(auth)), clock_(std::move(clock)), require_auth_(require_auth) {
}

bool HeartbeatService::IsValidWorkerStatus(const std::string& status) {
  return status == "starting" || status == "ready" || status == "draining" || status == "error";
}

db::model::InstanceRecord HeartbeatService::LoadWritable(db::Transaction& tx, const std::string& instance_id) {
  auto instance = repository_->GetInstance(tx, instance_id);
  if (!instance) {
    throw util::NotFound("instance not found: " + instance_id);
  }
  if (instance->is_archived) {
    throw util::InvalidState("instance is archived: " + instance_id);
  }
  return *instance;
}

std::int64_t HeartbeatService::ReportHeartbeat(const HeartbeatReport& report, const std::string& bearer) {
  const auto status = Lower(report.status);
  if (!IsValidWorkerStatus(status)) {
    throw util::InvalidArgument("invalid worker status: " + report.status);
  }
  if (!util::IsJsonObjectOrEmpty(report.metadata_json)) {
    throw util::InvalidArgument("worker metadata must be a JSON object");
  }

  auto tx       = repository_->Begin();
  auto instance = LoadWritable(*tx, report.instance_id);

  if (require_auth_ && !auth_->Verify(*tx, report.instance_id, bearer)) {
    throw util::Unauthenticated("invalid worker token for " + report.instance_id);
  }

  const auto now = clock_();

  auto worker              = instance.worker;
  worker.last_heartbeat_ms = now;
  worker.status            = status;
  if (!report.model_id.empty()) worker.model_id = report.model_id;
  if (report.queue_depth) worker.queue_depth = report.queue_depth;
  if (report.gpu_utilization) worker.gpu_utilization = report.gpu_utilization;
  if (!report.metadata_json.empty()) worker.metadata_json = report.metadata_json;

  core::ThrowIfDbError(repository_->UpdateWorkerFields(*tx, report.instance_id, worker), "update worker fields");
  tx->Commit();

  FLEET_LOG_DEBUG("worker heartbeat", {StringField("instance_id", report.instance_id), StringField("status", status),
                                       StringField("model", worker.model_id)});
  return now;
}

RegisterResult HeartbeatService::RegisterWorker(const RegisterRequest& request) {
  if (!util::IsJsonObjectOrEmpty(request.metadata_json)) {
    throw util::InvalidArgument("worker metadata must be a JSON object");
  }

  RegisterResult result;

  auto tx       = repository_->Begin();
  auto instance = LoadWritable(*tx, request.instance_id);

  if (!auth_->Verify(*tx, request.instance_id, request.bearer)) {
    if (repository_->GetWorkerToken(*tx, request.instance_id)) {
      throw util::Unauthenticated("invalid worker token for " + request.instance_id);
    }
    if (fleet::model::IsTerminal(instance.status) || !WorkerAuth::BootstrapAllowed(instance, request.client_ip)) {
      throw util::Unauthenticated("worker bootstrap not allowed for " + request.instance_id);
    }
    result.issued = auth_->Issue(*tx, request.instance_id);
  }

  auto worker              = instance.worker;
  worker.last_heartbeat_ms = clock_();
  if (worker.status.empty()) worker.status = "starting";
  if (!request.model_id.empty()) worker.model_id = request.model_id;
  if (request.health_port != 0) worker.health_port = request.health_port;
  if (request.vllm_port != 0) worker.vllm_port = request.vllm_port;
  if (!request.metadata_json.empty()) worker.metadata_json = request.metadata_json;

  core::ThrowIfDbError(repository_->UpdateWorkerFields(*tx, request.instance_id, worker), "register worker");
  tx->Commit();

  FLEET_LOG_INFO("worker registered", {StringField("instance_id", request.instance_id), StringField("model", worker.model_id),
                                       IntField("health_port", worker.health_port), IntField("vllm_port", worker.vllm_port),
                                       StringField("bootstrapped", result.issued ? "true" : "false")});
  return result;
}

} // namespace fleet::worker
