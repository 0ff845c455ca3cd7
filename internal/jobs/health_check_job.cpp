#include "health_check_job.hpp"

#include <fmt/format.h>

#include "internal/core/db_errors.hpp"
#include "internal/model/error_codes.hpp"
#include "internal/observability/logging.hpp"

namespace fleet::jobs {

using fleet::model::InstanceStatus;
using lifecycle::TransitionOutcome;
using lifecycle::TransitionRequest;
using observability::IntField;

namespace action = fleet::model::action;

HealthCheckJob::HealthCheckJob(JobContext context, config::JobSettings settings)
    : ReconciliationJob("health_check", std::move(context), settings) {
}

HealthCheckJob::~HealthCheckJob() {
  Stop();
}

std::vector<db::model::InstanceRecord> HealthCheckJob::Claim() {
  const auto now = NowMs();

  db::ClaimQuery query;
  query.statuses = {InstanceStatus::kBooting, InstanceStatus::kInstalling, InstanceStatus::kStarting,
                    InstanceStatus::kStartupFailed};
  query.lease                   = db::LeaseColumn::kLastHealthCheck;
  query.now_ms                  = now;
  query.lease_expired_before_ms = now - util::SecondsToMillis(context_.lifecycle.health_check_lease_seconds);
  query.limit                   = settings_.batch_size;
  return ClaimBatch(query);
}

bool HealthCheckJob::HeartbeatFresh(const db::model::InstanceRecord& instance) const {
  const auto last = instance.worker.last_heartbeat_ms;
  return last != 0 && NowMs() - last < util::SecondsToMillis(context_.lifecycle.heartbeat_trust_seconds);
}

void HealthCheckJob::Process(const db::model::InstanceRecord& claimed) {
  if (claimed.status == InstanceStatus::kStartupFailed) {
    SelfHeal(claimed);
    return;
  }

  if (CheckTimeouts(claimed)) {
    return;
  }

  auto instance = claimed;
  if (!EnsureIp(instance)) {
    BumpFailures(instance);
    return;
  }

  const bool fresh    = HeartbeatFresh(instance);
  bool       advanced = false;

  // Walk as far as the evidence allows in one pass.
  while (auto next = NextStep(instance, fresh)) {
    TransitionRequest request;
    request.instance_id = instance.id;
    request.from        = instance.status;
    request.to          = *next;
    request.reason      = fresh ? "worker heartbeat" : "health probe passed";
    request.mutate      = [](db::model::InstanceRecord& record) { record.health_check_failures = 0; };

    if (context_.state_machine->Transition(request) != TransitionOutcome::kApplied) {
      return;
    }
    RecordMilestones(instance.id, *next, fresh);
    instance.status = *next;
    advanced        = true;
  }

  if (!advanced) {
    BumpFailures(instance);
  }
}

bool HealthCheckJob::CheckTimeouts(const db::model::InstanceRecord& instance) {
  const auto now = NowMs();

  std::string_view error_code;
  std::int64_t     age_ms = 0;

  if (instance.status == InstanceStatus::kBooting || instance.status == InstanceStatus::kInstalling) {
    const auto since = instance.boot_started_at_ms != 0 ? instance.boot_started_at_ms : instance.created_at_ms;
    age_ms           = now - since;
    if (age_ms > util::SecondsToMillis(context_.lifecycle.boot_timeout_seconds)) {
      error_code = fleet::model::error_code::kStartupTimeout;
    }
  } else if (instance.status == InstanceStatus::kStarting) {
    const auto since = instance.starting_started_at_ms != 0 ? instance.starting_started_at_ms : instance.boot_started_at_ms;
    age_ms           = now - since;
    if (age_ms > util::SecondsToMillis(context_.lifecycle.model_load_timeout_seconds)) {
      error_code = fleet::model::error_code::kModelLoadTimeout;
    }
  }

  if (error_code.empty()) {
    return false;
  }

  TransitionRequest request;
  request.instance_id   = instance.id;
  request.from          = instance.status;
  request.to            = InstanceStatus::kStartupFailed;
  request.reason        = std::string(error_code);
  request.error_code    = std::string(error_code);
  request.error_message = fmt::format("{} for {}s", fleet::model::ToString(instance.status), age_ms / 1000);
  context_.state_machine->Transition(request);
  return true;
}

bool HealthCheckJob::EnsureIp(db::model::InstanceRecord& instance) {
  if (!instance.ip_address.empty()) {
    return true;
  }

  auto adapter = context_.providers->Find(instance.provider_code);
  if (!adapter || instance.provider_instance_id.empty()) {
    return false;
  }

  std::optional<std::string> ip;
  auto                       res = adapter->GetIp(instance.zone, instance.provider_instance_id, ip);
  if (!res || !ip) {
    return false;
  }

  const auto address = *ip;
  auto       tx      = context_.repository->Begin();
  auto       current = context_.repository->LockInstance(*tx, instance.id);
  if (!current || current->status != instance.status) {
    return false;
  }
  auto record       = *current;
  record.ip_address = address;
  auto upd          = context_.repository->UpdateInstance(*tx, record, instance.status);
  if (!upd) {
    return false;
  }
  tx->Commit();

  context_.recorder->RecordSuccess(instance.id, action::kProviderGetIp, "{\"ip_address\":\"" + address + "\"}");
  instance.ip_address = address;
  return true;
}

std::optional<InstanceStatus> HealthCheckJob::NextStep(const db::model::InstanceRecord& instance, bool heartbeat_fresh) {
  const auto& worker       = instance.worker;
  const auto  health_port  = worker.health_port != 0 ? worker.health_port : context_.worker.health_port;
  const auto  vllm_port    = worker.vllm_port != 0 ? worker.vllm_port : context_.worker.vllm_port;
  const bool  model_served = instance.model_id.empty() || worker.model_id == instance.model_id;

  switch (instance.status) {
    case InstanceStatus::kBooting:
      if (heartbeat_fresh || context_.probe->Reachable(instance.ip_address, context_.worker.reachability_port)) {
        return InstanceStatus::kInstalling;
      }
      return std::nullopt;

    case InstanceStatus::kInstalling:
      if (heartbeat_fresh ? (worker.status == "starting" || worker.status == "ready")
                          : context_.probe->ReadyzOk(instance.ip_address, health_port)) {
        return InstanceStatus::kStarting;
      }
      return std::nullopt;

    case InstanceStatus::kStarting:
      if (heartbeat_fresh ? (worker.status == "ready" && model_served)
                          : context_.probe->ModelListed(instance.ip_address, vllm_port, instance.model_id)) {
        return InstanceStatus::kReady;
      }
      return std::nullopt;

    default:
      return std::nullopt;
  }
}

void HealthCheckJob::RecordMilestones(const std::string& instance_id, InstanceStatus reached, bool via_heartbeat) {
  const auto metadata = via_heartbeat ? std::string("{\"source\":\"heartbeat\"}") : std::string("{\"source\":\"probe\"}");
  auto&      recorder = *context_.recorder;

  switch (reached) {
    case InstanceStatus::kStarting:
      recorder.RecordSuccess(instance_id, action::kWorkerInstall, metadata);
      recorder.RecordSuccess(instance_id, action::kWorkerHttpReady, metadata);
      break;
    case InstanceStatus::kReady:
      recorder.RecordSuccess(instance_id, action::kWorkerModelLoaded, metadata);
      recorder.RecordSuccess(instance_id, action::kWorkerWarmup, metadata);
      recorder.RecordSuccess(instance_id, action::kHealthCheckPass, metadata);
      break;
    default:
      break;
  }
}

void HealthCheckJob::BumpFailures(const db::model::InstanceRecord& instance) {
  std::int32_t failures = 0;
  {
    auto tx      = context_.repository->Begin();
    auto current = context_.repository->LockInstance(*tx, instance.id);
    if (!current || current->status != instance.status) {
      return;
    }
    auto record = *current;
    failures    = ++record.health_check_failures;
    auto res    = context_.repository->UpdateInstance(*tx, record, instance.status);
    if (!res) {
      return;
    }
    tx->Commit();
  }

  const auto limit = context_.lifecycle.health_check_max_failures;
  if (limit <= 0 || failures < limit) {
    return;
  }

  TransitionRequest request;
  request.instance_id   = instance.id;
  request.from          = instance.status;
  request.to            = InstanceStatus::kStartupFailed;
  request.reason        = std::string(fleet::model::error_code::kHealthCheckFailed);
  request.error_code    = std::string(fleet::model::error_code::kHealthCheckFailed);
  request.error_message = fmt::format("{} consecutive failed health checks", failures);
  if (context_.state_machine->Transition(request) == TransitionOutcome::kApplied) {
    FLEET_LOG_WARN("health checks exhausted", {IntField("failures", failures)});
  }
}

void HealthCheckJob::SelfHeal(const db::model::InstanceRecord& instance) {
  if (!HeartbeatFresh(instance)) {
    return;
  }
  if (instance.startup_recoveries >= context_.lifecycle.startup_recovery_max_attempts) {
    FLEET_LOG_DEBUG("self-heal budget exhausted", {IntField("startup_recoveries", instance.startup_recoveries)});
    return;
  }

  TransitionRequest request;
  request.instance_id = instance.id;
  request.from        = InstanceStatus::kStartupFailed;
  request.to          = InstanceStatus::kBooting;
  request.reason      = "fresh heartbeat after startup failure";
  request.mutate      = [](db::model::InstanceRecord& record) { ++record.startup_recoveries; };
  context_.state_machine->Transition(request);
}

} // namespace fleet::jobs
