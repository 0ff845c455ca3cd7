#include "orchestrator_service.hpp"

#include <chrono>
#include <type_traits>

#include "internal/core/action_recorder.hpp"
#include "internal/core/instance_workflows.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/command_bus.hpp"
#include "internal/dispatch/command_codec.hpp"
#include "internal/lifecycle/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/progress/progress_calculator.hpp"
#include "internal/routing/worker_selector.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/worker/heartbeat_service.hpp"

namespace fleet::service {

using namespace fleet::orchestrator::v1;
using fleet::observability::StringField;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& instance_id, Fn&& fn) {
  fleet::observability::SpanScope span(route);
  if (!instance_id.empty()) {
    span.SetAttribute("instance.id", instance_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool ok) {
    fleet::observability::Metrics::Instance().RecordRequest(route, ok);
    fleet::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    finish(true);
    return result;
  } catch (const util::NoReadyWorker&) {
    // routine under load, not worth an error line
    finish(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FLEET_LOG_WARN("RPC failed", {StringField("route", route), StringField("error", ex.what()), StringField("instance_id", instance_id)});
    finish(false);
    throw;
  }
}

std::string RequireInstanceId(const std::string& instance_id, std::string_view kind) {
  if (instance_id.empty()) {
    throw util::InvalidArgument(std::string(kind) + " requires instance_id");
  }
  return instance_id;
}

} // namespace

OrchestratorService::OrchestratorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

PublishCommandResponse OrchestratorService::PublishCommand(const PublishCommandRequest& req) {
  return ObserveRpc("OrchestratorService.PublishCommand", {}, [&] {
    if (req.command().body_case() == Command::BODY_NOT_SET) {
      throw util::InvalidArgument("command has no body");
    }

    Command command = req.command();
    if (command.command_id().empty()) command.set_command_id(util::NewId());
    if (command.issued_at_ms() == 0) command.set_issued_at_ms(util::NowMillis());

    std::string instance_id;
    switch (command.body_case()) {
      case Command::kProvision:
        instance_id = ctx_.workflows->CreateInstanceRow(command.provision());
        command.mutable_provision()->set_instance_id(instance_id);
        break;
      case Command::kTerminate:
        instance_id = RequireInstanceId(command.terminate().instance_id(), "TERMINATE");
        break;
      case Command::kReinstall:
        instance_id = RequireInstanceId(command.reinstall().instance_id(), "REINSTALL");
        break;
      default:
        break;
    }

    if (!instance_id.empty() && command.body_case() != Command::kProvision) {
      auto tx = ctx_.repository->Begin();
      if (!ctx_.repository->GetInstance(*tx, instance_id)) {
        throw util::NotFound("instance not found: " + instance_id);
      }
    }

    const auto kind     = dispatch::CommandKind(command);
    const bool accepted = ctx_.bus->Publish(dispatch::EncodeCommand(command));
    fleet::observability::Metrics::Instance().RecordCommand(kind, accepted);
    if (!accepted) {
      FLEET_LOG_WARN("command dropped by bus", {StringField("kind", kind), StringField("command_id", command.command_id()),
                                                StringField("instance_id", instance_id)});
    }

    PublishCommandResponse resp;
    resp.set_accepted(accepted);
    resp.set_command_id(command.command_id());
    resp.set_instance_id(instance_id);
    return resp;
  });
}

ReportHeartbeatResponse OrchestratorService::ReportHeartbeat(const ReportHeartbeatRequest& req, const std::string& bearer) {
  return ObserveRpc("OrchestratorService.ReportHeartbeat", req.instance_id(), [&] {
    worker::HeartbeatReport report;
    report.instance_id   = req.instance_id();
    report.status        = req.status();
    report.model_id      = req.model_id();
    report.metadata_json = req.metadata_json();
    if (req.has_queue_depth()) report.queue_depth = req.queue_depth();
    if (req.has_gpu_utilization()) report.gpu_utilization = req.gpu_utilization();

    ReportHeartbeatResponse resp;
    resp.set_received_at_ms(ctx_.heartbeats->ReportHeartbeat(report, bearer));
    return resp;
  });
}

RegisterWorkerResponse OrchestratorService::RegisterWorker(const RegisterWorkerRequest& req, const std::string& client_ip,
                                                           const std::string& bearer) {
  return ObserveRpc("OrchestratorService.RegisterWorker", req.instance_id(), [&] {
    worker::RegisterRequest request;
    request.instance_id   = req.instance_id();
    request.client_ip     = client_ip;
    request.bearer        = bearer;
    request.model_id      = req.model_id();
    request.health_port   = req.health_port();
    request.vllm_port     = req.vllm_port();
    request.metadata_json = req.metadata_json();

    auto result = ctx_.heartbeats->RegisterWorker(request);

    RegisterWorkerResponse resp;
    if (result.issued) {
      resp.set_bootstrap_token(result.issued->token);
      resp.set_token_prefix(result.issued->prefix);
    }
    return resp;
  });
}

SelectWorkerResponse OrchestratorService::SelectWorker(const SelectWorkerRequest& req) {
  return ObserveRpc("OrchestratorService.SelectWorker", {}, [&] {
    auto handle = ctx_.selector->SelectWorker(req.model_id(), req.sticky_key());

    SelectWorkerResponse resp;
    resp.set_instance_id(handle.instance_id);
    resp.set_ip_address(handle.ip_address);
    resp.set_endpoint(handle.endpoint);
    return resp;
  });
}

GetInstanceResponse OrchestratorService::GetInstance(const GetInstanceRequest& req) {
  return ObserveRpc("OrchestratorService.GetInstance", req.instance_id(), [&] {
    std::optional<db::model::InstanceRecord> record;
    std::vector<db::model::VolumeRecord>     volumes;
    {
      auto tx = ctx_.repository->Begin();
      record  = ctx_.repository->GetInstance(*tx, req.instance_id());
      if (record) volumes = ctx_.repository->ListVolumes(*tx, req.instance_id());
    }
    if (!record) {
      throw util::NotFound("instance not found: " + req.instance_id());
    }

    GetInstanceResponse resp;
    auto*               view = resp.mutable_instance();
    view->set_id(record->id);
    view->set_provider_code(record->provider_code);
    view->set_zone(record->zone);
    view->set_instance_type(record->instance_type);
    view->set_model_id(record->model_id);
    view->set_provider_instance_id(record->provider_instance_id);
    view->set_ip_address(record->ip_address);
    view->set_status(std::string(fleet::model::ToString(record->status)));
    view->set_error_code(record->error_code);
    view->set_error_message(record->error_message);
    view->set_progress_percent(progress::ComputeProgress(record->status, ctx_.recorder->CompletedActions(record->id)));
    view->set_deleted_by_provider(record->deleted_by_provider);
    view->set_deletion_reason(record->deletion_reason);
    view->set_created_at_ms(record->created_at_ms);
    view->set_worker_status(record->worker.status);
    view->set_worker_last_heartbeat_ms(record->worker.last_heartbeat_ms);

    for (const auto& entry : ctx_.state_machine->History(record->id)) {
      auto* transition = resp.add_history();
      transition->set_from_status(std::string(fleet::model::ToString(entry.from_status)));
      transition->set_to_status(std::string(fleet::model::ToString(entry.to_status)));
      transition->set_reason(entry.reason);
      transition->set_metadata_json(entry.metadata_json);
      transition->set_created_at_ms(entry.created_at_ms);
    }

    for (const auto& volume : volumes) {
      auto* out = resp.add_volumes();
      out->set_id(volume.id);
      out->set_provider_volume_id(volume.provider_volume_id);
      out->set_status(std::string(fleet::model::ToString(volume.status)));
      out->set_delete_on_terminate(volume.delete_on_terminate);
      out->set_is_boot(volume.is_boot);
      out->set_size_bytes(volume.size_bytes);
    }
    return resp;
  });
}

} // namespace fleet::service
