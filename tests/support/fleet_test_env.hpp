#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/settings.hpp"
#include "internal/core/action_recorder.hpp"
#include "internal/core/instance_workflows.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/health/worker_probe.hpp"
#include "internal/jobs/job_context.hpp"
#include "internal/lifecycle/state_machine.hpp"
#include "internal/provider/mock_provider.hpp"
#include "internal/provider/provider_registry.hpp"

namespace fleet::testing {

// Probe whose answers the test sets directly.
class ScriptedProbe final : public health::WorkerProbe {
 public:
  bool reachable    = false;
  bool readyz       = false;
  bool model_listed = false;

  bool Reachable(const std::string&, std::uint32_t) override {
    return reachable;
  }
  bool ReadyzOk(const std::string&, std::uint32_t) override {
    return readyz;
  }
  bool ModelListed(const std::string&, std::uint32_t, const std::string&) override {
    return model_listed;
  }
};

/*
  In-memory orchestrator wiring with a manual clock and the mock provider.
  Provisioning never sleeps; time only moves through Advance().
*/
struct TestEnv {
  std::shared_ptr<std::atomic<std::int64_t>> now = std::make_shared<std::atomic<std::int64_t>>(1'700'000'000'000);
  util::MillisClock                          clock;

  config::LifecycleSettings lifecycle;
  config::WorkerSettings    worker;

  std::shared_ptr<db::memory::MemoryRepository>    repository;
  std::shared_ptr<lifecycle::InstanceStateMachine> state_machine;
  std::shared_ptr<core::ActionRecorder>            recorder;
  std::shared_ptr<provider::MockProvider>          mock;
  std::shared_ptr<provider::ProviderRegistry>      providers;
  std::shared_ptr<core::InstanceWorkflows>         workflows;
  std::shared_ptr<ScriptedProbe>                   probe;

  TestEnv() {
    auto clock_state = now;
    clock            = [clock_state] { return clock_state->load(); };

    lifecycle.provisioning_ip_attempts    = 3;
    lifecycle.provisioning_ip_interval_ms = 0;

    repository    = std::make_shared<db::memory::MemoryRepository>();
    state_machine = std::make_shared<lifecycle::InstanceStateMachine>(repository, clock);
    recorder      = std::make_shared<core::ActionRecorder>(repository, clock);
    mock          = std::make_shared<provider::MockProvider>();
    providers     = std::make_shared<provider::ProviderRegistry>();
    providers->Register(mock);
    probe = std::make_shared<ScriptedProbe>();
    Rebuild();
  }

  // Call after changing `lifecycle`.
  void Rebuild() {
    auto clock_state = now;
    workflows = std::make_shared<core::InstanceWorkflows>(repository, state_machine, recorder, providers, lifecycle, clock,
                                                          [clock_state](std::int64_t ms) { clock_state->fetch_add(ms); });
  }

  void Advance(std::int64_t ms) {
    now->fetch_add(ms);
  }

  std::int64_t Now() const {
    return now->load();
  }

  jobs::JobContext JobCtx() const {
    jobs::JobContext ctx;
    ctx.repository    = repository;
    ctx.state_machine = state_machine;
    ctx.recorder      = recorder;
    ctx.workflows     = workflows;
    ctx.providers     = providers;
    ctx.probe         = probe;
    ctx.lifecycle     = lifecycle;
    ctx.worker        = worker;
    ctx.clock         = clock;
    return ctx;
  }

  db::model::InstanceRecord Get(const std::string& id) {
    auto tx  = repository->Begin();
    auto row = repository->GetInstance(*tx, id);
    return row.value();
  }

  std::vector<db::model::VolumeRecord> Volumes(const std::string& id) {
    auto tx = repository->Begin();
    return repository->ListVolumes(*tx, id);
  }

  // Writes worker columns as a heartbeat would.
  void Heartbeat(const std::string& id, const std::string& status, const std::string& model_id) {
    auto                   tx = repository->Begin();
    db::model::WorkerFields fields = repository->GetInstance(*tx, id)->worker;
    fields.last_heartbeat_ms       = Now();
    fields.status                  = status;
    fields.model_id                = model_id;
    repository->UpdateWorkerFields(*tx, id, fields);
    tx->Commit();
  }

  // Provision through the workflow and return the instance id.
  std::string Provision(const std::string& model_id = "llama-3-8b", std::uint32_t data_volume_gb = 0) {
    fleet::orchestrator::v1::ProvisionCommand command;
    command.set_provider_code("mock");
    command.set_zone("mock-zone-1");
    command.set_instance_type("MOCK-GPU-S");
    command.set_model_id(model_id);
    command.set_data_volume_gb(data_volume_gb);
    const auto id = workflows->CreateInstanceRow(command);
    command.set_instance_id(id);
    workflows->Provision(command);
    return id;
  }

  void Move(const std::string& id, fleet::model::InstanceStatus from, fleet::model::InstanceStatus to) {
    lifecycle::TransitionRequest request;
    request.instance_id = id;
    request.from        = from;
    request.to          = to;
    request.reason      = "test";
    state_machine->Transition(request);
  }
};

} // namespace fleet::testing
