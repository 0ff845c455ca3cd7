#pragma once

#include <memory>

#include "internal/config/settings.hpp"
#include "internal/core/action_recorder.hpp"
#include "internal/core/instance_workflows.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/health/worker_probe.hpp"
#include "internal/lifecycle/state_machine.hpp"
#include "internal/provider/provider_registry.hpp"
#include "internal/util/time.hpp"

namespace fleet::jobs {

// Collaborators shared by every reconciliation job.
struct JobContext {
  std::shared_ptr<db::Repository>                  repository;
  std::shared_ptr<lifecycle::InstanceStateMachine> state_machine;
  std::shared_ptr<core::ActionRecorder>            recorder;
  std::shared_ptr<core::InstanceWorkflows>         workflows;
  std::shared_ptr<provider::ProviderRegistry>      providers;
  std::shared_ptr<health::WorkerProbe>             probe;

  config::LifecycleSettings lifecycle;
  config::WorkerSettings    worker;

  util::MillisClock clock;
};

} // namespace fleet::jobs
