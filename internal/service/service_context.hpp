#pragma once

#include <memory>

namespace fleet::core {
class ActionRecorder;
class InstanceWorkflows;
} // namespace fleet::core
namespace fleet::db { class Repository; }
namespace fleet::dispatch { class CommandBus; }
namespace fleet::lifecycle { class InstanceStateMachine; }
namespace fleet::routing { class WorkerSelector; }
namespace fleet::worker { class HeartbeatService; }

namespace fleet::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fleet::db::Repository>                  repository;
  std::shared_ptr<fleet::lifecycle::InstanceStateMachine> state_machine;
  std::shared_ptr<fleet::core::ActionRecorder>            recorder;
  std::shared_ptr<fleet::core::InstanceWorkflows>         workflows;
  std::shared_ptr<fleet::dispatch::CommandBus>            bus;
  std::shared_ptr<fleet::worker::HeartbeatService>        heartbeats;
  std::shared_ptr<fleet::routing::WorkerSelector>         selector;
};

} // namespace fleet::service
