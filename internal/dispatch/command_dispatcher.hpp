#pragma once

#include <atomic>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

#include "command_bus.hpp"
#include "fleet/orchestrator/v1/commands.pb.h"

namespace fleet::core {
class InstanceWorkflows;
}

namespace fleet::dispatch {

/*
  Receive loop over the command bus.

  Each decoded command runs as its own task so a slow provider call never
  blocks receiving, with at most `max_in_flight` tasks at once; past that
  the loop stops receiving and the bus absorbs the backlog. Undecodable
  messages are logged and dropped. Stop() shuts the bus down, dispatches
  what was already queued and waits for every task.
*/
class CommandDispatcher {
 public:
  CommandDispatcher(std::shared_ptr<CommandBus> bus, std::shared_ptr<core::InstanceWorkflows> workflows,
                    std::size_t max_in_flight = 16);
  ~CommandDispatcher();

  void Start();
  void Stop();

  // Runs one command on the calling thread. Errors are logged, never thrown.
  void Dispatch(const fleet::orchestrator::v1::Command& command);

  std::size_t InFlight() const;

 private:
  void Run();
  void Reap(bool wait_all);

  // Blocks up to one receive timeout for the oldest task when full.
  // Returns false when a slot is free.
  bool WaitForSlot();

  std::shared_ptr<CommandBus>               bus_;
  std::shared_ptr<core::InstanceWorkflows> workflows_;
  const std::size_t                        max_in_flight_;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex           tasks_mutex_;
  std::list<std::future<void>> tasks_;
};

} // namespace fleet::dispatch
