#include "command_dispatcher.hpp"

#include <chrono>

#include "command_codec.hpp"
#include "internal/core/instance_workflows.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace fleet::dispatch {

using fleet::orchestrator::v1::Command;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kReceiveTimeout{200};

} // namespace

CommandDispatcher::CommandDispatcher(std::shared_ptr<CommandBus> bus, std::shared_ptr<core::InstanceWorkflows> workflows,
                                     std::size_t max_in_flight)
    : bus_(std::move(bus)), workflows_(std::move(workflows)), max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight) {
}

CommandDispatcher::~CommandDispatcher() {
  Stop();
}

void CommandDispatcher::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&CommandDispatcher::Run, this);
}

void CommandDispatcher::Stop() {
  // The loop keeps receiving until the shut-down bus is empty.
  bus_->Shutdown();
  if (thread_.joinable()) thread_.join();
  running_ = false;
  Reap(true);
}

std::size_t CommandDispatcher::InFlight() const {
  std::lock_guard lock(tasks_mutex_);
  return tasks_.size();
}

void CommandDispatcher::Reap(bool wait_all) {
  std::lock_guard lock(tasks_mutex_);
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (wait_all || it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      it->get();
      it = tasks_.erase(it);
    } else {
      ++it;
    }
  }
}

bool CommandDispatcher::WaitForSlot() {
  std::lock_guard lock(tasks_mutex_);
  if (tasks_.size() < max_in_flight_) return false;
  tasks_.front().wait_for(kReceiveTimeout);
  return true;
}

void CommandDispatcher::Run() {
  FLEET_LOG_INFO("command dispatcher started", {IntField("max_in_flight", static_cast<std::int64_t>(max_in_flight_))});

  for (;;) {
    Reap(false);
    if (WaitForSlot()) continue;

    auto message = bus_->Receive(kReceiveTimeout);
    if (!message) {
      if (bus_->IsShutdown()) break;
      continue;
    }

    auto command = DecodeCommand(*message);
    if (!command) {
      FLEET_LOG_WARN("dropping undecodable command", {IntField("bytes", static_cast<std::int64_t>(message->size()))});
      observability::Metrics::Instance().RecordCommand("UNKNOWN", false);
      continue;
    }

    std::lock_guard lock(tasks_mutex_);
    tasks_.push_back(std::async(std::launch::async, [this, cmd = std::move(*command)] { Dispatch(cmd); }));
  }

  FLEET_LOG_INFO("command dispatcher stopped");
}

void CommandDispatcher::Dispatch(const Command& command) {
  const auto kind = CommandKind(command);

  observability::SpanScope span("dispatch.command");
  span.SetAttribute("kind", kind);
  span.SetAttribute("command_id", command.command_id());

  observability::ScopedLogContext log_context({StringField("command_id", command.command_id()), StringField("kind", kind)});
  FLEET_LOG_INFO("command received");

  try {
    switch (command.body_case()) {
      case Command::kProvision:
        workflows_->Provision(command.provision());
        break;
      case Command::kTerminate:
        workflows_->Terminate(command.terminate());
        break;
      case Command::kReinstall:
        workflows_->Reinstall(command.reinstall());
        break;
      case Command::kSyncCatalog:
        workflows_->SyncCatalog(command.sync_catalog());
        break;
      case Command::kReconcile: {
        auto report = workflows_->Reconcile(command.reconcile());
        FLEET_LOG_INFO("reconcile finished", {IntField("seen", static_cast<std::int64_t>(report.seen)),
                                              IntField("untracked", static_cast<std::int64_t>(report.untracked)),
                                              IntField("zombies", static_cast<std::int64_t>(report.zombies))});
        break;
      }
      case Command::BODY_NOT_SET:
        FLEET_LOG_WARN("command without body");
        return;
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    FLEET_LOG_ERROR("command failed", {StringField("error", e.what())});
  }
}

} // namespace fleet::dispatch
