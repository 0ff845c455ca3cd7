#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/dispatch/command_bus.hpp"
#include "internal/dispatch/command_codec.hpp"
#include "internal/dispatch/command_dispatcher.hpp"
#include "tests/support/fleet_test_env.hpp"
#include "tests/support/hooked_provider.hpp"

namespace {

using fleet::dispatch::CommandBus;
using fleet::dispatch::CommandDispatcher;
using fleet::dispatch::DecodeCommand;
using fleet::dispatch::EncodeCommand;
using fleet::dispatch::EncodeCommandJson;
using fleet::model::InstanceStatus;
using fleet::orchestrator::v1::Command;

Command TerminateCommand(const std::string& id) {
  Command command;
  command.set_command_id("cmd-1");
  command.set_issued_at_ms(42);
  command.mutable_terminate()->set_instance_id(id);
  command.mutable_terminate()->set_reason("scale down");
  return command;
}

void TestCodecAcceptsBinaryAndJson() {
  const auto command = TerminateCommand("i-1");

  auto binary = DecodeCommand(EncodeCommand(command));
  assert(binary);
  assert(binary->has_terminate());
  assert(binary->terminate().instance_id() == "i-1");
  assert(fleet::dispatch::CommandKind(*binary) == "TERMINATE");

  const auto json = EncodeCommandJson(command);
  assert(!json.empty());
  auto from_json = DecodeCommand(json);
  assert(from_json);
  assert(from_json->command_id() == "cmd-1");
  assert(from_json->terminate().reason() == "scale down");

  auto handwritten = DecodeCommand(R"({"provision":{"providerCode":"mock","zone":"z","instanceType":"t"},"extra":1})");
  assert(handwritten && handwritten->provision().provider_code() == "mock");
}

void TestCodecRejectsUnknownInput() {
  assert(!DecodeCommand(""));
  assert(!DecodeCommand("{not json"));
  assert(!DecodeCommand(R"({"commandId":"no-body"})"));

  Command empty;
  empty.set_command_id("x");
  assert(!DecodeCommand(EncodeCommand(empty)));
  assert(fleet::dispatch::CommandKind(empty) == "UNKNOWN");
}

void TestBusDropsWhenFullOrShutDown() {
  CommandBus bus(2);
  assert(bus.Publish("a"));
  assert(bus.Publish("b"));
  assert(!bus.Publish("c"));
  assert(bus.Dropped() == 1);
  assert(bus.Size() == 2);

  auto first = bus.Receive(std::chrono::milliseconds(10));
  assert(first && *first == "a");

  bus.Shutdown();
  assert(!bus.Publish("d"));
  assert(bus.Dropped() == 2);

  // queued messages still drain after shutdown
  auto second = bus.Receive(std::chrono::milliseconds(10));
  assert(second && *second == "b");
  assert(!bus.Receive(std::chrono::milliseconds(10)));
}

void TestReceiveTimesOut() {
  CommandBus bus;
  const auto start = std::chrono::steady_clock::now();
  assert(!bus.Receive(std::chrono::milliseconds(20)));
  assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(15));
}

void TestDispatchRunsProvisionOnCallingThread() {
  fleet::testing::TestEnv env;
  auto                    bus = std::make_shared<CommandBus>();
  CommandDispatcher       dispatcher(bus, env.workflows);

  Command command;
  auto*   provision = command.mutable_provision();
  provision->set_provider_code("mock");
  provision->set_zone("mock-zone-1");
  provision->set_instance_type("MOCK-GPU-S");
  provision->set_model_id("llama");
  const auto id = env.workflows->CreateInstanceRow(*provision);
  provision->set_instance_id(id);

  dispatcher.Dispatch(command);

  auto row = env.Get(id);
  assert(row.status == InstanceStatus::kBooting);
  assert(!row.provider_instance_id.empty());
  assert(!row.ip_address.empty());
}

void TestDispatchLogsFailuresWithoutThrowing() {
  fleet::testing::TestEnv env;
  CommandDispatcher       dispatcher(std::make_shared<CommandBus>(), env.workflows);

  dispatcher.Dispatch(TerminateCommand("does-not-exist"));
  dispatcher.Dispatch(Command{});
}

void TestReceiveLoopDeliversPublishedCommands() {
  fleet::testing::TestEnv env;
  auto                    bus = std::make_shared<CommandBus>();
  CommandDispatcher       dispatcher(bus, env.workflows);

  const auto id = env.Provision();
  env.Move(id, InstanceStatus::kBooting, InstanceStatus::kInstalling);

  dispatcher.Start();
  assert(bus->Publish("garbage that is not a command"));
  assert(bus->Publish(EncodeCommand(TerminateCommand(id))));

  for (int i = 0; i < 200 && env.Get(id).status != InstanceStatus::kTerminated; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  dispatcher.Stop();

  assert(env.Get(id).status == InstanceStatus::kTerminated);
  assert(dispatcher.InFlight() == 0);
  assert(!bus->Publish("late"));
}

void TestDispatcherCapsTasksInFlight() {
  fleet::testing::TestEnv env;
  auto                    inner = std::make_shared<fleet::provider::MockProvider>("gated");
  auto                    gated = std::make_shared<fleet::testing::HookedProvider>(inner);
  env.providers->Register(gated);

  std::atomic<bool> open{false};
  std::atomic<int>  active{0};
  std::atomic<int>  peak{0};
  gated->before_create = [&] {
    const int now  = ++active;
    int       seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    while (!open) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    --active;
  };

  auto              bus = std::make_shared<CommandBus>();
  CommandDispatcher dispatcher(bus, env.workflows, 2);

  std::vector<std::string> ids;
  for (int i = 0; i < 5; ++i) {
    Command command;
    command.set_command_id("cmd-" + std::to_string(i));
    auto* provision = command.mutable_provision();
    provision->set_provider_code("gated");
    provision->set_zone("mock-zone-1");
    provision->set_instance_type("MOCK-GPU-S");
    ids.push_back(env.workflows->CreateInstanceRow(*provision));
    provision->set_instance_id(ids.back());
    assert(bus->Publish(EncodeCommand(command)));
  }

  dispatcher.Start();
  for (int i = 0; i < 200 && active < 2; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(active == 2);
  assert(dispatcher.InFlight() == 2);
  assert(bus->Size() == 3);

  open = true;
  dispatcher.Stop();

  assert(peak == 2);
  for (const auto& id : ids) {
    assert(env.Get(id).status == InstanceStatus::kBooting);
  }
  assert(inner->CallCount("create") == 5);
}

void TestStopDispatchesQueuedCommands() {
  fleet::testing::TestEnv env;
  auto                    bus = std::make_shared<CommandBus>();
  CommandDispatcher       dispatcher(bus, env.workflows, 1);

  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    ids.push_back(env.Provision());
    env.Move(ids.back(), InstanceStatus::kBooting, InstanceStatus::kInstalling);
    assert(bus->Publish(EncodeCommand(TerminateCommand(ids.back()))));
  }

  dispatcher.Start();
  dispatcher.Stop();

  for (const auto& id : ids) {
    assert(env.Get(id).status == InstanceStatus::kTerminated);
  }
  assert(bus->Size() == 0);
  assert(dispatcher.InFlight() == 0);
}

} // namespace

int main() {
  TestCodecAcceptsBinaryAndJson();
  TestCodecRejectsUnknownInput();
  TestBusDropsWhenFullOrShutDown();
  TestReceiveTimesOut();
  TestDispatchRunsProvisionOnCallingThread();
  TestDispatchLogsFailuresWithoutThrowing();
  TestReceiveLoopDeliversPublishedCommands();
  TestDispatcherCapsTasksInFlight();
  TestStopDispatchesQueuedCommands();

  std::cout << "fleet_unit_command_dispatch: pass\n";
  return 0;
}
