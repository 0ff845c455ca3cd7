#include "internal/model/instance_status.hpp"

#include <cassert>
#include <iostream>

namespace {

using fleet::model::CanTransition;
using fleet::model::InstanceStatus;

void TestHappyPathEdges() {
  assert(CanTransition(InstanceStatus::kProvisioning, InstanceStatus::kBooting));
  assert(CanTransition(InstanceStatus::kBooting, InstanceStatus::kInstalling));
  assert(CanTransition(InstanceStatus::kInstalling, InstanceStatus::kStarting));
  assert(CanTransition(InstanceStatus::kStarting, InstanceStatus::kReady));
  assert(CanTransition(InstanceStatus::kReady, InstanceStatus::kDraining));
  assert(CanTransition(InstanceStatus::kDraining, InstanceStatus::kTerminating));
  assert(CanTransition(InstanceStatus::kTerminating, InstanceStatus::kTerminated));
  assert(CanTransition(InstanceStatus::kTerminated, InstanceStatus::kArchived));
}

void TestNoSkippingOrGoingBack() {
  assert(!CanTransition(InstanceStatus::kProvisioning, InstanceStatus::kReady));
  assert(!CanTransition(InstanceStatus::kBooting, InstanceStatus::kProvisioning));
  assert(!CanTransition(InstanceStatus::kTerminated, InstanceStatus::kReady));
  assert(!CanTransition(InstanceStatus::kTerminating, InstanceStatus::kReady));
  assert(!CanTransition(InstanceStatus::kProvisioningFailed, InstanceStatus::kBooting));
}

void TestArchivedIsFinal() {
  for (auto to : {InstanceStatus::kProvisioning, InstanceStatus::kBooting, InstanceStatus::kReady, InstanceStatus::kTerminated,
                  InstanceStatus::kArchived}) {
    assert(!CanTransition(InstanceStatus::kArchived, to));
  }
}

void TestSideEdges() {
  // reinstall
  assert(CanTransition(InstanceStatus::kReady, InstanceStatus::kBooting));
  assert(CanTransition(InstanceStatus::kStartupFailed, InstanceStatus::kBooting));
  // provider-side deletion
  assert(CanTransition(InstanceStatus::kReady, InstanceStatus::kTerminated));
  assert(CanTransition(InstanceStatus::kDraining, InstanceStatus::kTerminated));
  // timeouts
  assert(CanTransition(InstanceStatus::kStarting, InstanceStatus::kStartupFailed));
  assert(!CanTransition(InstanceStatus::kReady, InstanceStatus::kStartupFailed));
}

void TestNamesRoundTrip() {
  for (auto status : {InstanceStatus::kProvisioning, InstanceStatus::kBooting, InstanceStatus::kInstalling, InstanceStatus::kStarting,
                      InstanceStatus::kReady, InstanceStatus::kDraining, InstanceStatus::kTerminating, InstanceStatus::kTerminated,
                      InstanceStatus::kArchived, InstanceStatus::kProvisioningFailed, InstanceStatus::kStartupFailed,
                      InstanceStatus::kFailed}) {
    auto parsed = fleet::model::ParseInstanceStatus(fleet::model::ToString(status));
    assert(parsed && *parsed == status);
  }
  assert(fleet::model::ToString(InstanceStatus::kStartupFailed) == "startup_failed");
  assert(!fleet::model::ParseInstanceStatus("running"));
}

void TestPhaseGroups() {
  assert(fleet::model::IsComingUp(InstanceStatus::kInstalling));
  assert(!fleet::model::IsComingUp(InstanceStatus::kReady));
  assert(fleet::model::IsTerminal(InstanceStatus::kTerminated));
  assert(!fleet::model::IsTerminal(InstanceStatus::kTerminating));
}

} // namespace

int main() {
  TestHappyPathEdges();
  TestNoSkippingOrGoingBack();
  TestArchivedIsFinal();
  TestSideEdges();
  TestNamesRoundTrip();
  TestPhaseGroups();

  std::cout << "fleet_unit_instance_status: pass\n";
  return 0;
}
