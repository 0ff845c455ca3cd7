#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fleet::model {

enum class InstanceStatus : std::uint8_t {
  kProvisioning = 0,
  kBooting,
  kInstalling,
  kStarting,
  kReady,
  kDraining,
  kTerminating,
  kTerminated,
  kArchived,
  kProvisioningFailed,
  kStartupFailed,
  kFailed,
};

constexpr bool IsFailure(InstanceStatus status) {
  return status == InstanceStatus::kProvisioningFailed || status == InstanceStatus::kStartupFailed ||
         status == InstanceStatus::kFailed;
}

// No further work will be scheduled for the row (archival aside).
constexpr bool IsTerminal(InstanceStatus status) {
  return status == InstanceStatus::kTerminated || status == InstanceStatus::kArchived;
}

// booting, installing and starting are sub-phases of one "coming up" phase.
constexpr bool IsComingUp(InstanceStatus status) {
  return status == InstanceStatus::kBooting || status == InstanceStatus::kInstalling || status == InstanceStatus::kStarting;
}

// States in which the instance owns its IP and worker ports.
constexpr bool HoldsNetworkIdentity(InstanceStatus status) {
  return IsComingUp(status) || status == InstanceStatus::kReady || status == InstanceStatus::kDraining;
}

/*
  Lifecycle graph. Every status write must follow one of these edges.

  provisioning -> booting -> installing -> starting -> ready -> draining
      -> terminating -> terminated -> archived

  Side edges: failures from every live phase, reinstall back to booting,
  provider-side deletion straight to terminated, startup_failed self-heal.
*/
constexpr bool CanTransition(InstanceStatus from, InstanceStatus to) {
  using S = InstanceStatus;
  switch (from) {
    case S::kProvisioning:
      return to == S::kBooting || to == S::kProvisioningFailed || to == S::kTerminating || to == S::kFailed;
    case S::kBooting:
      return to == S::kInstalling || to == S::kStartupFailed || to == S::kTerminating || to == S::kFailed;
    case S::kInstalling:
      return to == S::kStarting || to == S::kBooting || to == S::kStartupFailed || to == S::kTerminating || to == S::kFailed;
    case S::kStarting:
      return to == S::kReady || to == S::kBooting || to == S::kStartupFailed || to == S::kTerminating || to == S::kFailed;
    case S::kReady:
      return to == S::kDraining || to == S::kBooting || to == S::kTerminating || to == S::kTerminated || to == S::kFailed;
    case S::kDraining:
      return to == S::kTerminating || to == S::kTerminated || to == S::kFailed;
    case S::kTerminating:
      return to == S::kTerminated || to == S::kFailed;
    case S::kTerminated:
      return to == S::kArchived;
    case S::kProvisioningFailed:
      return to == S::kTerminating || to == S::kArchived;
    case S::kStartupFailed:
      return to == S::kBooting || to == S::kTerminating || to == S::kTerminated || to == S::kArchived;
    case S::kFailed:
      return to == S::kTerminating || to == S::kArchived;
    case S::kArchived:
      return false;
  }
  return false;
}

std::string_view             ToString(InstanceStatus status);
std::optional<InstanceStatus> ParseInstanceStatus(std::string_view value);

enum class VolumeStatus : std::uint8_t {
  kAttached = 0,
  kDeleting,
  kDeleted,
};

std::string_view            ToString(VolumeStatus status);
std::optional<VolumeStatus> ParseVolumeStatus(std::string_view value);

} // namespace fleet::model
