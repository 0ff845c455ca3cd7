#include "instance_status.hpp"

#include <array>
#include <utility>

namespace fleet::model {

namespace {

constexpr std::array<std::pair<InstanceStatus, std::string_view>, 12> kInstanceStatusNames = {{
    {InstanceStatus::kProvisioning, "provisioning"},
    {InstanceStatus::kBooting, "booting"},
    {InstanceStatus::kInstalling, "installing"},
    {InstanceStatus::kStarting, "starting"},
    {InstanceStatus::kReady, "ready"},
    {InstanceStatus::kDraining, "draining"},
    {InstanceStatus::kTerminating, "terminating"},
    {InstanceStatus::kTerminated, "terminated"},
    {InstanceStatus::kArchived, "archived"},
    {InstanceStatus::kProvisioningFailed, "provisioning_failed"},
    {InstanceStatus::kStartupFailed, "startup_failed"},
    {InstanceStatus::kFailed, "failed"},
}};

constexpr std::array<std::pair<VolumeStatus, std::string_view>, 3> kVolumeStatusNames = {{
    {VolumeStatus::kAttached, "attached"},
    {VolumeStatus::kDeleting, "deleting"},
    {VolumeStatus::kDeleted, "deleted"},
}};

} // namespace

std::string_view ToString(InstanceStatus status) {
  for (const auto& [value, name] : kInstanceStatusNames) {
    if (value == status) return name;
  }
  return "unknown";
}

std::optional<InstanceStatus> ParseInstanceStatus(std::string_view value) {
  for (const auto& [status, name] : kInstanceStatusNames) {
    if (name == value) return status;
  }
  return std::nullopt;
}

std::string_view ToString(VolumeStatus status) {
  for (const auto& [value, name] : kVolumeStatusNames) {
    if (value == status) return name;
  }
  return "unknown";
}

std::optional<VolumeStatus> ParseVolumeStatus(std::string_view value) {
  for (const auto& [status, name] : kVolumeStatusNames) {
    if (name == value) return status;
  }
  return std::nullopt;
}

} // namespace fleet::model
