#include "progress_calculator.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <utility>

#include "internal/model/action_type.hpp"

namespace fleet::progress {

namespace {

using fleet::model::InstanceStatus;
namespace action = fleet::model::action;

constexpr std::uint32_t kCreated    = 20;
constexpr std::uint32_t kComingUpCap = 95;

// Install milestones in the order they complete.
constexpr std::array<std::pair<std::string_view, std::uint32_t>, 7> kMilestones{{
    {action::kProviderStart, 30},
    {action::kProviderGetIp, 40},
    {action::kWorkerInstall, 50},
    {action::kWorkerHttpReady, 60},
    {action::kWorkerModelLoaded, 75},
    {action::kWorkerWarmup, 90},
    {action::kHealthCheckPass, 95},
}};

bool Completed(const std::vector<std::string>& actions, std::string_view type) {
  return std::find(actions.begin(), actions.end(), type) != actions.end();
}

} // namespace

std::uint32_t ComputeProgress(InstanceStatus status, const std::vector<std::string>& completed_actions) {
  switch (status) {
    case InstanceStatus::kReady:
    case InstanceStatus::kDraining:
      return 100;

    case InstanceStatus::kProvisioning:
      return Completed(completed_actions, action::kProviderCreate) ? kCreated : 5;

    case InstanceStatus::kBooting:
    case InstanceStatus::kInstalling:
    case InstanceStatus::kStarting: {
      std::uint32_t value = kCreated;
      for (const auto& [type, percent] : kMilestones) {
        if (!Completed(completed_actions, type)) break;
        value = percent;
      }
      return std::min(value, kComingUpCap);
    }

    default:
      return 0;
  }
}

} // namespace fleet::progress
