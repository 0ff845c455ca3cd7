#pragma once

#include <string_view>

namespace fleet::model {

/*
  Action log vocabulary. Provider calls and install milestones are
  recorded under these names; the progress calculator reads them back.
*/
namespace action {

inline constexpr std::string_view kProviderCreate     = "PROVIDER_CREATE";
inline constexpr std::string_view kProviderStart      = "PROVIDER_START";
inline constexpr std::string_view kProviderGetIp      = "PROVIDER_GET_IP";
inline constexpr std::string_view kProviderDelete     = "PROVIDER_DELETE";
inline constexpr std::string_view kProviderVolumeDel  = "PROVIDER_DELETE_VOLUME";
inline constexpr std::string_view kWorkerInstall      = "WORKER_INSTALL";
inline constexpr std::string_view kWorkerHttpReady    = "WORKER_HTTP_READY";
inline constexpr std::string_view kWorkerModelLoaded  = "WORKER_MODEL_LOADED";
inline constexpr std::string_view kWorkerWarmup       = "WORKER_WARMUP";
inline constexpr std::string_view kHealthCheckPass    = "HEALTH_CHECK_PASS";
inline constexpr std::string_view kReinstallRequested = "REINSTALL_REQUESTED";

} // namespace action

enum class ActionStatus {
  kInProgress,
  kSuccess,
  kFailed,
};

constexpr std::string_view ToString(ActionStatus status) {
  switch (status) {
    case ActionStatus::kInProgress:
      return "in_progress";
    case ActionStatus::kSuccess:
      return "success";
    case ActionStatus::kFailed:
      return "failed";
  }
  return "in_progress";
}

constexpr ActionStatus ParseActionStatus(std::string_view value) {
  if (value == "success") return ActionStatus::kSuccess;
  if (value == "failed") return ActionStatus::kFailed;
  return ActionStatus::kInProgress;
}

} // namespace fleet::model
