#pragma once

#include <string_view>

namespace fleet::model::error_code {

// Values written to instances.error_code.
inline constexpr std::string_view kProviderNotConfigured        = "PROVIDER_NOT_CONFIGURED";
inline constexpr std::string_view kImageNotFound                = "IMAGE_NOT_FOUND";
inline constexpr std::string_view kProvisioningRetriesExhausted = "PROVISIONING_RETRIES_EXHAUSTED";
inline constexpr std::string_view kStartupTimeout               = "STARTUP_TIMEOUT";
inline constexpr std::string_view kModelLoadTimeout             = "MODEL_LOAD_TIMEOUT";
inline constexpr std::string_view kHealthCheckFailed            = "HEALTH_CHECK_FAILED";
inline constexpr std::string_view kRecoveryTimeout              = "RECOVERY_TIMEOUT";
inline constexpr std::string_view kTerminationManual            = "TERMINATION_MANUAL_INTERVENTION";
inline constexpr std::string_view kProviderDeleted              = "PROVIDER_DELETED";

} // namespace fleet::model::error_code
