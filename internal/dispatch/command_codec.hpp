#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "fleet/orchestrator/v1/commands.pb.h"

namespace fleet::dispatch {

// Stable command kind label for logs and metrics ("PROVISION", ...).
std::string_view CommandKind(const fleet::orchestrator::v1::Command& command);

std::string EncodeCommand(const fleet::orchestrator::v1::Command& command);
std::string EncodeCommandJson(const fleet::orchestrator::v1::Command& command);

// Binary protobuf first, then protobuf JSON. nullopt when neither yields a
// command with a body.
std::optional<fleet::orchestrator::v1::Command> DecodeCommand(std::string_view bytes);

} // namespace fleet::dispatch
