#include "command_codec.hpp"

#include <google/protobuf/util/json_util.h>

namespace fleet::dispatch {

using fleet::orchestrator::v1::Command;

std::string_view CommandKind(const Command& command) {
  switch (command.body_case()) {
    case Command::kProvision:
      return "PROVISION";
    case Command::kTerminate:
      return "TERMINATE";
    case Command::kReinstall:
      return "REINSTALL";
    case Command::kSyncCatalog:
      return "SYNC_CATALOG";
    case Command::kReconcile:
      return "RECONCILE";
    case Command::BODY_NOT_SET:
      break;
  }
  return "UNKNOWN";
}

std::string EncodeCommand(const Command& command) {
  std::string bytes;
  command.SerializeToString(&bytes);
  return bytes;
}

std::string EncodeCommandJson(const Command& command) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(command, &json);
  if (!status.ok()) {
    return {};
  }
  return json;
}

std::optional<Command> DecodeCommand(std::string_view bytes) {
  Command command;
  if (command.ParseFromArray(bytes.data(), static_cast<int>(bytes.size())) && command.body_case() != Command::BODY_NOT_SET) {
    return command;
  }

  command.Clear();
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(bytes), &command, options);
  if (status.ok() && command.body_case() != Command::BODY_NOT_SET) {
    return command;
  }
  return std::nullopt;
}

} // namespace fleet::dispatch
