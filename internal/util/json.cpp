#include "json.hpp"

#include <google/protobuf/util/json_util.h>

namespace fleet::util {

std::optional<google::protobuf::Struct> ParseJsonObject(std::string_view json) {
  google::protobuf::Struct                 object;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &object, options);
  if (!status.ok()) {
    return std::nullopt;
  }
  return object;
}

std::string ToJson(const google::protobuf::Struct& object) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    return "{}";
  }
  return json;
}

const google::protobuf::Value* FindPath(const google::protobuf::Struct& object, std::string_view dotted_path) {
  const google::protobuf::Struct* current = &object;
  const google::protobuf::Value*  value   = nullptr;

  while (!dotted_path.empty()) {
    const auto  dot = dotted_path.find('.');
    const auto  key = std::string(dotted_path.substr(0, dot));
    const auto& fields = current->fields();
    auto        it     = fields.find(key);
    if (it == fields.end()) {
      return nullptr;
    }
    value = &it->second;

    if (dot == std::string_view::npos) {
      break;
    }
    if (value->kind_case() != google::protobuf::Value::kStructValue) {
      return nullptr;
    }
    current     = &value->struct_value();
    dotted_path = dotted_path.substr(dot + 1);
  }

  if (value && value->kind_case() == google::protobuf::Value::kNullValue) {
    return nullptr;
  }
  return value;
}

std::string StringAt(const google::protobuf::Struct& object, std::string_view dotted_path, std::string fallback) {
  const auto* value = FindPath(object, dotted_path);
  if (!value || value->kind_case() != google::protobuf::Value::kStringValue) {
    return fallback;
  }
  return value->string_value();
}

double NumberAt(const google::protobuf::Struct& object, std::string_view dotted_path, double fallback) {
  const auto* value = FindPath(object, dotted_path);
  if (!value || value->kind_case() != google::protobuf::Value::kNumberValue) {
    return fallback;
  }
  return value->number_value();
}

bool BoolAt(const google::protobuf::Struct& object, std::string_view dotted_path, bool fallback) {
  const auto* value = FindPath(object, dotted_path);
  if (!value || value->kind_case() != google::protobuf::Value::kBoolValue) {
    return fallback;
  }
  return value->bool_value();
}

bool IsJsonObjectOrEmpty(std::string_view json) {
  return json.empty() || ParseJsonObject(json).has_value();
}

} // namespace fleet::util
