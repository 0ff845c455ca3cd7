#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>

namespace fleet::util {

/*
  JSON helpers on top of google::protobuf::Struct.

  Used for provider API bodies and the free-form metadata columns.
*/

// Parses a JSON object. Returns nullopt on malformed input or non-object roots.
std::optional<google::protobuf::Struct> ParseJsonObject(std::string_view json);

std::string ToJson(const google::protobuf::Struct& object);

// Looks up a dotted path ("server.public_ip.address"). Missing or null yields nullptr.
const google::protobuf::Value* FindPath(const google::protobuf::Struct& object, std::string_view dotted_path);

std::string  StringAt(const google::protobuf::Struct& object, std::string_view dotted_path, std::string fallback = {});
double       NumberAt(const google::protobuf::Struct& object, std::string_view dotted_path, double fallback = 0);
bool         BoolAt(const google::protobuf::Struct& object, std::string_view dotted_path, bool fallback = false);

// True when the string is empty or a JSON object.
bool IsJsonObjectOrEmpty(std::string_view json);

} // namespace fleet::util
