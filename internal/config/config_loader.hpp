#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleet::config {

/*
  Loads RuntimeConfig from YAML.

  The document goes through protobuf's JSON mapping, so unknown keys and
  mistyped values are rejected. String values may reference the
  environment as ${NAME} or ${NAME:-fallback}; an unset variable without
  a fallback is an error. Failures throw util::InvalidArgument naming the
  key path.
*/
class ConfigLoader {
 public:
  static fleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fleet::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace fleet::config
