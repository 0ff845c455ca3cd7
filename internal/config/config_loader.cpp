#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string_view>

#include "internal/util/errors.hpp"

namespace fleet::config {
namespace {

using google::protobuf::Value;

/*
  Walks a YAML document into a google.protobuf.Value tree while tracking
  the dotted key path, so every error names the offending entry
  (for example "providers[1].zones").
*/
class YamlWalker {
 public:
  void Convert(const YAML::Node& node, Value* out) {
    switch (node.Type()) {
      case YAML::NodeType::Undefined:
      case YAML::NodeType::Null:
        out->set_null_value(google::protobuf::NULL_VALUE);
        return;
      case YAML::NodeType::Scalar:
        Scalar(node, out);
        return;
      case YAML::NodeType::Sequence:
        Sequence(node, out);
        return;
      case YAML::NodeType::Map:
        Map(node, out);
        return;
    }
    Fail("unsupported YAML node");
  }

 private:
  [[noreturn]] void Fail(std::string_view what) const {
    throw util::InvalidArgument("config " + (path_.empty() ? std::string("<root>") : path_) + ": " + std::string(what));
  }

  // ${NAME} and ${NAME:-fallback}; a literal "$" not followed by "{" is kept.
  std::string Expand(const std::string& raw) const {
    std::string out;
    out.reserve(raw.size());
    std::size_t pos = 0;
    while (pos < raw.size()) {
      const auto open = raw.find("${", pos);
      if (open == std::string::npos) {
        out.append(raw, pos, std::string::npos);
        break;
      }
      out.append(raw, pos, open - pos);
      const auto close = raw.find('}', open + 2);
      if (close == std::string::npos) Fail("unterminated ${ in value");

      std::string name = raw.substr(open + 2, close - open - 2);
      std::string fallback;
      bool        has_fallback = false;
      if (const auto sep = name.find(":-"); sep != std::string::npos) {
        fallback     = name.substr(sep + 2);
        name         = name.substr(0, sep);
        has_fallback = true;
      }
      if (name.empty()) Fail("empty variable name in ${}");

      const char* value = std::getenv(name.c_str());
      if (value != nullptr && *value != '\0') {
        out += value;
      } else if (has_fallback) {
        out += fallback;
      } else {
        Fail("environment variable " + name + " is not set");
      }
      pos = close + 1;
    }
    return out;
  }

  void Scalar(const YAML::Node& node, Value* out) const {
    const std::string text = node.Tag() == "!" ? Expand(node.Scalar()) : node.Scalar();

    // quoted scalars stay strings: "8080" is a string, 8080 a number
    if (node.Tag() == "!") {
      out->set_string_value(text);
      return;
    }
    if (text == "true" || text == "false") {
      out->set_bool_value(text == "true");
      return;
    }
    if (text == "~" || text == "null") {
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    }
    if (!text.empty()) {
      char*        end    = nullptr;
      const double number = std::strtod(text.c_str(), &end);
      if (end != nullptr && *end == '\0') {
        out->set_number_value(number);
        return;
      }
    }
    out->set_string_value(Expand(text));
  }

  void Sequence(const YAML::Node& node, Value* out) {
    auto*             list   = out->mutable_list_value();
    const std::string parent = path_;
    for (std::size_t i = 0; i < node.size(); ++i) {
      path_ = parent + "[" + std::to_string(i) + "]";
      Convert(node[i], list->add_values());
    }
    path_ = parent;
  }

  void Map(const YAML::Node& node, Value* out) {
    auto*             fields = out->mutable_struct_value()->mutable_fields();
    const std::string parent = path_;
    for (const auto& entry : node) {
      if (!entry.first.IsScalar()) Fail("map keys must be scalars");
      const auto& key = entry.first.Scalar();
      path_           = parent.empty() ? key : parent + "." + key;
      Convert(entry.second, &(*fields)[key]);
    }
    path_ = parent;
  }

  std::string path_;
};

fleet::runtime::config::RuntimeConfig ToRuntimeConfig(const YAML::Node& document) {
  fleet::runtime::config::RuntimeConfig config;
  if (document.IsNull() || !document.IsDefined()) {
    return config;
  }
  if (!document.IsMap()) {
    throw util::InvalidArgument("config: top level must be a mapping");
  }

  Value tree;
  YamlWalker{}.Convert(document, &tree);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(tree, &json); !status.ok()) {
    throw util::InvalidArgument("config: cannot re-encode as JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw util::InvalidArgument("config: " + std::string(status.message()));
  }
  return config;
}

} // namespace

fleet::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("config " + path + ": " + e.what());
  }
  return ToRuntimeConfig(document);
}

fleet::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument(std::string("config: ") + e.what());
  }
  return ToRuntimeConfig(document);
}

} // namespace fleet::config
