#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleet::config {

/*
  Loads RuntimeConfig from YAML.

  The YAML tree is mapped onto a protobuf Value, rendered as JSON and parsed
  into RuntimeConfig, so unknown keys are rejected by the protobuf parser.
  Unset probe/audit/server fields are filled with their defaults afterwards.
*/
class ConfigLoader {
 public:
  static fleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fleet::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  static void ApplyDefaults(fleet::runtime::config::RuntimeConfig* config);
};

} // namespace fleet::config
