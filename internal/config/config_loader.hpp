#pragma once

#include <string>

#include "config/config.pb.h"

namespace forge::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset sections receive the daemon defaults.
*/
class ConfigLoader {
 public:
  static forge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static forge::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  static void ApplyDefaults(forge::runtime::config::RuntimeConfig& config);
};

} // namespace forge::config
