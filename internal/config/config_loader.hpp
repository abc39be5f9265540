#pragma once

#include <string>

#include "config/config.pb.h"

namespace launchpad::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields
  are rejected. Failures throw std::runtime_error.
*/
class ConfigLoader {
 public:
  static launchpad::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for YAML text already in memory.
  static launchpad::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace launchpad::config
