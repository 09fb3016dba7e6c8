#pragma once

#include <string>

#include "config/config.pb.h"

namespace availability::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars stay strings.
*/
class ConfigLoader {
 public:
  static availability::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static availability::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace availability::config
