#pragma once

#include <string>

#include "config/config.pb.h"

namespace sessionkeeper::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Failures throw util::InvalidArgument.
*/
class ConfigLoader {
 public:
  static sessionkeeper::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static sessionkeeper::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace sessionkeeper::config
