#pragma once

#include <string>

#include "config/config.pb.h"

namespace tkv::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected. Throws util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static tkv::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tkv::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace tkv::config
