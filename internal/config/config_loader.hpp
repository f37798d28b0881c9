#pragma once

#include <string>

#include "config/config.pb.h"

namespace prefixid::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static prefixid::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace prefixid::config
