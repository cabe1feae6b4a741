#pragma once

#include <string>

#include "config/config.pb.h"

namespace reqctl::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so the proto
  schema is the single source of truth for what a config may contain.
  Throws util::InvalidConfiguration.
*/
class ConfigLoader {
 public:
  static reqctl::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static reqctl::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace reqctl::config
