#pragma once

#include <string>

#include "config/config.pb.h"

namespace wfrun::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Quoted scalars
  stay strings; unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static wfrun::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static wfrun::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace wfrun::config
