#pragma once

#include <string>

#include "config/config.pb.h"

namespace datagraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static datagraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static datagraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // In-memory store, hashing embedder, generation disabled.
  static datagraph::runtime::config::RuntimeConfig Defaults();
};

} // namespace datagraph::config
