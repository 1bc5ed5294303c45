#pragma once

#include <string>

#include "config/config.pb.h"

namespace issueflow::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are an
  error, not silently ignored.
*/
class ConfigLoader {
 public:
  static issueflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static issueflow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Config used when no file is given: memory store, default policies.
  static issueflow::runtime::config::RuntimeConfig Defaults();
};

} // namespace issueflow::config
