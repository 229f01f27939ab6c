#pragma once

#include <string>

#include "config/config.pb.h"

namespace flowsched::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so keys follow the
  proto field names and unknown keys are rejected. Failures throw
  util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static flowsched::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static flowsched::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Rejects values the proto schema cannot express as invalid.
  static void Validate(const flowsched::runtime::config::RuntimeConfig& config);
};

} // namespace flowsched::config
