#pragma once

#include <string>

#include "config/config.pb.h"

namespace lnbridge::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields get
  their defaults before the config is returned.
*/
class ConfigLoader {
 public:
  static lnbridge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(lnbridge::runtime::config::RuntimeConfig* config);

  // Throws std::runtime_error when the node credentials are missing.
  static void Validate(const lnbridge::runtime::config::RuntimeConfig& config);
};

} // namespace lnbridge::config
