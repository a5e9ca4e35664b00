#pragma once

#include <string>

#include "config/config.pb.h"

namespace heartbeat::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults fill unset fields, then HEARTBEAT_* environment
  overrides are applied for secrets.
*/
class ConfigLoader {
 public:
  static heartbeat::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static heartbeat::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset fields with their defaults.
  static void ApplyDefaults(heartbeat::runtime::config::RuntimeConfig& config);

  // HEARTBEAT_SIGNING_SECRET, HEARTBEAT_ADMIN_TOKEN
  static void ApplyEnvironmentOverrides(heartbeat::runtime::config::RuntimeConfig& config);
};

} // namespace heartbeat::config
