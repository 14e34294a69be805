#pragma once

#include <string>

#include "config/config.pb.h"

namespace alo::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Zero values are replaced by the defaults in ApplyDefaults,
  then Validate rejects combinations the services cannot run with.
*/
class ConfigLoader {
 public:
  static alo::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static alo::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(alo::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error. A single push call must fit three times in
  // the delivery claim lease, the claim being renewed every lease/3.
  static void Validate(const alo::runtime::config::RuntimeConfig& config);
};

} // namespace alo::config
