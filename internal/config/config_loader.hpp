#pragma once

#include <string>

#include "config/config.pb.h"

namespace aggregator::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static aggregator::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static aggregator::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fails fast on values protobuf cannot express (bad durations, bad hex keys).
  static void Validate(const aggregator::runtime::config::RuntimeConfig& config);
};

} // namespace aggregator::config
