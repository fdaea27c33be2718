#pragma once

#include <string>

#include "config/config.pb.h"

namespace rnaflow::config {

/*
  Loads PipelineConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields receive
  defaults; the result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static PipelineConfig LoadFromYaml(const std::string& path);

  // Built-in defaults, used when no config file is given.
  static PipelineConfig Defaults();

  static void ApplyDefaults(PipelineConfig* config);

  // Throws util::ConfigurationError on the first invalid value.
  static void Validate(const PipelineConfig& config);
};

} // namespace rnaflow::config
