#pragma once

#include <string>

#include "config/config.pb.h"

namespace offsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset numeric
  fields are filled with engine defaults and the result is validated.
*/
class ConfigLoader {
 public:
  static offsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills zero-valued fields with defaults. Idempotent.
  static void ApplyDefaults(offsync::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid field.
  static void Validate(const offsync::runtime::config::RuntimeConfig& config);
};

} // namespace offsync::config
