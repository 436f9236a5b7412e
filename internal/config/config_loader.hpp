#pragma once

#include <string>

#include "config/config.pb.h"

namespace infragraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Every failure surfaces as std::runtime_error.
*/
class ConfigLoader {
 public:
  static infragraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static infragraph::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Semantic checks the schema cannot express.
  static void Validate(const infragraph::runtime::config::RuntimeConfig& config);
};

} // namespace infragraph::config
