#pragma once

#include <string>

#include "config/config.pb.h"

namespace escrow::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Quoted scalars always stay strings, so account names such as
  '0x00ab' are never read as numbers.
*/
class ConfigLoader {
 public:
  static escrow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static escrow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace escrow::config
