#pragma once

#include <string>

#include "config/config.pb.h"

namespace pointzilla::config {

/*
  Loads RunConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static pointzilla::runtime::config::RunConfig LoadFromYaml(const std::string& path);
  static pointzilla::runtime::config::RunConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace pointzilla::config
