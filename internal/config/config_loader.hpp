#pragma once

#include <string>

#include "config/config.pb.h"

namespace graphdoc::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields
  are rejected. GRAPHDOC_SQLITE_PATH and GRAPHDOC_POSTGRES_URI, when
  set, override the database section after parsing.
*/
class ConfigLoader {
 public:
  static graphdoc::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static graphdoc::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace graphdoc::config
