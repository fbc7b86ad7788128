#pragma once

#include <string>

#include "config/config.pb.h"

namespace relaynorm::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys
  are rejected. Quoted scalars stay strings, so parameter codes such
  as "0160" keep their leading zero. Built-in defaults are applied to
  whatever the file leaves unset.
*/
class ConfigLoader {
 public:
  static relaynorm::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace relaynorm::config
