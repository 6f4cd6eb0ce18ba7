#pragma once

#include <string>

#include "config/config.pb.h"

namespace sampledir::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static sampledir::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Sidecar file name, falling back to "meta" when unset.
  static std::string MetaFileName(const sampledir::runtime::config::RuntimeConfig& config);
};

} // namespace sampledir::config
