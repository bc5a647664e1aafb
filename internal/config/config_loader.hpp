#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/model/project.hpp"

namespace slotkeeper::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Quoted scalars stay
  strings, so "09:00" or "1234" are never read as numbers.
*/
class ConfigLoader {
 public:
  static slotkeeper::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static slotkeeper::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  // Fills unset fields with their defaults.
  static void ApplyDefaults(slotkeeper::runtime::config::RuntimeConfig& config);

  // Throws util::ValidationError on malformed project settings.
  static model::ProjectRegistry BuildProjects(const slotkeeper::runtime::config::RuntimeConfig& config);
};

} // namespace slotkeeper::config
