#pragma once

#include <string>

#include "config/config.pb.h"

namespace eventlog::config {

inline constexpr const char* kDefaultChannel           = "run_events";
inline constexpr unsigned    kDefaultPollIntervalMs    = 250;
inline constexpr unsigned    kDefaultInitialBackoffMs  = 100;
inline constexpr unsigned    kDefaultMaxBackoffMs      = 5000;
inline constexpr unsigned    kDefaultPgMaxConnections  = 4;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected; unset watcher fields get their defaults.
*/
class ConfigLoader {
 public:
  static eventlog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills zero-valued watcher/database fields with defaults.
  static void ApplyDefaults(eventlog::runtime::config::RuntimeConfig& config);

  static eventlog::runtime::config::RuntimeConfig Defaults();
};

} // namespace eventlog::config
