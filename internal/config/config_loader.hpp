#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace usagestat::config {

inline constexpr const char* kDefaultDbPath       = "./usage_stat_data.sqlite";
inline constexpr const char* kDefaultAuditLogPath = "./usage_stat.log";
inline constexpr uint32_t    kDefaultBusyTimeoutMs = 30000;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected.
*/
class ConfigLoader {
 public:
  static usagestat::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills unset storage path, busy timeout and audit path.
  static void ApplyDefaults(usagestat::runtime::config::RuntimeConfig& config);

  /*
    USAGESTAT_DB_PATH      -> storage.path
    USAGESTAT_LOG_PATH     -> audit.path
    USAGESTAT_LOG_ENABLED  -> audit.enabled (true/1/yes, false/0/no)
  */
  static void ApplyEnvironmentOverrides(usagestat::runtime::config::RuntimeConfig& config);

  // File (if path is non-empty), then defaults, then environment.
  static usagestat::runtime::config::RuntimeConfig Load(const std::string& path);
};

} // namespace usagestat::config
