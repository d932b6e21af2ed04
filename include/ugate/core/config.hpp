#pragma once
#include "ugate/core/types.hpp"
#include "ugate/limits/resource_limiter.hpp"
#include "ugate/log.h"
#include "ugate/tempfs/temp_file_manager.hpp"

#include <string>
#include <vector>

namespace ugate {

struct LogConfig {
  LogLevel level = LogLevel::Info;
};

struct AppConfig {
  SecurityConfig security;
  ResourceLimits limits;
  TempFileConfig temp;
  LogConfig logging;
};

// Missing keys keep whatever outCfg already holds.
bool loadConfigYaml(const std::string& path, AppConfig& outCfg, std::string& err);

// UGATE_TEMP_DIR, UGATE_LOG_LEVEL, UGATE_MAX_COMPRESSION_RATIO,
// UGATE_MAX_FILES_PER_ARCHIVE, UGATE_MAX_CONCURRENT_UPLOADS,
// UGATE_MAX_CONCURRENT_EXTRACTIONS. Unparseable values are logged and skipped.
void applyEnvOverrides(AppConfig& cfg);

// One message per invalid value; empty when usable.
std::vector<std::string> validateConfig(const AppConfig& cfg);

} // namespace ugate
