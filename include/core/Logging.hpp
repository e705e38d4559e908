#pragma once
#include "core/AppConfig.hpp"
#include <spdlog/spdlog.h>
#include <string>

// Installs the default "voxdeck" logger: colour console + rotating file.
void setupLogging(const LogConfig& config);

spdlog::level::level_enum parseLogLevel(const std::string& level);
