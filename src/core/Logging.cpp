#include "core/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

spdlog::level::level_enum parseLogLevel(const std::string& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void setupLogging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.file.empty())
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, 1048576 * 5, 3));  // 5MB, 3 files

    auto logger = std::make_shared<spdlog::logger>(
        "voxdeck", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(parseLogLevel(config.level));
    spdlog::flush_on(spdlog::level::warn);
}
