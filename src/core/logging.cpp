#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

void init_logging(const AppConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                Config::expand_home(config.log_file), false));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file {}: {}", config.log_file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("dante-provider", sinks.begin(), sinks.end());
    auto level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to off; only "off" itself may disable logging
    if (level == spdlog::level::off && config.log_level != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}
