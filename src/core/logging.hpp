#pragma once

#include <string>

struct AppConfig;

/// Install the "dante-provider" spdlog default logger.
/// Always logs to stderr (stdout carries the bridge protocol); adds a
/// file sink when config.log_file is set. Unknown levels fall back to info.
void init_logging(const AppConfig& config);
