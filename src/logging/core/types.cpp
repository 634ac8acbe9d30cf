/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>

namespace assay::logging {

auto LoggingConfig::toJson() const -> nlohmann::json {
    return {{"level", levelToString(default_level)},
            {"pattern", default_pattern},
            {"console", enable_console},
            {"console_color", console_color},
            {"file", enable_file},
            {"log_dir", log_dir},
            {"log_filename", log_filename},
            {"max_file_size", max_file_size},
            {"max_files", max_files}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.default_level =
        levelFromString(j.value("level", levelToString(config.default_level)));
    config.default_pattern = j.value("pattern", config.default_pattern);
    config.enable_console = j.value("console", config.enable_console);
    config.console_color = j.value("console_color", config.console_color);
    config.enable_file = j.value("file", config.enable_file);
    config.log_dir = j.value("log_dir", config.log_dir);
    config.log_filename = j.value("log_filename", config.log_filename);
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    return config;
}

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "critical" || lower == "fatal")
        return spdlog::level::critical;
    if (lower == "off")
        return spdlog::level::off;

    return spdlog::level::info;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    switch (level) {
        case spdlog::level::trace:
            return "trace";
        case spdlog::level::debug:
            return "debug";
        case spdlog::level::info:
            return "info";
        case spdlog::level::warn:
            return "warn";
        case spdlog::level::err:
            return "error";
        case spdlog::level::critical:
            return "critical";
        case spdlog::level::off:
            return "off";
        default:
            return "info";
    }
}

}  // namespace assay::logging
