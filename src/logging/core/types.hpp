/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging system type definitions

**************************************************/

#ifndef ASSAY_LOGGING_TYPES_HPP
#define ASSAY_LOGGING_TYPES_HPP

#include <string>

#include <spdlog/spdlog.h>
#include "atom/type/json.hpp"

namespace assay::logging {

/**
 * @brief Logging manager configuration
 *
 * Selects the default level and pattern, and which sinks the named
 * loggers share: a colored console sink and an optional rotating file.
 */
struct LoggingConfig {
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};

    // Console settings
    bool enable_console{true};
    bool console_color{true};

    // File settings
    bool enable_file{false};
    std::string log_dir{"logs"};
    std::string log_filename{"assay"};
    size_t max_file_size{10 * 1024 * 1024};  // 10MB default
    size_t max_files{5};

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;
};

/**
 * @brief Convert level string to spdlog enum
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Convert spdlog level enum to string
 */
[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace assay::logging

#endif  // ASSAY_LOGGING_TYPES_HPP
