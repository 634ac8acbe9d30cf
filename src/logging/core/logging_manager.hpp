/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Central Logging Manager - owns the shared sinks and hands out
named loggers

**************************************************/

#ifndef ASSAY_LOGGING_LOGGING_MANAGER_HPP
#define ASSAY_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace assay::logging {

/**
 * @brief Process-wide logging setup.
 *
 * Module code logs through the spdlog free functions (default logger);
 * components that want their own channel, such as the audit trail, ask
 * for a named logger which shares the configured sinks.
 */
class LoggingManager {
public:
    /**
     * @brief Get singleton instance
     */
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize logging system with configuration
     * @param config Logging configuration
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flush and drop all loggers
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger sharing the configured sinks
     * @param name Logger name
     * @return Shared pointer to logger
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set log level for all loggers
     * @param level New level
     */
    void setGlobalLevel(spdlog::level::level_enum level);

    [[nodiscard]] auto getConfig() const -> LoggingConfig;

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

private:
    LoggingManager() = default;
    ~LoggingManager();

    void setupDefaultLogger();

    mutable std::shared_mutex mutex_;
    LoggingConfig config_;
    bool initialized_{false};
    std::unordered_map<std::string, spdlog::sink_ptr> sinks_;
};

}  // namespace assay::logging

#endif  // ASSAY_LOGGING_LOGGING_MANAGER_HPP
