/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace assay::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const LoggingConfig& config) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        spdlog::warn("LoggingManager already initialized, reinitializing...");
        spdlog::drop_all();
        sinks_.clear();
    }

    config_ = config;

    if (config.enable_console) {
        spdlog::sink_ptr console;
        if (config.console_color) {
            console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        } else {
            console = std::make_shared<spdlog::sinks::stdout_sink_mt>();
        }
        console->set_level(config.default_level);
        sinks_["console"] = console;
    }

    if (config.enable_file) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_dir, ec);
        if (ec) {
            spdlog::error("Failed to create log directory '{}': {}",
                          config.log_dir, ec.message());
        } else {
            auto path = std::filesystem::path(config.log_dir) /
                        (config.log_filename + ".log");
            try {
                sinks_["file"] =
                    std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        path.string(), config.max_file_size, config.max_files);
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::error("Failed to open log file '{}': {}",
                              path.string(), e.what());
            }
        }
    }

    setupDefaultLogger();

    initialized_ = true;
    spdlog::info("LoggingManager initialized with {} sinks", sinks_.size());
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    spdlog::info("LoggingManager shutting down...");
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->flush();
    });
    spdlog::drop_all();
    sinks_.clear();

    // drop_all() also clears the default logger the free functions use
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "assay", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));

    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::unique_lock lock(mutex_);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    std::vector<spdlog::sink_ptr> sink_list;
    for (const auto& [sink_name, sink] : sinks_) {
        sink_list.push_back(sink);
    }
    if (sink_list.empty()) {
        // Not initialized yet: share whatever the default logger writes to
        if (auto fallback = spdlog::default_logger()) {
            sink_list = fallback->sinks();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(name, sink_list.begin(),
                                                   sink_list.end());
    logger->set_level(config_.default_level);
    logger->set_pattern(config_.default_pattern);
    spdlog::register_logger(logger);
    return logger;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);

    spdlog::set_level(level);
    config_.default_level = level;
    spdlog::info("Global log level set to {}",
                 spdlog::level::to_string_view(level));
}

auto LoggingManager::getConfig() const -> LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

void LoggingManager::setupDefaultLogger() {
    std::vector<spdlog::sink_ptr> sink_list;
    for (const auto& [name, sink] : sinks_) {
        sink_list.push_back(sink);
    }

    auto logger = std::make_shared<spdlog::logger>("assay", sink_list.begin(),
                                                   sink_list.end());
    logger->set_level(config_.default_level);
    logger->set_pattern(config_.default_pattern);
    spdlog::set_default_logger(logger);
}

}  // namespace assay::logging
