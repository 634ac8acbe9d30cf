/*
 * test_logging_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Tests for the logging configuration and the logging manager

**************************************************/

#include <gtest/gtest.h>

#include "logging/core/logging_manager.hpp"
#include "logging/core/types.hpp"

using namespace assay::logging;

TEST(LoggingTypesTest, LevelStrings) {
    EXPECT_EQ(levelFromString("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("fatal"), spdlog::level::critical);
    EXPECT_EQ(levelFromString("bogus"), spdlog::level::info);
    EXPECT_EQ(levelToString(spdlog::level::err), "error");
    EXPECT_EQ(levelToString(spdlog::level::off), "off");
}

TEST(LoggingTypesTest, ConfigJsonRoundTrip) {
    LoggingConfig config;
    config.default_level = spdlog::level::debug;
    config.enable_file = true;
    config.log_dir = "/tmp/assay-logs";
    config.max_files = 2;

    auto restored = LoggingConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.default_level, spdlog::level::debug);
    EXPECT_TRUE(restored.enable_file);
    EXPECT_EQ(restored.log_dir, "/tmp/assay-logs");
    EXPECT_EQ(restored.max_files, 2u);
    EXPECT_EQ(restored.default_pattern, config.default_pattern);
}

class LoggingManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        auto& manager = LoggingManager::getInstance();
        if (manager.isInitialized()) {
            manager.shutdown();
        }
    }
};

TEST_F(LoggingManagerTest, InitializeWithConsoleOnly) {
    LoggingConfig config;
    config.default_level = spdlog::level::debug;
    config.console_color = false;

    auto& manager = LoggingManager::getInstance();
    manager.initialize(config);
    EXPECT_TRUE(manager.isInitialized());
    EXPECT_EQ(manager.getConfig().default_level, spdlog::level::debug);
    ASSERT_NE(spdlog::default_logger(), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "assay");
}

TEST_F(LoggingManagerTest, NamedLoggerIsReused) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(LoggingConfig{});

    auto first = manager.getLogger("assay.test");
    auto second = manager.getLogger("assay.test");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
}

TEST_F(LoggingManagerTest, LoggingStillWorksAfterShutdown) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(LoggingConfig{});
    manager.shutdown();

    EXPECT_FALSE(manager.isInitialized());
    ASSERT_NE(spdlog::default_logger(), nullptr);
    EXPECT_NO_THROW(spdlog::info("after shutdown"));
}

TEST_F(LoggingManagerTest, SetGlobalLevel) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(LoggingConfig{});
    manager.setGlobalLevel(spdlog::level::warn);
    EXPECT_EQ(manager.getConfig().default_level, spdlog::level::warn);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}
