/*
 * test_lazy_resource.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "sandbox/lazy_resource.hpp"

using assay::sandbox::LazyResource;

TEST(LazyResourceTest, BuildsOnFirstUseOnly) {
    int builds = 0;
    LazyResource<std::string> resource([&builds] {
        ++builds;
        return std::make_unique<std::string>("engine-" + std::to_string(builds));
    });

    EXPECT_FALSE(resource.ready());
    EXPECT_EQ(resource.generation(), 0u);
    EXPECT_EQ(resource.get(), "engine-1");
    EXPECT_EQ(resource.get(), "engine-1");
    EXPECT_TRUE(resource.ready());
    EXPECT_EQ(builds, 1);
    EXPECT_EQ(resource.generation(), 1u);
}

TEST(LazyResourceTest, InvalidateRebuilds) {
    int builds = 0;
    LazyResource<int> resource([&builds] { return std::make_unique<int>(++builds); });

    EXPECT_EQ(resource.get(), 1);
    resource.invalidate();
    EXPECT_FALSE(resource.ready());
    EXPECT_EQ(resource.generation(), 1u);
    EXPECT_EQ(resource.get(), 2);
    EXPECT_EQ(resource.generation(), 2u);
}

TEST(LazyResourceTest, ThrowingFactoryLeavesItEmpty) {
    bool fail = true;
    LazyResource<int> resource([&fail]() -> std::unique_ptr<int> {
        if (fail) {
            throw std::runtime_error("prelude failed");
        }
        return std::make_unique<int>(7);
    });

    EXPECT_THROW(resource.get(), std::runtime_error);
    EXPECT_FALSE(resource.ready());
    EXPECT_EQ(resource.generation(), 0u);

    fail = false;
    EXPECT_EQ(resource.get(), 7);
    EXPECT_EQ(resource.generation(), 1u);
}

TEST(LazyResourceTest, ConcurrentFirstUseBuildsOnce) {
    std::atomic<int> builds{0};
    LazyResource<int> resource([&builds] {
        builds.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::make_unique<int>(42);
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&resource] { EXPECT_EQ(resource.get(), 42); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(builds.load(), 1);
}
