/*
 * resource_limiter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_limiter.hpp"

#include <spdlog/spdlog.h>

namespace assay::sandbox {

auto RecursionOnlyLimiter::installCpuLimit(int /*seconds*/)
    -> std::expected<std::unique_ptr<ScopedLimit>, std::string> {
    return std::unexpected("CPU limits are not supported on this platform");
}

auto RecursionOnlyLimiter::installMemoryLimit(int /*megabytes*/)
    -> std::expected<std::unique_ptr<ScopedLimit>, std::string> {
    return std::unexpected("Memory limits are not supported on this platform");
}

auto createPlatformLimiter(config::LimiterMode mode)
    -> std::shared_ptr<ResourceLimiter> {
    if (mode == config::LimiterMode::RecursionOnly) {
        spdlog::info("Resource limiter forced to recursion-only by config");
        return std::make_shared<RecursionOnlyLimiter>();
    }
#if defined(__unix__) || defined(__APPLE__)
    return std::make_shared<PosixResourceLimiter>();
#else
    spdlog::warn(
        "Resource limits (timeout, memory, CPU) are not available on this "
        "platform; only the recursion ceiling is enforced");
    return std::make_shared<RecursionOnlyLimiter>();
#endif
}

}  // namespace assay::sandbox
