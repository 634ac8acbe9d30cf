/*
 * resource_limiter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file resource_limiter.hpp
 * @brief Platform capability interface for OS-level resource limits
 */

#ifndef ASSAY_SANDBOX_RESOURCE_LIMITER_HPP
#define ASSAY_SANDBOX_RESOURCE_LIMITER_HPP

#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "config/sections/sandbox_config.hpp"
#include "types.hpp"

namespace assay::sandbox {

/**
 * @brief A limit that is in force for the lifetime of the object
 *
 * Destruction restores whatever was in force before installation.
 */
class ScopedLimit {
public:
    virtual ~ScopedLimit() = default;

    [[nodiscard]] virtual auto kind() const noexcept -> LimitKind = 0;

    /**
     * @brief Effective value installed, in the limit's own unit
     */
    [[nodiscard]] virtual auto effectiveValue() const noexcept -> long = 0;
};

/**
 * @brief What a platform can enforce, and the means to enforce it
 *
 * The governor asks supports() before installing anything and reports
 * each limit as enforced or skipped. Timeout and recursion are applied
 * by the governor itself; CPU and memory need the operating system.
 */
class ResourceLimiter {
public:
    virtual ~ResourceLimiter() = default;

    [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

    [[nodiscard]] virtual auto supports(LimitKind kind) const noexcept
        -> bool = 0;

    /**
     * @brief Limit CPU time to what is consumed now plus the given seconds
     */
    [[nodiscard]] virtual auto installCpuLimit(int seconds)
        -> std::expected<std::unique_ptr<ScopedLimit>, std::string> = 0;

    /**
     * @brief Limit address space to what is mapped now plus the given MB
     */
    [[nodiscard]] virtual auto installMemoryLimit(int megabytes)
        -> std::expected<std::unique_ptr<ScopedLimit>, std::string> = 0;

    /**
     * @brief Whether the installed CPU limit has been reached
     *
     * Polled by the governor's watchdog; set asynchronously.
     */
    [[nodiscard]] virtual auto cpuLimitReached() const noexcept -> bool = 0;
};

/**
 * @brief Limiter for platforms without resource limits
 *
 * Only the interpreter recursion ceiling is applied.
 */
class RecursionOnlyLimiter : public ResourceLimiter {
public:
    [[nodiscard]] auto name() const noexcept -> std::string_view override {
        return "recursion-only";
    }

    [[nodiscard]] auto supports(LimitKind kind) const noexcept
        -> bool override {
        return kind == LimitKind::Recursion;
    }

    [[nodiscard]] auto installCpuLimit(int seconds)
        -> std::expected<std::unique_ptr<ScopedLimit>, std::string> override;

    [[nodiscard]] auto installMemoryLimit(int megabytes)
        -> std::expected<std::unique_ptr<ScopedLimit>, std::string> override;

    [[nodiscard]] auto cpuLimitReached() const noexcept -> bool override {
        return false;
    }
};

#if defined(__unix__) || defined(__APPLE__)
/**
 * @brief setrlimit based limiter (RLIMIT_CPU with SIGXCPU, RLIMIT_AS)
 */
class PosixResourceLimiter : public ResourceLimiter {
public:
    [[nodiscard]] auto name() const noexcept -> std::string_view override {
        return "posix";
    }

    [[nodiscard]] auto supports(LimitKind kind) const noexcept
        -> bool override;

    [[nodiscard]] auto installCpuLimit(int seconds)
        -> std::expected<std::unique_ptr<ScopedLimit>, std::string> override;

    [[nodiscard]] auto installMemoryLimit(int megabytes)
        -> std::expected<std::unique_ptr<ScopedLimit>, std::string> override;

    [[nodiscard]] auto cpuLimitReached() const noexcept -> bool override;
};
#endif

/**
 * @brief Best limiter for this platform under the configured mode
 */
[[nodiscard]] auto createPlatformLimiter(config::LimiterMode mode)
    -> std::shared_ptr<ResourceLimiter>;

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_RESOURCE_LIMITER_HPP
