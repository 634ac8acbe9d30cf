/*
 * resource_limiter_posix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_limiter.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstring>

#include <signal.h>
#include <sys/resource.h>

#include <spdlog/spdlog.h>

#include "resource_monitor.hpp"

namespace assay::sandbox {

namespace {

std::atomic<bool> g_cpuLimitReached{false};
static_assert(std::atomic<bool>::is_always_lock_free);

void onCpuLimitSignal(int /*signo*/) {
    g_cpuLimitReached.store(true, std::memory_order_relaxed);
}

auto errnoMessage(const char* what) -> std::string {
    return std::string(what) + ": " + std::strerror(errno);
}

/**
 * Clamp a requested soft limit to the hard limit and never loosen a
 * soft limit that is already tighter.
 */
auto effectiveSoftLimit(rlim_t requested, const struct rlimit& current)
    -> rlim_t {
    rlim_t soft = requested;
    if (current.rlim_max != RLIM_INFINITY) {
        soft = std::min(soft, current.rlim_max);
    }
    if (current.rlim_cur != RLIM_INFINITY) {
        soft = std::min(soft, current.rlim_cur);
    }
    return soft;
}

/**
 * Restores one rlimit (and optionally a signal disposition) on
 * destruction.
 */
class RlimitGuard : public ScopedLimit {
public:
    RlimitGuard(LimitKind kind, int resource, struct rlimit previous,
                long effective)
        : kind_(kind),
          resource_(resource),
          previous_(previous),
          effective_(effective) {}

    ~RlimitGuard() override {
        if (setrlimit(resource_, &previous_) != 0) {
            spdlog::error("Failed to restore {} limit: {}",
                          limitKindToString(kind_), std::strerror(errno));
        }
        if (hasSignal_) {
            if (sigaction(SIGXCPU, &previousAction_, nullptr) != 0) {
                spdlog::error("Failed to restore SIGXCPU handler: {}",
                              std::strerror(errno));
            }
        }
        spdlog::debug("Restored {} limit", limitKindToString(kind_));
    }

    void keepSignal(const struct sigaction& previous) {
        previousAction_ = previous;
        hasSignal_ = true;
    }

    [[nodiscard]] auto kind() const noexcept -> LimitKind override {
        return kind_;
    }

    [[nodiscard]] auto effectiveValue() const noexcept -> long override {
        return effective_;
    }

private:
    LimitKind kind_;
    int resource_;
    struct rlimit previous_;
    long effective_;
    struct sigaction previousAction_ {};
    bool hasSignal_{false};
};

}  // namespace

auto PosixResourceLimiter::supports(LimitKind /*kind*/) const noexcept
    -> bool {
    return true;
}

auto PosixResourceLimiter::installCpuLimit(int seconds)
    -> std::expected<std::unique_ptr<ScopedLimit>, std::string> {
    struct rlimit previous {};
    if (getrlimit(RLIMIT_CPU, &previous) != 0) {
        return std::unexpected(errnoMessage("getrlimit(RLIMIT_CPU)"));
    }

    // RLIMIT_CPU counts the whole process, so budget from what is used now
    const auto used =
        static_cast<rlim_t>(std::ceil(ResourceMonitor::getCpuSeconds()));
    const rlim_t soft =
        effectiveSoftLimit(used + static_cast<rlim_t>(seconds), previous);
    if (soft <= used) {
        return std::unexpected(
            "CPU hard limit leaves no budget for this execution");
    }

    struct sigaction action {};
    action.sa_handler = onCpuLimitSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    struct sigaction previousAction {};
    if (sigaction(SIGXCPU, &action, &previousAction) != 0) {
        return std::unexpected(errnoMessage("sigaction(SIGXCPU)"));
    }

    g_cpuLimitReached.store(false, std::memory_order_relaxed);
    struct rlimit limited = previous;
    limited.rlim_cur = soft;
    if (setrlimit(RLIMIT_CPU, &limited) != 0) {
        auto message = errnoMessage("setrlimit(RLIMIT_CPU)");
        if (sigaction(SIGXCPU, &previousAction, nullptr) != 0) {
            spdlog::error("Failed to restore SIGXCPU handler: {}",
                          std::strerror(errno));
        }
        return std::unexpected(message);
    }

    auto guard = std::make_unique<RlimitGuard>(
        LimitKind::Cpu, RLIMIT_CPU, previous, static_cast<long>(soft - used));
    guard->keepSignal(previousAction);
    spdlog::debug("CPU limit installed: soft {}s ({}s already used)", soft,
                  used);
    return guard;
}

auto PosixResourceLimiter::installMemoryLimit(int megabytes)
    -> std::expected<std::unique_ptr<ScopedLimit>, std::string> {
    struct rlimit previous {};
    if (getrlimit(RLIMIT_AS, &previous) != 0) {
        return std::unexpected(errnoMessage("getrlimit(RLIMIT_AS)"));
    }

    auto baseline = ResourceMonitor::getAddressSpaceUsage();
    if (!baseline) {
        return std::unexpected("Cannot determine current address space");
    }

    const rlim_t budget = static_cast<rlim_t>(megabytes) * 1024 * 1024;
    const rlim_t soft =
        effectiveSoftLimit(static_cast<rlim_t>(*baseline) + budget, previous);
    if (soft <= *baseline) {
        return std::unexpected(
            "Address space limit leaves no budget for this execution");
    }

    struct rlimit limited = previous;
    limited.rlim_cur = soft;
    if (setrlimit(RLIMIT_AS, &limited) != 0) {
        return std::unexpected(errnoMessage("setrlimit(RLIMIT_AS)"));
    }

    const long effectiveMb =
        static_cast<long>((soft - static_cast<rlim_t>(*baseline)) /
                          (1024 * 1024));
    spdlog::debug("Memory limit installed: {} MB above {} MB baseline",
                  effectiveMb, *baseline / (1024 * 1024));
    return std::make_unique<RlimitGuard>(LimitKind::Memory, RLIMIT_AS,
                                         previous, effectiveMb);
}

auto PosixResourceLimiter::cpuLimitReached() const noexcept -> bool {
    return g_cpuLimitReached.load(std::memory_order_relaxed);
}

}  // namespace assay::sandbox
