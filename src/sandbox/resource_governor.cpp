/*
 * resource_governor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_governor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <stop_token>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "resource_monitor.hpp"

namespace assay::sandbox {

using namespace std::chrono_literals;

namespace {

constexpr int kRecursionHeadroom = 50;
constexpr auto kWatchdogTick = 50ms;
constexpr auto kInterruptRepost = 100ms;
constexpr int kNoLimit = -1;

/**
 * Lowers the interpreter recursion limit and puts the previous one back.
 */
class RecursionGuard : public ScopedLimit {
public:
    RecursionGuard(const InterpreterHooks& hooks, int depth)
        : hooks_(hooks), previous_(hooks.recursionLimit()) {
        hooks_.setRecursionLimit(depth + kRecursionHeadroom);
        effective_ = depth;
    }

    ~RecursionGuard() override {
        try {
            hooks_.setRecursionLimit(previous_);
        } catch (const std::exception& e) {
            spdlog::error("Failed to restore recursion limit {}: {}",
                          previous_, e.what());
        }
    }

    [[nodiscard]] auto kind() const noexcept -> LimitKind override {
        return LimitKind::Recursion;
    }

    [[nodiscard]] auto effectiveValue() const noexcept -> long override {
        return effective_;
    }

private:
    const InterpreterHooks& hooks_;
    int previous_;
    long effective_{0};
};

/**
 * Wall-clock and CPU watchdog. Polls the deadline and the limiter's CPU
 * flag; once a limit trips it keeps asking the interpreter to unwind
 * until the run ends.
 */
class Watchdog : public ScopedLimit {
public:
    Watchdog(const InterpreterHooks& hooks, const ResourceLimiter& limiter,
             std::optional<std::chrono::seconds> timeout,
             std::atomic<int>& fired)
        : hooks_(hooks), limiter_(limiter), timeout_(timeout), fired_(fired) {
        const auto deadline =
            timeout ? std::chrono::steady_clock::now() + *timeout
                    : std::chrono::steady_clock::time_point::max();
        thread_ = std::jthread(
            [this, deadline](std::stop_token stop) { loop(stop, deadline); });
    }

    ~Watchdog() override {
        thread_.request_stop();
        wake_.notify_all();
        auto join = [this] {
            if (thread_.joinable()) {
                thread_.join();
            }
        };
        try {
            if (hooks_.withInterpreterReleased) {
                hooks_.withInterpreterReleased(join);
            } else {
                join();
            }
        } catch (const std::exception& e) {
            spdlog::error("Watchdog shutdown failed: {}", e.what());
        }
    }

    [[nodiscard]] auto kind() const noexcept -> LimitKind override {
        return LimitKind::Timeout;
    }

    [[nodiscard]] auto effectiveValue() const noexcept -> long override {
        return timeout_ ? static_cast<long>(timeout_->count()) : 0;
    }

private:
    void loop(std::stop_token stop,
              std::chrono::steady_clock::time_point deadline) {
        std::optional<LimitKind> tripped;
        auto lastPost = std::chrono::steady_clock::time_point::min();
        while (!stop.stop_requested()) {
            {
                std::unique_lock lock(mutex_);
                wake_.wait_for(lock, stop, kWatchdogTick,
                               [] { return false; });
            }
            if (stop.stop_requested()) {
                break;
            }

            const auto now = std::chrono::steady_clock::now();
            if (!tripped) {
                if (limiter_.cpuLimitReached()) {
                    tripped = LimitKind::Cpu;
                } else if (now >= deadline) {
                    tripped = LimitKind::Timeout;
                }
                if (tripped) {
                    fired_.store(static_cast<int>(*tripped));
                    spdlog::warn("Watchdog: {} limit reached, interrupting",
                                 limitKindToString(*tripped));
                }
            }
            if (tripped && now - lastPost >= kInterruptRepost) {
                lastPost = now;
                try {
                    hooks_.interrupt(*tripped);
                } catch (const std::exception& e) {
                    spdlog::error("Watchdog interrupt failed: {}", e.what());
                }
            }
        }
    }

    const InterpreterHooks& hooks_;
    const ResourceLimiter& limiter_;
    std::optional<std::chrono::seconds> timeout_;
    std::atomic<int>& fired_;
    std::mutex mutex_;
    std::condition_variable_any wake_;
    std::jthread thread_;
};

auto violationMessage(LimitKind kind, int limit) -> std::string {
    switch (kind) {
        case LimitKind::Timeout:
            return "Code execution timed out after " + std::to_string(limit) +
                   " seconds. The code took too long to execute and was "
                   "terminated to prevent system resource exhaustion.";
        case LimitKind::Memory:
            return "Memory limit of " + std::to_string(limit) +
                   " MB exceeded. The code tried to allocate more memory than "
                   "allowed.";
        case LimitKind::Cpu:
            return "CPU time limit of " + std::to_string(limit) +
                   " seconds exceeded.";
        case LimitKind::Recursion:
            return "Maximum recursion depth of " + std::to_string(limit) +
                   " exceeded.";
    }
    return "Resource limit exceeded.";
}

}  // namespace

auto makeViolation(LimitKind kind, const ResourceLimits& limits)
    -> LimitViolation {
    LimitViolation v;
    v.kind = kind;
    v.configuredLimit = limits.valueOf(kind);
    v.message = violationMessage(kind, v.configuredLimit);
    v.hints = hintsFor(limitKindToErrorKind(kind), v.configuredLimit);
    return v;
}

auto EnforcementReport::isEnforced(LimitKind kind) const -> bool {
    return std::find(enforced.begin(), enforced.end(), kind) != enforced.end();
}

auto EnforcementReport::toJson() const -> json {
    json enforcedNames = json::array();
    for (auto kind : enforced) {
        enforcedNames.push_back(limitKindToString(kind));
    }
    json skippedReasons = json::object();
    for (const auto& [kind, reason] : skipped) {
        skippedReasons[std::string(limitKindToString(kind))] = reason;
    }
    return {{"limiter", limiter},
            {"enforced", enforcedNames},
            {"skipped", skippedReasons}};
}

class GovernedSession::Impl {
public:
    Impl(ResourceLimiter& limiter, const ResourceLimits& limits,
         const InterpreterHooks& hooks)
        : limiter_(limiter),
          limits_(limits),
          hooks_(hooks),
          start_(std::chrono::steady_clock::now()),
          cpuStart_(ResourceMonitor::getCpuSeconds()) {
        report_.limiter = std::string(limiter.name());
        try {
            installRecursion();
            installWatchdog();
            installCpu();
            installMemory();
        } catch (...) {
            releaseAll();
            throw;
        }
    }

    ~Impl() { finish(); }

    void finish() {
        if (finished_) {
            return;
        }
        end_ = std::chrono::steady_clock::now();
        cpuEnd_ = ResourceMonitor::getCpuSeconds();
        releaseAll();
        finished_ = true;
    }

    [[nodiscard]] auto firedLimit() const -> std::optional<LimitKind> {
        int value = fired_.load();
        if (value == kNoLimit) {
            return std::nullopt;
        }
        return static_cast<LimitKind>(value);
    }

    [[nodiscard]] auto violation(LimitKind kind, std::string detail) const
        -> LimitViolation {
        LimitViolation v = makeViolation(kind, limits_);
        spdlog::warn("Governed run stopped by {} limit ({} {}): {}",
                     limitKindToString(kind), v.configuredLimit,
                     limitUnit(kind), detail);
        return v;
    }

    [[nodiscard]] auto enforcement() const -> const EnforcementReport& {
        return report_;
    }

    [[nodiscard]] auto usage() const -> ResourceUsage {
        ResourceUsage u;
        const auto end = finished_ ? end_ : std::chrono::steady_clock::now();
        u.wallTime =
            std::chrono::duration_cast<std::chrono::milliseconds>(end - start_);
        u.cpuSeconds = std::max(
            0.0, (finished_ ? cpuEnd_ : ResourceMonitor::getCpuSeconds()) -
                     cpuStart_);
        u.peakMemoryKb = ResourceMonitor::getPeakMemoryUsage().value_or(0) / 1024;
        return u;
    }

private:
    void skip(LimitKind kind, std::string reason) {
        spdlog::warn("{} limit not enforced: {}", limitKindToString(kind),
                     reason);
        report_.skipped.emplace_back(kind, std::move(reason));
    }

    void installRecursion() {
        if (!limiter_.supports(LimitKind::Recursion)) {
            skip(LimitKind::Recursion, "not supported by limiter");
            return;
        }
        if (!hooks_.recursionLimit || !hooks_.setRecursionLimit) {
            skip(LimitKind::Recursion, "no interpreter hooks");
            return;
        }
        try {
            guards_.push_back(
                std::make_unique<RecursionGuard>(hooks_, limits_.maxRecursionDepth));
            report_.enforced.push_back(LimitKind::Recursion);
        } catch (const std::exception& e) {
            skip(LimitKind::Recursion, e.what());
        }
    }

    void installWatchdog() {
        const bool timeout = limiter_.supports(LimitKind::Timeout);
        const bool cpu = limiter_.supports(LimitKind::Cpu);
        if (!hooks_.interrupt) {
            if (timeout) {
                skip(LimitKind::Timeout, "no interpreter interrupt hook");
            }
            return;
        }
        if (!timeout && !cpu) {
            skip(LimitKind::Timeout, "not supported by limiter");
            return;
        }
        try {
            std::optional<std::chrono::seconds> deadline;
            if (timeout) {
                deadline = std::chrono::seconds(limits_.timeoutSeconds);
            }
            guards_.push_back(
                std::make_unique<Watchdog>(hooks_, limiter_, deadline, fired_));
            if (timeout) {
                report_.enforced.push_back(LimitKind::Timeout);
            } else {
                skip(LimitKind::Timeout, "not supported by limiter");
            }
            watchdogRunning_ = true;
        } catch (const std::system_error& e) {
            skip(LimitKind::Timeout, std::string("watchdog: ") + e.what());
        }
    }

    void installCpu() {
        if (!limiter_.supports(LimitKind::Cpu)) {
            skip(LimitKind::Cpu, "not supported by limiter");
            return;
        }
        if (!watchdogRunning_) {
            skip(LimitKind::Cpu, "no watchdog to deliver the interrupt");
            return;
        }
        auto guard = limiter_.installCpuLimit(limits_.cpuLimitSeconds);
        if (!guard) {
            skip(LimitKind::Cpu, guard.error());
            return;
        }
        guards_.push_back(std::move(*guard));
        report_.enforced.push_back(LimitKind::Cpu);
    }

    void installMemory() {
        if (!limiter_.supports(LimitKind::Memory)) {
            skip(LimitKind::Memory, "not supported by limiter");
            return;
        }
        auto guard = limiter_.installMemoryLimit(limits_.memoryLimitMb);
        if (!guard) {
            skip(LimitKind::Memory, guard.error());
            return;
        }
        guards_.push_back(std::move(*guard));
        report_.enforced.push_back(LimitKind::Memory);
    }

    void releaseAll() {
        while (!guards_.empty()) {
            guards_.pop_back();
        }
    }

    ResourceLimiter& limiter_;
    ResourceLimits limits_;
    const InterpreterHooks& hooks_;
    EnforcementReport report_;
    std::vector<std::unique_ptr<ScopedLimit>> guards_;
    std::atomic<int> fired_{kNoLimit};
    bool watchdogRunning_{false};
    bool finished_{false};
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
    double cpuStart_;
    double cpuEnd_{0.0};
};

GovernedSession::GovernedSession(ResourceLimiter& limiter,
                                 const ResourceLimits& limits,
                                 const InterpreterHooks& hooks)
    : impl_(std::make_unique<Impl>(limiter, limits, hooks)) {}

GovernedSession::~GovernedSession() = default;

void GovernedSession::finish() { impl_->finish(); }

auto GovernedSession::firedLimit() const -> std::optional<LimitKind> {
    return impl_->firedLimit();
}

auto GovernedSession::violation(LimitKind kind, std::string detail) const
    -> LimitViolation {
    return impl_->violation(kind, std::move(detail));
}

auto GovernedSession::enforcement() const -> const EnforcementReport& {
    return impl_->enforcement();
}

auto GovernedSession::usage() const -> ResourceUsage { return impl_->usage(); }

ResourceGovernor::ResourceGovernor(std::shared_ptr<ResourceLimiter> limiter)
    : limiter_(std::move(limiter)) {}

auto ResourceGovernor::runMutex() -> std::mutex& {
    static std::mutex mutex;
    return mutex;
}

}  // namespace assay::sandbox
