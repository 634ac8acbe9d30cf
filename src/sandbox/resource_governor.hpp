/*
 * resource_governor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file resource_governor.hpp
 * @brief Installs per-run limits around a callable and restores them
 *
 * Limits are scoped guards installed in a fixed order (recursion,
 * wall-clock watchdog, CPU, memory) and released in reverse order on
 * every exit path. Inside the governed region a limit surfaces as a
 * LimitExceeded exception (or std::bad_alloc); run() converts either to
 * a tagged LimitViolation so callers never see them.
 */

#ifndef ASSAY_SANDBOX_RESOURCE_GOVERNOR_HPP
#define ASSAY_SANDBOX_RESOURCE_GOVERNOR_HPP

#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "atom/error/exception.hpp"

#include "resource_limiter.hpp"
#include "types.hpp"

namespace assay::sandbox {

/**
 * @brief Raised inside a governed region when a limit is hit
 */
class LimitExceeded : public atom::error::Exception {
public:
    template <typename... Args>
    LimitExceeded(LimitKind kind, const char* file, int line, const char* func,
                  Args&&... args)
        : atom::error::Exception(file, line, func, std::forward<Args>(args)...),
          kind_(kind) {}

    [[nodiscard]] auto kind() const noexcept -> LimitKind { return kind_; }

private:
    LimitKind kind_;
};

#define THROW_LIMIT_EXCEEDED(kind, ...)                                     \
    throw assay::sandbox::LimitExceeded(kind, ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Interpreter operations the governor needs
 *
 * interrupt() is called from the watchdog thread and must be safe to
 * call concurrently with the governed callable. withInterpreterReleased()
 * runs a blocking action while the calling thread gives up any
 * interpreter lock it holds.
 */
struct InterpreterHooks {
    std::function<int()> recursionLimit;
    std::function<void(int)> setRecursionLimit;
    std::function<void(LimitKind)> interrupt;
    std::function<void(const std::function<void()>&)> withInterpreterReleased;
};

/**
 * @brief A limit that stopped the run
 */
struct LimitViolation {
    LimitKind kind{LimitKind::Timeout};
    int configuredLimit{0};
    std::string message;
    std::vector<std::string> hints;
};

/**
 * @brief The violation reported when a limit stops a run
 */
[[nodiscard]] auto makeViolation(LimitKind kind, const ResourceLimits& limits)
    -> LimitViolation;

/**
 * @brief Which limits were actually in force for a run
 */
struct EnforcementReport {
    std::string limiter;
    std::vector<LimitKind> enforced;
    std::vector<std::pair<LimitKind, std::string>> skipped;

    [[nodiscard]] auto isEnforced(LimitKind kind) const -> bool;
    [[nodiscard]] auto toJson() const -> json;
};

template <typename T>
struct GovernedRun {
    std::expected<T, LimitViolation> outcome;
    EnforcementReport enforcement;
    ResourceUsage usage;
};

/**
 * @brief One governed run's installed limits (non-template part)
 */
class GovernedSession {
public:
    GovernedSession(ResourceLimiter& limiter, const ResourceLimits& limits,
                    const InterpreterHooks& hooks);
    ~GovernedSession();

    GovernedSession(const GovernedSession&) = delete;
    GovernedSession& operator=(const GovernedSession&) = delete;

    /**
     * @brief Stop the watchdog and restore every limit, newest first
     */
    void finish();

    /**
     * @brief Limit the watchdog acted on, if any
     */
    [[nodiscard]] auto firedLimit() const -> std::optional<LimitKind>;

    [[nodiscard]] auto violation(LimitKind kind, std::string detail) const
        -> LimitViolation;

    [[nodiscard]] auto enforcement() const -> const EnforcementReport&;
    [[nodiscard]] auto usage() const -> ResourceUsage;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

class ResourceGovernor {
public:
    explicit ResourceGovernor(std::shared_ptr<ResourceLimiter> limiter);

    /**
     * @brief Run fn under the given limits
     *
     * Governed runs are serialised process-wide: rlimits and the
     * interpreter recursion limit are process state.
     */
    template <typename Fn>
    auto run(const ResourceLimits& limits, const InterpreterHooks& hooks,
             Fn&& fn) -> GovernedRun<std::invoke_result_t<Fn&>> {
        using Result = std::invoke_result_t<Fn&>;

        std::unique_lock lock(runMutex());
        GovernedSession session(*limiter_, limits, hooks);

        auto outcome = [&]() -> std::expected<Result, LimitViolation> {
            try {
                auto value = fn();
                if (auto fired = session.firedLimit()) {
                    return std::unexpected(session.violation(
                        *fired, "limit reached while the run was finishing"));
                }
                return value;
            } catch (const LimitExceeded& e) {
                return std::unexpected(session.violation(e.kind(), e.what()));
            } catch (const std::bad_alloc&) {
                return std::unexpected(session.violation(
                    LimitKind::Memory, "allocation failed under the memory limit"));
            }
        }();

        session.finish();
        return GovernedRun<Result>{std::move(outcome), session.enforcement(),
                                   session.usage()};
    }

    [[nodiscard]] auto limiter() const -> const ResourceLimiter& {
        return *limiter_;
    }

private:
    static auto runMutex() -> std::mutex&;

    std::shared_ptr<ResourceLimiter> limiter_;
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_RESOURCE_GOVERNOR_HPP
