/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Sandbox request, result and error type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef ASSAY_SANDBOX_TYPES_HPP
#define ASSAY_SANDBOX_TYPES_HPP

#include "atom/type/json.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace assay::config {
struct SandboxConfig;
}

namespace assay::sandbox {

using json = nlohmann::json;

/**
 * @brief Error taxonomy reported to the caller
 */
enum class ErrorKind {
    SecurityViolation,
    TimeoutExceeded,
    MemoryLimitExceeded,
    CpuLimitExceeded,
    RecursionLimitExceeded,
    ToolCallFailure,
    UnhandledRuntimeFailure,
    InvalidRequest
};

[[nodiscard]] constexpr std::string_view errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SecurityViolation: return "SecurityViolation";
        case ErrorKind::TimeoutExceeded: return "TimeoutExceeded";
        case ErrorKind::MemoryLimitExceeded: return "MemoryLimitExceeded";
        case ErrorKind::CpuLimitExceeded: return "CpuLimitExceeded";
        case ErrorKind::RecursionLimitExceeded: return "RecursionLimitExceeded";
        case ErrorKind::ToolCallFailure: return "ToolCallFailure";
        case ErrorKind::UnhandledRuntimeFailure: return "UnhandledRuntimeFailure";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
    }
    return "UnhandledRuntimeFailure";
}

/**
 * @brief Inverse of errorKindToString; unknown names map to
 * UnhandledRuntimeFailure
 */
[[nodiscard]] auto errorKindFromString(std::string_view name) -> ErrorKind;

/**
 * @brief The four governed limits
 */
enum class LimitKind { Timeout, Memory, Cpu, Recursion };

[[nodiscard]] constexpr std::string_view limitKindToString(LimitKind kind) noexcept {
    switch (kind) {
        case LimitKind::Timeout: return "timeout";
        case LimitKind::Memory: return "memory";
        case LimitKind::Cpu: return "cpu";
        case LimitKind::Recursion: return "recursion";
    }
    return "unknown";
}

[[nodiscard]] constexpr ErrorKind limitKindToErrorKind(LimitKind kind) noexcept {
    switch (kind) {
        case LimitKind::Timeout: return ErrorKind::TimeoutExceeded;
        case LimitKind::Memory: return ErrorKind::MemoryLimitExceeded;
        case LimitKind::Cpu: return ErrorKind::CpuLimitExceeded;
        case LimitKind::Recursion: return ErrorKind::RecursionLimitExceeded;
    }
    return ErrorKind::UnhandledRuntimeFailure;
}

/**
 * @brief Accepted bounds for request limits
 */
namespace bounds {
inline constexpr int kMinTimeoutSeconds = 1;
inline constexpr int kMaxTimeoutSeconds = 300;
inline constexpr int kMinMemoryMb = 64;
inline constexpr int kMaxMemoryMb = 2048;
inline constexpr int kMinCpuSeconds = 1;
inline constexpr int kMaxCpuSeconds = 300;
inline constexpr int kMinRecursionDepth = 50;
inline constexpr int kMaxRecursionDepth = 500;
}  // namespace bounds

/**
 * @brief Per-run resource limits
 */
struct ResourceLimits {
    int timeoutSeconds{30};
    int memoryLimitMb{512};
    int cpuLimitSeconds{60};
    int maxRecursionDepth{100};

    /**
     * @brief Configured value of one limit in its own unit
     */
    [[nodiscard]] auto valueOf(LimitKind kind) const noexcept -> int;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Unit a limit is expressed in ("seconds", "MB", "frames")
 */
[[nodiscard]] auto limitUnit(LimitKind kind) -> std::string_view;

/**
 * @brief Optional pre-fetch bound into the namespace before the run
 */
struct DataQuery {
    std::string source;
    json filters = json::object();
    std::vector<std::string> fields;
    int limit{100};

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Why a request could not be accepted at all
 */
struct RequestError {
    std::string field;
    std::string message;
};

/**
 * @brief A code-execution request
 *
 * Numeric limits outside their bounds are clamped rather than refused;
 * the fields that were moved are listed in adjustedLimits.
 */
struct ExecutionRequest {
    std::string code;
    ResourceLimits limits;
    bool captureOutput{true};
    std::vector<std::string> returnVariables;
    std::optional<DataQuery> dataQuery;

    std::vector<std::string> adjustedLimits;

    /**
     * @brief Clamp every limit into its bounds, recording adjustments
     */
    void clampLimits();

    /**
     * @brief Build a request from tool arguments
     *
     * Missing limits take the configured defaults.
     */
    [[nodiscard]] static auto fromJson(const json& args,
                                       const config::SandboxConfig& config)
        -> std::expected<ExecutionRequest, RequestError>;
};

/**
 * @brief Error part of an execution result
 */
struct ErrorInfo {
    ErrorKind kind{ErrorKind::UnhandledRuntimeFailure};
    std::string message;
    std::optional<int> limit;  ///< Configured limit for governed kinds
    std::string limitUnit;
    std::vector<std::string> hints;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Resources consumed by one governed run
 */
struct ResourceUsage {
    std::chrono::milliseconds wallTime{0};
    double cpuSeconds{0.0};
    size_t peakMemoryKb{0};

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Result of one sandbox execution
 */
struct ExecutionResult {
    bool success{false};
    std::string output;
    std::map<std::string, std::string> variables;
    std::optional<ErrorInfo> error;
    std::optional<std::string> traceback;
    std::chrono::milliseconds executionTime{0};
    json metadata = json::object();

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Rebuild a result from toJson() output
     *
     * @throws json::exception if required fields are missing or mistyped
     */
    [[nodiscard]] static auto fromJson(const json& j) -> ExecutionResult;
};

/**
 * @brief Pre-execution rejection produced by the security scanner
 */
struct SecurityViolation {
    std::string matchedPattern;
    std::string category;
    std::string message;
    int line{0};
    std::vector<std::string> hints;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Actionable hints for an error kind
 */
[[nodiscard]] auto hintsFor(ErrorKind kind, std::optional<int> limit = std::nullopt)
    -> std::vector<std::string>;

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_TYPES_HPP
