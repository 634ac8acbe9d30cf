/*
 * sandbox_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Sandbox execution configuration

**************************************************/

#ifndef ASSAY_CONFIG_SECTIONS_SANDBOX_CONFIG_HPP
#define ASSAY_CONFIG_SECTIONS_SANDBOX_CONFIG_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "../core/config_section.hpp"

namespace assay::config {

/**
 * @brief Which resource limiter backs the governor
 */
enum class LimiterMode {
    Auto,          ///< Full POSIX limits where the platform supports them
    RecursionOnly  ///< Only the interpreter recursion ceiling
};

[[nodiscard]] inline std::string limiterModeToString(LimiterMode mode) {
    switch (mode) {
        case LimiterMode::Auto: return "auto";
        case LimiterMode::RecursionOnly: return "recursion-only";
    }
    return "auto";
}

[[nodiscard]] inline LimiterMode limiterModeFromString(const std::string& str) {
    if (str == "recursion-only") return LimiterMode::RecursionOnly;
    return LimiterMode::Auto;
}

/**
 * @brief Where a run executes
 */
enum class IsolationMode {
    Process,  ///< A forked child per run, killed at its deadline
    Inline    ///< The calling process, interrupted cooperatively
};

[[nodiscard]] inline std::string isolationModeToString(IsolationMode mode) {
    switch (mode) {
        case IsolationMode::Process: return "process";
        case IsolationMode::Inline: return "inline";
    }
    return "process";
}

[[nodiscard]] inline IsolationMode isolationModeFromString(
    const std::string& str) {
    if (str == "inline") return IsolationMode::Inline;
    return IsolationMode::Process;
}

/**
 * @brief Sandbox configuration
 *
 * Default limits apply to requests that leave a field unset; the
 * ceilings bound what a run may hand back to the caller.
 */
struct SandboxConfig : ConfigSection<SandboxConfig> {
    static constexpr std::string_view PATH = "/assay/sandbox";

    // Default limits
    int defaultTimeoutSeconds{30};
    int defaultMemoryLimitMb{512};
    int defaultCpuLimitSeconds{60};
    int defaultMaxRecursionDepth{100};

    // Result ceilings
    size_t outputCeilingBytes{1024 * 1024};
    size_t variableCeilingBytes{64 * 1024};
    size_t auditSnippetChars{500};

    // Tool bridge
    int reportWaitSeconds{10};
    int reportPollIntervalMs{250};
    size_t maxQueryRows{1000};

    // Execution environment
    std::vector<std::string> allowedModules{
        "math",      "statistics", "decimal", "fractions", "random",
        "json",      "datetime",   "re",      "collections", "itertools",
        "functools", "operator",   "string",  "textwrap",  "time",
        "calendar",  "bisect",     "heapq",   "copy",      "numbers",
        "numpy",     "pandas",     "matplotlib"};
    bool enableDataHelpers{true};    ///< Bind np/pd/plt when installed
    std::string denyPatternsPath;    ///< Extra scanner rules (JSON)
    std::string limiter{"auto"};     ///< "auto" or "recursion-only"
    std::string isolation{"process"};  ///< "process" or "inline"
    int killGraceSeconds{2};  ///< Past a deadline before the child is killed

    [[nodiscard]] json serialize() const {
        return {{"defaultTimeoutSeconds", defaultTimeoutSeconds},
                {"defaultMemoryLimitMb", defaultMemoryLimitMb},
                {"defaultCpuLimitSeconds", defaultCpuLimitSeconds},
                {"defaultMaxRecursionDepth", defaultMaxRecursionDepth},
                {"outputCeilingBytes", outputCeilingBytes},
                {"variableCeilingBytes", variableCeilingBytes},
                {"auditSnippetChars", auditSnippetChars},
                {"reportWaitSeconds", reportWaitSeconds},
                {"reportPollIntervalMs", reportPollIntervalMs},
                {"maxQueryRows", maxQueryRows},
                {"allowedModules", allowedModules},
                {"enableDataHelpers", enableDataHelpers},
                {"denyPatternsPath", denyPatternsPath},
                {"limiter", limiter},
                {"isolation", isolation},
                {"killGraceSeconds", killGraceSeconds}};
    }

    [[nodiscard]] static SandboxConfig deserialize(const json& j);

    [[nodiscard]] static json generateSchema();

    /**
     * @brief Load the section from a JSON file.
     *
     * The file may hold the section itself or a document with the
     * section nested under "assay" / "sandbox".
     *
     * @throws ConfigIOException if the file cannot be read
     * @throws InvalidConfigException if it is not valid JSON or holds
     *         out-of-range values
     */
    [[nodiscard]] static SandboxConfig loadFromFile(
        const std::filesystem::path& path);

    [[nodiscard]] LimiterMode limiterMode() const {
        return limiterModeFromString(limiter);
    }

    [[nodiscard]] IsolationMode isolationMode() const {
        return isolationModeFromString(isolation);
    }

    /**
     * @brief Reject values the sandbox cannot run with
     * @throws InvalidConfigException
     */
    void validate() const;
};

}  // namespace assay::config

#endif  // ASSAY_CONFIG_SECTIONS_SANDBOX_CONFIG_HPP
