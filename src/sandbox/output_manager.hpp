/*
 * output_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file output_manager.hpp
 * @brief Bounded output capture and result assembly
 */

#ifndef ASSAY_SANDBOX_OUTPUT_MANAGER_HPP
#define ASSAY_SANDBOX_OUTPUT_MANAGER_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "resource_governor.hpp"
#include "types.hpp"

namespace assay::sandbox {

/**
 * @brief Length of the longest prefix of text no longer than maxBytes
 * that does not split a UTF-8 sequence
 */
[[nodiscard]] auto utf8SafePrefix(std::string_view text, size_t maxBytes)
    -> size_t;

/**
 * @brief Marker appended to truncated output
 */
[[nodiscard]] auto truncationMarker(size_t ceilingBytes, size_t originalBytes)
    -> std::string;

/**
 * @brief Cut text to ceilingBytes and append the truncation marker
 *
 * @param originalBytes size reported in the marker; defaults to
 *        text.size()
 */
[[nodiscard]] auto truncateOutput(std::string_view text, size_t ceilingBytes,
                                  std::optional<size_t> originalBytes = std::nullopt)
    -> std::string;

/**
 * @brief Append-only buffer that keeps at most a fixed number of bytes
 * while counting everything written
 */
class OutputBuffer {
public:
    explicit OutputBuffer(size_t ceilingBytes);

    void write(std::string_view text);
    void clear();

    [[nodiscard]] auto contents() const -> const std::string& { return data_; }
    [[nodiscard]] auto totalBytes() const noexcept -> size_t { return total_; }
    [[nodiscard]] auto truncated() const noexcept -> bool {
        return total_ > data_.size();
    }
    [[nodiscard]] auto ceiling() const noexcept -> size_t { return ceiling_; }

    /**
     * @brief Kept bytes, plus the marker when something was dropped
     */
    [[nodiscard]] auto render() const -> std::string;

private:
    size_t ceiling_;
    size_t total_{0};
    std::string data_;
};

enum class OutputStream { Stdout, Stderr };

/**
 * @brief stdout and stderr of one run
 *
 * Writes are serialised; the sandbox's output sink may be called from
 * any thread the script touches.
 */
class OutputCapture {
public:
    OutputCapture(size_t ceilingBytes, bool enabled);

    void write(OutputStream stream, std::string_view text);

    [[nodiscard]] auto enabled() const noexcept -> bool { return enabled_; }

    /**
     * @brief stdout, then stderr under a separator, bounded by the
     * ceiling as a whole
     */
    [[nodiscard]] auto render() const -> std::string;

    [[nodiscard]] auto totalBytes() const -> size_t;
    [[nodiscard]] auto truncated() const -> bool;

private:
    mutable std::mutex mutex_;
    size_t ceiling_;
    bool enabled_;
    OutputBuffer stdout_;
    OutputBuffer stderr_;
};

/**
 * @brief An exception that escaped the submitted code
 */
struct RaisedError {
    std::string type;
    std::string message;
    std::string traceback;
};

/**
 * @brief What the execution context hands back from a run that was not
 * stopped by a limit
 */
struct ScriptOutcome {
    std::map<std::string, std::string> variables;
    std::optional<RaisedError> raised;
    std::vector<std::string> helpers;
};

/**
 * @brief Builds ExecutionResult values for every terminal state
 */
class ResultAssembler {
public:
    /**
     * @brief Result of a governed run: completed, raised or limited
     */
    [[nodiscard]] auto assemble(const ExecutionRequest& request,
                                const GovernedRun<ScriptOutcome>& run,
                                const OutputCapture& capture,
                                std::chrono::milliseconds elapsed) const
        -> ExecutionResult;

    /**
     * @brief Result for a fault in the host (interpreter unavailable,
     * unexpected exception at the executor boundary)
     */
    [[nodiscard]] auto hostFailure(const ExecutionRequest& request,
                                   std::string message,
                                   std::chrono::milliseconds elapsed) const
        -> ExecutionResult;

private:
    static auto baseMetadata(const ExecutionRequest& request) -> json;
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_OUTPUT_MANAGER_HPP
