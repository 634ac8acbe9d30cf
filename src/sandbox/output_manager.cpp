/*
 * output_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "output_manager.hpp"

#include <spdlog/spdlog.h>

namespace assay::sandbox {

namespace {

constexpr std::string_view kStderrSeparator = "\n--- stderr ---\n";

auto isContinuationByte(unsigned char c) -> bool { return (c & 0xC0) == 0x80; }

}  // namespace

auto utf8SafePrefix(std::string_view text, size_t maxBytes) -> size_t {
    if (text.size() <= maxBytes) {
        return text.size();
    }
    size_t cut = maxBytes;
    // Back off continuation bytes so the cut lands on a sequence start
    while (cut > 0 &&
           isContinuationByte(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    return cut;
}

auto truncationMarker(size_t ceilingBytes, size_t originalBytes)
    -> std::string {
    return "\n\n... [OUTPUT TRUNCATED - exceeded " +
           std::to_string(ceilingBytes / 1024) +
           "KB limit. Original size: " + std::to_string(originalBytes / 1024) +
           "KB (" + std::to_string(originalBytes) + " bytes)]";
}

auto truncateOutput(std::string_view text, size_t ceilingBytes,
                    std::optional<size_t> originalBytes) -> std::string {
    const size_t original = originalBytes.value_or(text.size());
    if (text.size() <= ceilingBytes && original <= ceilingBytes) {
        return std::string(text);
    }
    std::string out(text.substr(0, utf8SafePrefix(text, ceilingBytes)));
    out += truncationMarker(ceilingBytes, original);
    return out;
}

OutputBuffer::OutputBuffer(size_t ceilingBytes) : ceiling_(ceilingBytes) {}

void OutputBuffer::write(std::string_view text) {
    total_ += text.size();
    if (data_.size() >= ceiling_) {
        return;
    }
    const size_t room = ceiling_ - data_.size();
    if (text.size() <= room) {
        data_.append(text);
        return;
    }
    data_.append(text.substr(0, utf8SafePrefix(text, room)));
}

void OutputBuffer::clear() {
    total_ = 0;
    data_.clear();
}

auto OutputBuffer::render() const -> std::string {
    if (!truncated()) {
        return data_;
    }
    return data_ + truncationMarker(ceiling_, total_);
}

OutputCapture::OutputCapture(size_t ceilingBytes, bool enabled)
    : ceiling_(ceilingBytes),
      enabled_(enabled),
      stdout_(ceilingBytes),
      stderr_(ceilingBytes) {}

void OutputCapture::write(OutputStream stream, std::string_view text) {
    if (!enabled_) {
        return;
    }
    std::lock_guard lock(mutex_);
    if (stream == OutputStream::Stdout) {
        stdout_.write(text);
    } else {
        stderr_.write(text);
    }
}

auto OutputCapture::render() const -> std::string {
    std::lock_guard lock(mutex_);
    if (stderr_.totalBytes() == 0) {
        return stdout_.render();
    }
    std::string combined = stdout_.contents();
    combined += kStderrSeparator;
    combined += stderr_.contents();
    const size_t original =
        stdout_.totalBytes() + kStderrSeparator.size() + stderr_.totalBytes();
    return truncateOutput(combined, ceiling_, original);
}

auto OutputCapture::totalBytes() const -> size_t {
    std::lock_guard lock(mutex_);
    return stdout_.totalBytes() + stderr_.totalBytes();
}

auto OutputCapture::truncated() const -> bool {
    std::lock_guard lock(mutex_);
    size_t kept = stdout_.contents().size() + stderr_.contents().size();
    if (stderr_.totalBytes() > 0) {
        kept += kStderrSeparator.size();
    }
    return stdout_.truncated() || stderr_.truncated() || kept > ceiling_;
}

auto ResultAssembler::baseMetadata(const ExecutionRequest& request) -> json {
    json metadata;
    metadata["limits"] = request.limits.toJson();
    metadata["adjusted_limits"] = request.adjustedLimits;
    return metadata;
}

auto ResultAssembler::assemble(const ExecutionRequest& request,
                               const GovernedRun<ScriptOutcome>& run,
                               const OutputCapture& capture,
                               std::chrono::milliseconds elapsed) const
    -> ExecutionResult {
    ExecutionResult result;
    result.executionTime = elapsed;
    result.output = capture.render();

    result.metadata = baseMetadata(request);
    result.metadata["enforced_limits"] = run.enforcement.toJson();
    result.metadata["resource_usage"] = run.usage.toJson();
    result.metadata["output_bytes"] = capture.totalBytes();
    result.metadata["output_truncated"] = capture.truncated();

    if (!run.outcome) {
        const auto& violation = run.outcome.error();
        ErrorInfo error;
        error.kind = limitKindToErrorKind(violation.kind);
        error.message = violation.message;
        error.limit = violation.configuredLimit;
        error.limitUnit = std::string(limitUnit(violation.kind));
        error.hints = violation.hints;
        result.success = false;
        result.error = std::move(error);
        return result;
    }

    const auto& outcome = *run.outcome;
    result.variables = outcome.variables;
    result.metadata["helpers"] = outcome.helpers;

    if (outcome.raised) {
        const auto& raised = *outcome.raised;
        ErrorInfo error;
        error.kind = ErrorKind::UnhandledRuntimeFailure;
        error.message = raised.message.empty()
                            ? raised.type
                            : raised.type + ": " + raised.message;
        error.hints = hintsFor(ErrorKind::UnhandledRuntimeFailure);
        result.success = false;
        result.error = std::move(error);
        result.traceback = raised.traceback;
        return result;
    }

    result.success = true;
    return result;
}

auto ResultAssembler::hostFailure(const ExecutionRequest& request,
                                  std::string message,
                                  std::chrono::milliseconds elapsed) const
    -> ExecutionResult {
    spdlog::error("Sandbox host failure: {}", message);
    ExecutionResult result;
    result.success = false;
    result.executionTime = elapsed;
    result.metadata = baseMetadata(request);
    ErrorInfo error;
    error.kind = ErrorKind::UnhandledRuntimeFailure;
    error.message = std::move(message);
    error.hints = hintsFor(ErrorKind::UnhandledRuntimeFailure);
    result.error = std::move(error);
    return result;
}

}  // namespace assay::sandbox
