/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "config/sections/sandbox_config.hpp"
#include "tools/descriptor.hpp"

namespace assay::sandbox {

auto ResourceLimits::valueOf(LimitKind kind) const noexcept -> int {
    switch (kind) {
        case LimitKind::Timeout: return timeoutSeconds;
        case LimitKind::Memory: return memoryLimitMb;
        case LimitKind::Cpu: return cpuLimitSeconds;
        case LimitKind::Recursion: return maxRecursionDepth;
    }
    return 0;
}

auto ResourceLimits::toJson() const -> json {
    return {{"timeout_seconds", timeoutSeconds},
            {"memory_limit_mb", memoryLimitMb},
            {"cpu_limit_seconds", cpuLimitSeconds},
            {"max_recursion_depth", maxRecursionDepth}};
}

auto errorKindFromString(std::string_view name) -> ErrorKind {
    for (auto kind :
         {ErrorKind::SecurityViolation, ErrorKind::TimeoutExceeded,
          ErrorKind::MemoryLimitExceeded, ErrorKind::CpuLimitExceeded,
          ErrorKind::RecursionLimitExceeded, ErrorKind::ToolCallFailure,
          ErrorKind::UnhandledRuntimeFailure, ErrorKind::InvalidRequest}) {
        if (errorKindToString(kind) == name) {
            return kind;
        }
    }
    return ErrorKind::UnhandledRuntimeFailure;
}

auto limitUnit(LimitKind kind) -> std::string_view {
    switch (kind) {
        case LimitKind::Timeout:
        case LimitKind::Cpu: return "seconds";
        case LimitKind::Memory: return "MB";
        case LimitKind::Recursion: return "frames";
    }
    return "";
}

auto DataQuery::toJson() const -> json {
    return {{"source", source},
            {"filters", filters},
            {"fields", fields},
            {"limit", limit}};
}

namespace {

void clampField(int& value, int lo, int hi, std::string_view name,
                std::vector<std::string>& adjusted) {
    int clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        spdlog::debug("Clamped {} from {} to {}", name, value, clamped);
        adjusted.emplace_back(name);
        value = clamped;
    }
}

template <typename T>
auto readField(const json& args, const char* key, T fallback)
    -> std::expected<T, RequestError> {
    if (!args.contains(key) || args[key].is_null()) {
        return fallback;
    }
    try {
        return args[key].get<T>();
    } catch (const json::exception& e) {
        return std::unexpected(
            RequestError{key, std::string("invalid value: ") + e.what()});
    }
}

auto readInteger(const json& args, const char* key, int fallback)
    -> std::expected<int, RequestError> {
    if (!args.contains(key) || args[key].is_null()) {
        return fallback;
    }
    auto value = tools::integerValue(args[key]);
    if (!value) {
        return std::unexpected(RequestError{key, value.error()});
    }
    return *value;
}

}  // namespace

void ExecutionRequest::clampLimits() {
    clampField(limits.timeoutSeconds, bounds::kMinTimeoutSeconds,
               bounds::kMaxTimeoutSeconds, "timeout_seconds", adjustedLimits);
    clampField(limits.memoryLimitMb, bounds::kMinMemoryMb, bounds::kMaxMemoryMb,
               "memory_limit_mb", adjustedLimits);
    clampField(limits.cpuLimitSeconds, bounds::kMinCpuSeconds,
               bounds::kMaxCpuSeconds, "cpu_limit_seconds", adjustedLimits);
    clampField(limits.maxRecursionDepth, bounds::kMinRecursionDepth,
               bounds::kMaxRecursionDepth, "max_recursion_depth",
               adjustedLimits);
}

auto ExecutionRequest::fromJson(const json& args,
                                const config::SandboxConfig& config)
    -> std::expected<ExecutionRequest, RequestError> {
    if (!args.is_object()) {
        return std::unexpected(
            RequestError{"", "arguments must be a JSON object"});
    }

    ExecutionRequest request;

    auto code = readField<std::string>(args, "code", "");
    if (!code) {
        return std::unexpected(code.error());
    }
    if (code->empty()) {
        return std::unexpected(RequestError{"code", "code must not be empty"});
    }
    request.code = std::move(*code);

    auto timeout = readInteger(args, "timeout_seconds",
                               config.defaultTimeoutSeconds);
    auto memory =
        readInteger(args, "memory_limit_mb", config.defaultMemoryLimitMb);
    auto cpu = readInteger(args, "cpu_limit_seconds",
                           config.defaultCpuLimitSeconds);
    auto depth = readInteger(args, "max_recursion_depth",
                             config.defaultMaxRecursionDepth);
    auto capture = readField<bool>(args, "capture_output", true);
    for (const auto* field : {&timeout, &memory, &cpu, &depth}) {
        if (!*field) {
            return std::unexpected(field->error());
        }
    }
    if (!capture) {
        return std::unexpected(capture.error());
    }
    request.limits = {*timeout, *memory, *cpu, *depth};
    request.captureOutput = *capture;

    auto names = readField<std::vector<std::string>>(
        args, "return_variables", std::vector<std::string>{});
    if (!names) {
        return std::unexpected(names.error());
    }
    request.returnVariables = std::move(*names);

    if (args.contains("data_query") && !args["data_query"].is_null()) {
        const auto& q = args["data_query"];
        if (!q.is_object() || !q.contains("source") ||
            !q["source"].is_string()) {
            return std::unexpected(RequestError{
                "data_query", "data_query requires a string 'source'"});
        }
        DataQuery query;
        query.source = q["source"].get<std::string>();
        if (q.contains("filters") && !q["filters"].is_null()) {
            query.filters = q["filters"];
        }
        auto fields = readField<std::vector<std::string>>(
            q, "fields", std::vector<std::string>{});
        auto limit = readInteger(q, "limit", query.limit);
        if (!fields) {
            return std::unexpected(fields.error());
        }
        if (!limit) {
            return std::unexpected(limit.error());
        }
        if (*limit < 1) {
            return std::unexpected(
                RequestError{"data_query.limit", "limit must be at least 1"});
        }
        query.fields = std::move(*fields);
        query.limit = *limit;
        request.dataQuery = std::move(query);
    }

    request.clampLimits();
    return request;
}

auto ErrorInfo::toJson() const -> json {
    json j = {{"kind", errorKindToString(kind)},
              {"message", message},
              {"hints", hints}};
    if (limit) {
        j["limit"] = *limit;
        j["limit_unit"] = limitUnit;
    }
    return j;
}

auto ResourceUsage::toJson() const -> json {
    return {{"wall_time_ms", wallTime.count()},
            {"cpu_seconds", cpuSeconds},
            {"peak_memory_kb", peakMemoryKb}};
}

auto ExecutionResult::toJson() const -> json {
    json j = {{"success", success},
              {"output", output},
              {"variables", variables},
              {"execution_time_ms", executionTime.count()},
              {"metadata", metadata}};
    if (error) {
        j["error"] = error->toJson();
    }
    if (traceback) {
        j["traceback"] = *traceback;
    }
    return j;
}

auto ExecutionResult::fromJson(const json& j) -> ExecutionResult {
    ExecutionResult result;
    result.success = j.at("success").get<bool>();
    result.output = j.at("output").get<std::string>();
    result.variables =
        j.at("variables").get<std::map<std::string, std::string>>();
    result.executionTime =
        std::chrono::milliseconds(j.at("execution_time_ms").get<long long>());
    result.metadata = j.value("metadata", json::object());
    if (j.contains("error") && j["error"].is_object()) {
        const auto& e = j["error"];
        ErrorInfo error;
        error.kind = errorKindFromString(e.at("kind").get<std::string>());
        error.message = e.at("message").get<std::string>();
        error.hints = e.value("hints", std::vector<std::string>{});
        if (e.contains("limit")) {
            error.limit = e["limit"].get<int>();
            error.limitUnit = e.value("limit_unit", "");
        }
        result.error = std::move(error);
    }
    if (j.contains("traceback") && j["traceback"].is_string()) {
        result.traceback = j["traceback"].get<std::string>();
    }
    return result;
}

auto SecurityViolation::toJson() const -> json {
    return {{"success", false},
            {"error",
             {{"kind", errorKindToString(ErrorKind::SecurityViolation)},
              {"message", message},
              {"matched_pattern", matchedPattern},
              {"category", category},
              {"line", line},
              {"hints", hints}}}};
}

auto hintsFor(ErrorKind kind, std::optional<int> limit)
    -> std::vector<std::string> {
    std::string limitText = limit ? std::to_string(*limit) : "the configured";
    switch (kind) {
        case ErrorKind::SecurityViolation:
            return {"Use the provided tools (fetch_records, run_report, db.query) "
                    "for data access instead of files, processes or the network",
                    "Dynamic evaluation and interpreter internals are not "
                    "available; write the logic directly"};
        case ErrorKind::TimeoutExceeded:
            return {"The code ran longer than " + limitText +
                        " seconds; optimize loops or process less data per call",
                    "Filter and aggregate on the server with fetch_records "
                    "filters or run_report before iterating",
                    "Split long analyses into several smaller executions"};
        case ErrorKind::MemoryLimitExceeded:
            return {"The code exceeded " + limitText +
                        " MB; fetch fewer fields or rows",
                    "Aggregate incrementally instead of materializing large "
                    "intermediate lists or frames"};
        case ErrorKind::CpuLimitExceeded:
            return {"The code used more than " + limitText +
                        " seconds of CPU; reduce algorithmic complexity",
                    "Prefer vectorized or built-in operations over nested "
                    "Python loops"};
        case ErrorKind::RecursionLimitExceeded:
            return {"Recursion depth is limited to " + limitText +
                        " frames; rewrite deep recursion iteratively",
                    "Use an explicit stack or collections.deque for traversal"};
        case ErrorKind::ToolCallFailure:
            return {"Check the tool result's 'success' flag and 'error' "
                    "before using 'data'"};
        case ErrorKind::UnhandledRuntimeFailure:
            return {"Read the traceback for the failing line",
                    "Wrap risky steps in try/except and print diagnostics"};
        case ErrorKind::InvalidRequest:
            return {"Provide non-empty 'code' and well-typed limit fields"};
    }
    return {};
}

}  // namespace assay::sandbox
