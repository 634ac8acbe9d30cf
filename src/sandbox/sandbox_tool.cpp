/*
 * sandbox_tool.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_tool.hpp"

#include <spdlog/spdlog.h>

namespace assay::sandbox {

namespace {

constexpr std::string_view kDescription =
    "Execute Python analysis code server-side. The code runs in a restricted "
    "namespace with math/statistics helpers, a Table helper, pandas (pd), "
    "numpy (np) and matplotlib (plt, figure_to_base64) when installed, and "
    "read-only data access: tools.* / fetch_records, fetch_record, "
    "run_report, describe_report, list_reports, search, describe_schema, and "
    "db.query/exists/count/get_value/describe. Every tool returns a dict with "
    "'success'. Files, processes, the network and dynamic evaluation are "
    "blocked. Limits outside their ranges are clamped: timeout_seconds "
    "1-300, memory_limit_mb 64-2048, cpu_limit_seconds 1-300, "
    "max_recursion_depth 50-500. Use print() for output and return_variables "
    "to get values back.";

auto integerProperty(std::string_view description, int fallback) -> json {
    return {{"type", "integer"},
            {"description", std::string(description)},
            {"default", fallback}};
}

auto invalidRequest(const RequestError& error) -> json {
    ErrorInfo info;
    info.kind = ErrorKind::InvalidRequest;
    info.message = error.field.empty() ? error.message
                                       : error.field + ": " + error.message;
    info.hints = hintsFor(ErrorKind::InvalidRequest);
    return {{"success", false}, {"error", info.toJson()}};
}

}  // namespace

auto sandboxToolSchema() -> json {
    return {
        {"type", "object"},
        {"properties",
         {{"code",
           {{"type", "string"}, {"description", "Python code to execute"}}},
          {"timeout_seconds",
           integerProperty("Wall-clock limit in seconds", 30)},
          {"memory_limit_mb", integerProperty("Memory limit in MB", 512)},
          {"cpu_limit_seconds",
           integerProperty("CPU time limit in seconds", 60)},
          {"max_recursion_depth",
           integerProperty("Maximum recursion depth", 100)},
          {"capture_output",
           {{"type", "boolean"},
            {"description", "Capture print output"},
            {"default", true}}},
          {"return_variables",
           {{"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", "Names whose values are returned as strings"}}},
          {"data_query",
           {{"type", "object"},
            {"description",
             "Records fetched before the run and bound as 'data' "
             "(and 'data_result')"},
            {"properties",
             {{"source", {{"type", "string"}}},
              {"filters", {{"type", "object"}}},
              {"fields",
               {{"type", "array"}, {"items", {{"type", "string"}}}}},
              {"limit", {{"type", "integer"}, {"minimum", 1}}}}},
            {"required", {"source"}}}}}},
        {"required", {"code"}}};
}

auto makeSandboxTool(std::shared_ptr<SandboxExecutor> executor)
    -> tools::ToolDescriptor {
    tools::ToolDescriptor descriptor;
    descriptor.name = std::string(kSandboxToolName);
    descriptor.description = std::string(kDescription);
    descriptor.inputSchema = sandboxToolSchema();
    descriptor.handler = [executor](const json& arguments,
                                    const tools::CallerContext& caller)
        -> json {
        auto request = ExecutionRequest::fromJson(arguments, executor->config());
        if (!request) {
            spdlog::warn("Rejected sandbox request from {}: {}", caller.user,
                         request.error().message);
            return invalidRequest(request.error());
        }
        auto result = executor->execute(*request, caller);
        if (!result) {
            return result.error().toJson();
        }
        return result->toJson();
    };
    return descriptor;
}

auto registerSandboxTool(tools::ToolCatalog& catalog,
                         std::shared_ptr<SandboxExecutor> executor)
    -> tools::ToolResult<void> {
    return catalog.registerTool(makeSandboxTool(std::move(executor)));
}

}  // namespace assay::sandbox
