/*
 * tool_bridge.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "tool_bridge.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace assay::bridge {

namespace {

/**
 * @brief Pass a failed gateway reply through as a bridge failure
 */
auto forwardFailure(const json& reply) -> json {
    if (!reply.is_object()) {
        return errorResult("malformed reply from the platform",
                           "ToolCallFailure");
    }
    return errorResult(reply.value("error", "operation failed"),
                       reply.value("error_type", "ToolCallFailure"));
}

/**
 * @brief Lift the fields of an object payload into the envelope
 */
auto flatten(const json& data) -> json {
    json out = {{"success", true}};
    if (data.is_object()) {
        for (const auto& [key, value] : data.items()) {
            if (key != "success") {
                out[key] = value;
            }
        }
    } else {
        out["data"] = data;
    }
    return out;
}

auto completedReport(const json& data) -> json {
    json result = data.value("result", json::array());
    json out = {{"success", true},
                {"data", result},
                {"columns", data.value("columns", json::array())},
                {"status", "completed"}};
    if (result.is_array()) {
        out["count"] = result.size();
    }
    return out;
}

auto isPending(std::string_view status) -> bool {
    return status == "queued" || status == "running";
}

auto optionalString(const json& args, const char* key)
    -> std::optional<std::string> {
    if (args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return std::nullopt;
}

/**
 * @brief args[key], or fallback when the key is absent or null
 */
template <typename T>
auto argOr(const json& args, const char* key, T fallback) -> T {
    if (!args.contains(key) || args[key].is_null()) {
        return fallback;
    }
    return args[key].get<T>();
}

/**
 * @brief Integer args[key] in [1, ceiling], or fallback when absent
 */
auto rowLimit(const json& args, const char* key, int fallback, int ceiling)
    -> int {
    int requested = fallback;
    if (args.contains(key) && !args[key].is_null()) {
        requested = tools::integerValue(args[key]).value_or(fallback);
    }
    return std::clamp(requested, 1, std::max(ceiling, 1));
}

auto stringSchema(std::string_view description) -> json {
    return {{"type", "string"}, {"description", std::string(description)}};
}

}  // namespace

auto failureType(tools::ToolError code) -> std::string_view {
    switch (code) {
        case tools::ToolError::ToolNotFound:
            return "UnknownTool";
        case tools::ToolError::InvalidArguments:
            return "ValidationError";
        case tools::ToolError::PermissionDenied:
            return "PermissionError";
        case tools::ToolError::Success:
        case tools::ToolError::AlreadyRegistered:
        case tools::ToolError::InvocationFailed:
            return "ToolCallFailure";
    }
    return "ToolCallFailure";
}

ToolBridge::ToolBridge(std::shared_ptr<PlatformGateway> gateway,
                       CallerContext caller, BridgeOptions options)
    : gateway_(std::move(gateway)),
      caller_(std::move(caller)),
      options_(options),
      proxy_(gateway_, caller_, options.maxQueryRows) {
    registerFunctions();
}

void ToolBridge::registerFunctions() {
    using tools::ToolDescriptor;

    auto bind = [this](auto method) {
        return [this, method](const json& args, const CallerContext&) {
            return (this->*method)(args);
        };
    };

    std::vector<ToolDescriptor> descriptors;

    descriptors.push_back(
        {"fetch_records",
         "List records of a source matching filters",
         {{"type", "object"},
          {"properties",
           {{"source", stringSchema("Record type to read")},
            {"filters", {{"type", "object"}}},
            {"fields",
             {{"type", "array"}, {"items", {{"type", "string"}}}}},
            {"limit", {{"type", "integer"}, {"minimum", 1}}}}},
          {"required", {"source"}},
          {"additionalProperties", false}},
         {},
         bind(&ToolBridge::fetchRecords)});

    descriptors.push_back(
        {"fetch_record",
         "Read one record by id",
         {{"type", "object"},
          {"properties",
           {{"source", stringSchema("Record type to read")},
            {"id", {{"type", json::array({"string", "integer"})}}}}},
          {"required", {"source", "id"}},
          {"additionalProperties", false}},
         {},
         bind(&ToolBridge::fetchRecord)});

    descriptors.push_back(
        {"run_report",
         "Run a report and return its rows; background reports are awaited "
         "for a bounded time",
         {{"type", "object"},
          {"properties",
           {{"name", stringSchema("Report name")},
            {"filters", {{"type", "object"}}}}},
          {"required", {"name"}},
          {"additionalProperties", false}},
         {},
         bind(&ToolBridge::runReport)});

    descriptors.push_back(
        {"describe_report",
         "Columns and filter guidance of a report",
         {{"type", "object"},
          {"properties", {{"name", stringSchema("Report name")}}},
          {"required", {"name"}},
          {"additionalProperties", false}},
         {},
         bind(&ToolBridge::describeReport)});

    descriptors.push_back(
        {"list_reports",
         "Reports available to the caller",
         {{"type", "object"},
          {"properties",
           {{"module", stringSchema("Restrict to a module")},
            {"type", stringSchema("Restrict to a report type")}}},
          {"additionalProperties", false}},
         {},
         bind(&ToolBridge::listReports)});

    descriptors.push_back(
        {"search",
         "Full-text search across records",
         {{"type", "object"},
          {"properties",
           {{"query", stringSchema("Search text")},
            {"source", stringSchema("Restrict to a record type")},
            {"limit", {{"type", "integer"}, {"minimum", 1}}}}},
          {"required", {"query"}},
          {"additionalProperties", false}},
         {},
         bind(&ToolBridge::search)});

    descriptors.push_back(
        {"describe_schema",
         "Fields and links of a record type",
         {{"type", "object"},
          {"properties", {{"source", stringSchema("Record type")}}},
          {"required", {"source"}},
          {"additionalProperties", false}},
         {},
         bind(&ToolBridge::describeSchema)});

    for (auto& descriptor : descriptors) {
        if (auto added = catalog_.registerTool(std::move(descriptor));
            !added) {
            spdlog::error("Bridge function registration failed: {}",
                          added.error().message);
        }
    }
}

auto ToolBridge::call(std::string_view name, const json& arguments) -> json {
    if (closed()) {
        return errorResult("The tool bridge is closed for this run",
                           "BridgeClosed");
    }
    const json args = arguments.is_null() ? json::object() : arguments;
    auto result = catalog_.invoke(name, args, caller_);
    if (!result) {
        spdlog::debug("Bridge call {} failed: {}", name,
                      result.error().message);
        return errorResult(result.error().message,
                           failureType(result.error().code));
    }
    return std::move(*result);
}

auto ToolBridge::functionNames() const -> std::vector<std::string> {
    return catalog_.names();
}

auto ToolBridge::describe() const -> json { return catalog_.list(); }

void ToolBridge::setDeadline(Clock::time_point deadline) {
    std::lock_guard lock(mutex_);
    deadline_ = deadline;
}

void ToolBridge::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    proxy_.close();
    wake_.notify_all();
}

auto ToolBridge::closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto ToolBridge::fetchRecords(const json& args) -> json {
    RecordQuery query;
    query.source = args["source"].get<std::string>();
    query.filters = argOr(args, "filters", json::object());
    query.fields = argOr(args, "fields", std::vector<std::string>{});
    query.limit = rowLimit(args, "limit", 100,
                           static_cast<int>(options_.maxQueryRows));

    json reply = gateway_->fetchRecords(caller_, query);
    if (!isSuccess(reply)) {
        return forwardFailure(reply);
    }
    json data = reply.value("data", json::array());
    json out = okResult(data);
    out["count"] = data.is_array() ? data.size() : 1;
    return out;
}

auto ToolBridge::fetchRecord(const json& args) -> json {
    const auto& id = args["id"];
    const std::string key =
        id.is_string() ? id.get<std::string>() : id.dump();

    json reply =
        gateway_->fetchRecord(caller_, args["source"].get<std::string>(), key);
    if (!isSuccess(reply)) {
        return forwardFailure(reply);
    }
    return okResult(reply.value("data", json()));
}

auto ToolBridge::runReport(const json& args) -> json {
    const auto name = args["name"].get<std::string>();
    json reply =
        gateway_->runReport(caller_, name, argOr(args, "filters", json::object()));
    if (!isSuccess(reply)) {
        return forwardFailure(reply);
    }

    json data = reply.value("data", json::object());
    const std::string status = data.value("status", "completed");
    if (isPending(status)) {
        return awaitReport(name, data.value("job_id", ""), data);
    }
    if (status == "failed") {
        return errorResult(data.value("error", "report failed"),
                           "ReportFailed");
    }
    return completedReport(data);
}

auto ToolBridge::awaitReport(const std::string& name, const std::string& jobId,
                             json status) -> json {
    spdlog::debug("Report {} running in background as job {}", name, jobId);

    Clock::time_point until = Clock::now() + options_.reportWait;
    {
        std::lock_guard lock(mutex_);
        if (deadline_ && *deadline_ < until) {
            until = *deadline_;
        }
    }

    while (!jobId.empty()) {
        {
            std::unique_lock lock(mutex_);
            const auto now = Clock::now();
            if (closed_ || now >= until) {
                break;
            }
            wake_.wait_until(lock,
                             std::min(until, now + options_.reportPollInterval),
                             [this] { return closed_; });
            if (closed_) {
                break;
            }
        }

        json reply = gateway_->reportJob(caller_, jobId);
        if (!isSuccess(reply)) {
            return forwardFailure(reply);
        }
        status = reply.value("data", json::object());
        const std::string state = status.value("status", "completed");
        if (state == "failed") {
            return errorResult(status.value("error", "report failed"),
                               "ReportFailed");
        }
        if (!isPending(state)) {
            return completedReport(status);
        }
    }

    if (closed()) {
        return errorResult("The tool bridge is closed for this run",
                           "BridgeClosed");
    }

    json out = errorResult(
        "Report '" + name +
            "' is still running in the background. Call run_report again "
            "with the same arguments later to collect the result.",
        "ReportPending");
    out["status"] = status.value("status", "running");
    out["job_id"] = jobId;
    return out;
}

auto ToolBridge::describeReport(const json& args) -> json {
    json reply =
        gateway_->describeReport(caller_, args["name"].get<std::string>());
    if (!isSuccess(reply)) {
        return forwardFailure(reply);
    }
    json out = flatten(reply.value("data", json::object()));
    if (!out.contains("columns")) {
        out["columns"] = json::array();
    }
    if (!out.contains("filter_guidance")) {
        out["filter_guidance"] = json::array();
    }
    return out;
}

auto ToolBridge::listReports(const json& args) -> json {
    json reply = gateway_->listReports(caller_, optionalString(args, "module"),
                                       optionalString(args, "type"));
    if (!isSuccess(reply)) {
        return forwardFailure(reply);
    }
    json reports = reply.value("data", json::array());
    return {{"success", true},
            {"reports", reports},
            {"count", reports.is_array() ? reports.size() : 0}};
}

auto ToolBridge::search(const json& args) -> json {
    const int limit =
        rowLimit(args, "limit", 20, static_cast<int>(options_.maxQueryRows));
    json reply = gateway_->search(caller_, args["query"].get<std::string>(),
                                  optionalString(args, "source"), limit);
    if (!isSuccess(reply)) {
        return forwardFailure(reply);
    }
    json results = reply.value("data", json::array());
    return {{"success", true},
            {"results", results},
            {"count", results.is_array() ? results.size() : 0}};
}

auto ToolBridge::describeSchema(const json& args) -> json {
    json reply =
        gateway_->describeSchema(caller_, args["source"].get<std::string>());
    if (!isSuccess(reply)) {
        return forwardFailure(reply);
    }
    json out = flatten(reply.value("data", json::object()));
    if (!out.contains("fields")) {
        out["fields"] = json::array();
    }
    if (!out.contains("links")) {
        out["links"] = json::array();
    }
    return out;
}

}  // namespace assay::bridge
