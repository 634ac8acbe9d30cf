/*
 * host_endpoint.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "host_endpoint.hpp"

#include <spdlog/spdlog.h>

namespace assay::sandbox {

BridgeEndpoint::BridgeEndpoint(std::shared_ptr<bridge::ToolBridge> bridge)
    : bridge_(std::move(bridge)) {}

auto BridgeEndpoint::call(const std::string& name, const json& arguments)
    -> json {
    return bridge_->call(name, arguments);
}

auto BridgeEndpoint::describe() -> json { return bridge_->describe(); }

auto BridgeEndpoint::data(const std::string& operation, const json& arguments)
    -> json {
    auto& proxy = bridge_->dataProxy();
    const json filters = arguments.value("filters", json::object());
    const std::string source = arguments.value("source", "");

    if (operation == "query") {
        return proxy.query(arguments.value("statement", ""),
                           arguments.value("params", json::array()));
    }
    if (operation == "exists") {
        return proxy.exists(source, filters);
    }
    if (operation == "count") {
        return proxy.count(source, filters);
    }
    if (operation == "get_value") {
        return proxy.getValue(source, filters, arguments.value("field", ""));
    }
    if (operation == "describe") {
        return proxy.describe(source);
    }
    return bridge::errorResult("unknown data operation '" + operation + "'",
                               "QueryError");
}

auto encodeCall(const std::string& name, const json& arguments) -> json {
    return {{"op", "call"}, {"name", name}, {"arguments", arguments}};
}

auto encodeDescribe() -> json { return {{"op", "describe"}}; }

auto encodeData(const std::string& operation, const json& arguments) -> json {
    return {{"op", "data"}, {"operation", operation}, {"arguments", arguments}};
}

auto serveRequest(HostEndpoint& endpoint, const json& request) -> json {
    if (!request.is_object()) {
        return bridge::errorResult("malformed request", "ToolCallFailure");
    }
    const std::string op = request.value("op", "");
    if (op == "call") {
        return endpoint.call(request.value("name", ""),
                             request.value("arguments", json::object()));
    }
    if (op == "describe") {
        return endpoint.describe();
    }
    if (op == "data") {
        return endpoint.data(request.value("operation", ""),
                             request.value("arguments", json::object()));
    }
    spdlog::warn("Sandbox child sent unknown request '{}'", op);
    return bridge::errorResult("unknown request '" + op + "'",
                               "ToolCallFailure");
}

}  // namespace assay::sandbox
