/*
 * descriptor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "descriptor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <mutex>

#include <spdlog/spdlog.h>

namespace assay::tools {

namespace {

auto matchesType(const json& value, const std::string& type) -> bool {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "object") return value.is_object();
    if (type == "null") return value.is_null();
    return true;
}

auto typeAllowed(const json& value, const json& typeSpec) -> bool {
    if (typeSpec.is_string()) {
        return matchesType(value, typeSpec.get<std::string>());
    }
    if (typeSpec.is_array()) {
        return std::any_of(typeSpec.begin(), typeSpec.end(),
                           [&](const json& t) {
                               return t.is_string() &&
                                      matchesType(value, t.get<std::string>());
                           });
    }
    return true;
}

auto checkProperty(const std::string& name, const json& value,
                   const json& property) -> std::expected<void, std::string> {
    if (property.contains("type") && !typeAllowed(value, property["type"])) {
        return std::unexpected("'" + name + "' must be of type " +
                               property["type"].dump());
    }
    if (property.contains("enum") && property["enum"].is_array()) {
        const auto& options = property["enum"];
        if (std::find(options.begin(), options.end(), value) == options.end()) {
            return std::unexpected("'" + name + "' must be one of " +
                                   options.dump());
        }
    }
    if (value.is_number()) {
        const double number = value.get<double>();
        if (property.contains("minimum") &&
            number < property["minimum"].get<double>()) {
            return std::unexpected("'" + name + "' must be >= " +
                                   property["minimum"].dump());
        }
        if (property.contains("maximum") &&
            number > property["maximum"].get<double>()) {
            return std::unexpected("'" + name + "' must be <= " +
                                   property["maximum"].dump());
        }
    }
    if (value.is_array() && property.contains("items") &&
        property["items"].contains("type")) {
        for (const auto& item : value) {
            if (!typeAllowed(item, property["items"]["type"])) {
                return std::unexpected("items of '" + name +
                                       "' must be of type " +
                                       property["items"]["type"].dump());
            }
        }
    }
    return {};
}

}  // namespace

auto CallerContext::hasAnyRole(const std::vector<std::string>& wanted) const
    -> bool {
    if (wanted.empty()) {
        return true;
    }
    return std::any_of(wanted.begin(), wanted.end(), [this](const auto& role) {
        return std::find(roles.begin(), roles.end(), role) != roles.end();
    });
}

auto ToolDescriptor::toJson() const -> json {
    return {{"name", name},
            {"description", description},
            {"inputSchema", inputSchema}};
}

auto integerValue(const json& value) -> std::expected<int, std::string> {
    constexpr int kLowest = std::numeric_limits<int>::min();
    constexpr int kHighest = std::numeric_limits<int>::max();

    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        return number > static_cast<std::uint64_t>(kHighest)
                   ? kHighest
                   : static_cast<int>(number);
    }
    if (value.is_number_integer()) {
        return static_cast<int>(std::clamp<std::int64_t>(
            value.get<std::int64_t>(), kLowest, kHighest));
    }
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (!std::isfinite(number) || std::trunc(number) != number) {
            return std::unexpected("expected an integer, got " + value.dump());
        }
        if (number >= static_cast<double>(kHighest)) {
            return kHighest;
        }
        if (number <= static_cast<double>(kLowest)) {
            return kLowest;
        }
        return static_cast<int>(number);
    }
    return std::unexpected(std::string("expected an integer, got ") +
                           value.type_name());
}

auto validateArguments(const json& schema, const json& arguments)
    -> std::expected<void, std::string> {
    if (!arguments.is_object()) {
        return std::unexpected("arguments must be an object");
    }
    const json properties =
        schema.contains("properties") ? schema["properties"] : json::object();

    if (schema.contains("required")) {
        for (const auto& key : schema["required"]) {
            const auto name = key.get<std::string>();
            if (!arguments.contains(name) || arguments[name].is_null()) {
                return std::unexpected("missing required argument '" + name +
                                       "'");
            }
        }
    }

    const bool closed = schema.contains("additionalProperties") &&
                        schema["additionalProperties"].is_boolean() &&
                        !schema["additionalProperties"].get<bool>();

    for (const auto& [name, value] : arguments.items()) {
        if (!properties.contains(name)) {
            if (closed) {
                return std::unexpected("unexpected argument '" + name + "'");
            }
            continue;
        }
        if (value.is_null()) {
            continue;
        }
        if (auto checked = checkProperty(name, value, properties[name]);
            !checked) {
            return checked;
        }
    }
    return {};
}

auto ToolCatalog::registerTool(ToolDescriptor descriptor) -> ToolResult<void> {
    if (descriptor.name.empty() || !descriptor.handler) {
        return std::unexpected(ToolFailure{ToolError::InvalidArguments,
                                           "tool needs a name and a handler"});
    }
    std::unique_lock lock(mutex_);
    if (tools_.contains(descriptor.name)) {
        return std::unexpected(ToolFailure{
            ToolError::AlreadyRegistered,
            "tool '" + descriptor.name + "' is already registered"});
    }
    spdlog::debug("Registered tool {}", descriptor.name);
    auto name = descriptor.name;
    tools_.emplace(std::move(name), std::move(descriptor));
    return {};
}

auto ToolCatalog::contains(std::string_view name) const -> bool {
    std::shared_lock lock(mutex_);
    return tools_.find(name) != tools_.end();
}

auto ToolCatalog::names() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& [name, descriptor] : tools_) {
        out.push_back(name);
    }
    return out;
}

auto ToolCatalog::list() const -> json {
    std::shared_lock lock(mutex_);
    json out = json::array();
    for (const auto& [name, descriptor] : tools_) {
        out.push_back(descriptor.toJson());
    }
    return out;
}

auto ToolCatalog::invoke(std::string_view name, const json& arguments,
                         const CallerContext& caller) const
    -> ToolResult<json> {
    ToolHandler handler;
    {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return std::unexpected(ToolFailure{
                ToolError::ToolNotFound,
                "unknown tool '" + std::string(name) + "'"});
        }
        const auto& descriptor = it->second;
        if (auto valid = validateArguments(descriptor.inputSchema, arguments);
            !valid) {
            return std::unexpected(
                ToolFailure{ToolError::InvalidArguments, valid.error()});
        }
        if (!caller.hasAnyRole(descriptor.requiredRoles)) {
            spdlog::warn("User {} lacks a role for tool {}", caller.user,
                         descriptor.name);
            return std::unexpected(ToolFailure{
                ToolError::PermissionDenied,
                "user '" + caller.user + "' is not permitted to call '" +
                    descriptor.name + "'"});
        }
        handler = descriptor.handler;
    }

    try {
        return handler(arguments, caller);
    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed: {}", name, e.what());
        return std::unexpected(
            ToolFailure{ToolError::InvocationFailed, e.what()});
    }
}

}  // namespace assay::tools
