/*
 * descriptor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file descriptor.hpp
 * @brief Declarative tool descriptors and the catalog that invokes them
 *
 * A tool is a name, a description, a JSON input schema and a handler.
 * Arguments are checked against the schema before the handler runs.
 */

#ifndef ASSAY_TOOLS_DESCRIPTOR_HPP
#define ASSAY_TOOLS_DESCRIPTOR_HPP

#include <expected>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "atom/type/json.hpp"

namespace assay::tools {

using json = nlohmann::json;

enum class ToolError {
    Success = 0,
    ToolNotFound,
    AlreadyRegistered,
    InvalidArguments,
    PermissionDenied,
    InvocationFailed
};

[[nodiscard]] constexpr std::string_view toolErrorToString(
    ToolError error) noexcept {
    switch (error) {
        case ToolError::Success:
            return "Success";
        case ToolError::ToolNotFound:
            return "ToolNotFound";
        case ToolError::AlreadyRegistered:
            return "AlreadyRegistered";
        case ToolError::InvalidArguments:
            return "InvalidArguments";
        case ToolError::PermissionDenied:
            return "PermissionError";
        case ToolError::InvocationFailed:
            return "InvocationFailed";
    }
    return "InvocationFailed";
}

struct ToolFailure {
    ToolError code{ToolError::InvocationFailed};
    std::string message;
};

template <typename T>
using ToolResult = std::expected<T, ToolFailure>;

/**
 * @brief Identity of whoever is calling a tool, for one request
 */
struct CallerContext {
    std::string user;
    std::vector<std::string> roles;

    [[nodiscard]] auto hasAnyRole(const std::vector<std::string>& wanted) const
        -> bool;
};

using ToolHandler =
    std::function<json(const json& arguments, const CallerContext& caller)>;

struct ToolDescriptor {
    std::string name;
    std::string description;
    json inputSchema = json::object();
    std::vector<std::string> requiredRoles;  ///< Any one of these; empty = all
    ToolHandler handler;

    /**
     * @brief Listing form: name, description and inputSchema
     */
    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Check arguments against a JSON object schema
 *
 * Supports type, properties, required, enum, minimum/maximum, items
 * type and additionalProperties=false. A null value for an optional
 * property counts as absent.
 */
[[nodiscard]] auto validateArguments(const json& schema, const json& arguments)
    -> std::expected<void, std::string>;

/**
 * @brief Read a JSON number as an int
 *
 * Integers outside the int range saturate at its bounds. Floats must be
 * finite and integral.
 */
[[nodiscard]] auto integerValue(const json& value)
    -> std::expected<int, std::string>;

class ToolCatalog {
public:
    [[nodiscard]] auto registerTool(ToolDescriptor descriptor)
        -> ToolResult<void>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto list() const -> json;

    /**
     * @brief Validate, authorise and run a tool
     *
     * A handler that throws is reported as InvocationFailed.
     */
    [[nodiscard]] auto invoke(std::string_view name, const json& arguments,
                              const CallerContext& caller) const
        -> ToolResult<json>;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ToolDescriptor, std::less<>> tools_;
};

}  // namespace assay::tools

#endif  // ASSAY_TOOLS_DESCRIPTOR_HPP
