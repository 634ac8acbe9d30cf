/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef ASSAY_CONFIG_CORE_CONFIG_SECTION_HPP
#define ASSAY_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "atom/type/json.hpp"

namespace assay::config {

using json = nlohmann::json;

/**
 * @brief Concept for types that can be serialized to/from JSON
 */
template <typename T>
concept JsonSerializable = requires(T value, json j) {
    { j = value } -> std::convertible_to<json>;
    { j.get<T>() } -> std::convertible_to<T>;
};

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member for the configuration path
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON
 * 4. Implement static generateSchema() to return JSON Schema
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/assay/sandbox")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @brief Try to create a configuration from JSON with error handling
     * @param j JSON object to deserialize
     * @return Configuration instance or nullopt on error
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return Derived::deserialize(j);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to deserialize config section {}: {}",
                         Derived::PATH, e.what());
            return std::nullopt;
        }
    }

    /**
     * @brief Get the JSON Schema for this configuration section
     */
    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Helper to add a property to a JSON Schema
     *
     * @param schema Schema object to modify
     * @param name Property name
     * @param type JSON Schema type ("string", "integer", "number", "boolean",
     * "array", "object")
     * @param defaultValue Default value for the property
     * @param description Optional description
     */
    template <JsonSerializable T>
    static void addSchemaProperty(json& schema, const std::string& name,
                                  const std::string& type, const T& defaultValue,
                                  const std::string& description = "") {
        if (!schema.contains("properties")) {
            schema["properties"] = json::object();
        }
        json& prop = schema["properties"][name];
        prop["type"] = type;
        prop["default"] = defaultValue;
        if (!description.empty()) {
            prop["description"] = description;
        }
    }

    /**
     * @brief Helper to add enum constraint to a property
     */
    template <typename... Args>
    static void addEnum(json& schema, const std::string& name, Args&&... values) {
        if (schema.contains("properties") && schema["properties"].contains(name)) {
            schema["properties"][name]["enum"] = json::array({std::forward<Args>(values)...});
        }
    }

    /**
     * @brief Helper to add range constraint to a numeric property
     */
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (schema.contains("properties") && schema["properties"].contains(name)) {
            auto& prop = schema["properties"][name];
            if (minimum) {
                prop["minimum"] = *minimum;
            }
            if (maximum) {
                prop["maximum"] = *maximum;
            }
        }
    }
};

}  // namespace assay::config

#endif  // ASSAY_CONFIG_CORE_CONFIG_SECTION_HPP
