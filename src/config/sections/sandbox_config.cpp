/*
 * sandbox_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_config.hpp"

#include <fstream>

#include "../core/exception.hpp"

namespace assay::config {

auto SandboxConfig::deserialize(const json& j) -> SandboxConfig {
    SandboxConfig cfg;
    cfg.defaultTimeoutSeconds =
        j.value("defaultTimeoutSeconds", cfg.defaultTimeoutSeconds);
    cfg.defaultMemoryLimitMb =
        j.value("defaultMemoryLimitMb", cfg.defaultMemoryLimitMb);
    cfg.defaultCpuLimitSeconds =
        j.value("defaultCpuLimitSeconds", cfg.defaultCpuLimitSeconds);
    cfg.defaultMaxRecursionDepth =
        j.value("defaultMaxRecursionDepth", cfg.defaultMaxRecursionDepth);
    cfg.outputCeilingBytes =
        j.value("outputCeilingBytes", cfg.outputCeilingBytes);
    cfg.variableCeilingBytes =
        j.value("variableCeilingBytes", cfg.variableCeilingBytes);
    cfg.auditSnippetChars = j.value("auditSnippetChars", cfg.auditSnippetChars);
    cfg.reportWaitSeconds = j.value("reportWaitSeconds", cfg.reportWaitSeconds);
    cfg.reportPollIntervalMs =
        j.value("reportPollIntervalMs", cfg.reportPollIntervalMs);
    cfg.maxQueryRows = j.value("maxQueryRows", cfg.maxQueryRows);
    if (j.contains("allowedModules") && j["allowedModules"].is_array()) {
        cfg.allowedModules =
            j["allowedModules"].get<std::vector<std::string>>();
    }
    cfg.enableDataHelpers = j.value("enableDataHelpers", cfg.enableDataHelpers);
    cfg.denyPatternsPath = j.value("denyPatternsPath", cfg.denyPatternsPath);
    cfg.limiter = j.value("limiter", cfg.limiter);
    cfg.isolation = j.value("isolation", cfg.isolation);
    cfg.killGraceSeconds = j.value("killGraceSeconds", cfg.killGraceSeconds);
    return cfg;
}

auto SandboxConfig::generateSchema() -> json {
    json schema;
    schema["type"] = "object";
    addSchemaProperty(schema, "defaultTimeoutSeconds", "integer", 30,
                      "Wall-clock limit when a request sets none");
    addRange(schema, "defaultTimeoutSeconds", 1, 300);
    addSchemaProperty(schema, "defaultMemoryLimitMb", "integer", 512,
                      "Memory ceiling (MB) when a request sets none");
    addRange(schema, "defaultMemoryLimitMb", 64, 2048);
    addSchemaProperty(schema, "defaultCpuLimitSeconds", "integer", 60,
                      "CPU-time ceiling when a request sets none");
    addRange(schema, "defaultCpuLimitSeconds", 1, 300);
    addSchemaProperty(schema, "defaultMaxRecursionDepth", "integer", 100,
                      "Call-depth ceiling when a request sets none");
    addRange(schema, "defaultMaxRecursionDepth", 50, 500);
    addSchemaProperty(schema, "outputCeilingBytes", "integer", 1024 * 1024,
                      "Captured output kept per run");
    addRange(schema, "outputCeilingBytes", 1024);
    addSchemaProperty(schema, "variableCeilingBytes", "integer", 64 * 1024,
                      "Rendering size kept per returned variable");
    addSchemaProperty(schema, "auditSnippetChars", "integer", 500,
                      "Code characters written to the audit record");
    addSchemaProperty(schema, "reportWaitSeconds", "integer", 10,
                      "Bounded wait for background report execution");
    addSchemaProperty(schema, "reportPollIntervalMs", "integer", 250);
    addSchemaProperty(schema, "maxQueryRows", "integer", 1000,
                      "Row cap for read-only data queries");
    addSchemaProperty(schema, "allowedModules", "array",
                      std::vector<std::string>{},
                      "Modules code may import");
    addSchemaProperty(schema, "enableDataHelpers", "boolean", true);
    addSchemaProperty(schema, "denyPatternsPath", "string", std::string{},
                      "JSON file with extra deny-list rules");
    addSchemaProperty(schema, "limiter", "string", std::string{"auto"});
    addEnum(schema, "limiter", "auto", "recursion-only");
    addSchemaProperty(schema, "isolation", "string", std::string{"process"},
                      "Run each execution in a forked child or in-process");
    addEnum(schema, "isolation", "process", "inline");
    addSchemaProperty(schema, "killGraceSeconds", "integer", 2,
                      "Seconds past a limit before the child is killed");
    addRange(schema, "killGraceSeconds", 1, 60);
    return schema;
}

auto SandboxConfig::loadFromFile(const std::filesystem::path& path)
    -> SandboxConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_CONFIG_IO_EXCEPTION("Cannot open sandbox config: " +
                                  path.string());
    }

    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        THROW_INVALID_CONFIG_EXCEPTION("Malformed sandbox config " +
                                       path.string() + ": " + e.what());
    }

    const json* section = &document;
    if (document.contains("assay") && document["assay"].contains("sandbox")) {
        section = &document["assay"]["sandbox"];
    } else if (document.contains("sandbox")) {
        section = &document["sandbox"];
    }

    SandboxConfig cfg;
    try {
        cfg = deserialize(*section);
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION("Invalid sandbox config value in " +
                                       path.string() + ": " + e.what());
    }
    cfg.validate();
    spdlog::info("Loaded sandbox config from {}", path.string());
    return cfg;
}

void SandboxConfig::validate() const {
    auto inRange = [](int value, int lo, int hi) {
        return value >= lo && value <= hi;
    };
    if (!inRange(defaultTimeoutSeconds, 1, 300)) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "defaultTimeoutSeconds must be within [1, 300]");
    }
    if (!inRange(defaultMemoryLimitMb, 64, 2048)) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "defaultMemoryLimitMb must be within [64, 2048]");
    }
    if (!inRange(defaultCpuLimitSeconds, 1, 300)) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "defaultCpuLimitSeconds must be within [1, 300]");
    }
    if (!inRange(defaultMaxRecursionDepth, 50, 500)) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "defaultMaxRecursionDepth must be within [50, 500]");
    }
    if (outputCeilingBytes < 1024) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "outputCeilingBytes must be at least 1024");
    }
    if (reportWaitSeconds < 0 || reportPollIntervalMs <= 0) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "report wait and poll interval must be positive");
    }
    if (limiter != "auto" && limiter != "recursion-only") {
        THROW_INVALID_CONFIG_EXCEPTION("Unknown limiter '" + limiter + "'");
    }
    if (isolation != "process" && isolation != "inline") {
        THROW_INVALID_CONFIG_EXCEPTION("Unknown isolation '" + isolation + "'");
    }
    if (!inRange(killGraceSeconds, 1, 60)) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "killGraceSeconds must be within [1, 60]");
    }
}

}  // namespace assay::config
