/*
 * gateway.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "gateway.hpp"

#include <spdlog/spdlog.h>

#include "logging/core/logging_manager.hpp"

namespace assay::bridge {

auto AuditRecord::toJson() const -> json {
    return {{"user", user},
            {"code_snippet", codeSnippet},
            {"duration_ms", durationMs},
            {"success", success},
            {"resource_usage", resourceUsage},
            {"outcome", outcome}};
}

LoggingAuditSink::LoggingAuditSink()
    : logger_(logging::LoggingManager::getInstance().getLogger("assay.audit")) {}

LoggingAuditSink::LoggingAuditSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

void LoggingAuditSink::record(const AuditRecord& record) {
    logger_->info("{}", record.toJson().dump(-1, ' ', false,
                                             json::error_handler_t::replace));
}

auto okResult(json data) -> json {
    return {{"success", true}, {"data", std::move(data)}};
}

auto errorResult(std::string_view message, std::string_view errorType)
    -> json {
    return {{"success", false},
            {"error", std::string(message)},
            {"error_type", std::string(errorType)}};
}

auto isSuccess(const json& reply) -> bool {
    return reply.is_object() && reply.contains("success") &&
           reply["success"].is_boolean() && reply["success"].get<bool>();
}

}  // namespace assay::bridge
