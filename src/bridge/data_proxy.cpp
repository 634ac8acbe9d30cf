/*
 * data_proxy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "data_proxy.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "sql_guard.hpp"

namespace assay::bridge {

namespace {

auto securityRejection(const std::string& reason) -> json {
    json reply = errorResult(reason, "SecurityViolation");
    reply["security_violation"] = true;
    return reply;
}

auto isReadVerb(std::string_view verb) -> bool {
    return std::find(std::begin(sql::kReadVerbs), std::end(sql::kReadVerbs),
                     verb) != std::end(sql::kReadVerbs);
}

}  // namespace

auto validateReadOnly(std::string_view statement)
    -> std::expected<void, std::string> {
    const std::string cleaned = sql::stripComments(statement);
    const std::string verb = sql::leadingVerb(cleaned);
    if (verb.empty()) {
        return std::unexpected("Empty statement");
    }
    if (!isReadVerb(verb)) {
        return std::unexpected(
            "Only read statements are allowed (SELECT, WITH, SHOW, DESCRIBE, "
            "EXPLAIN); got " + verb);
    }
    if (auto keyword = sql::findKeyword(cleaned, sql::kProxyDeniedKeywords)) {
        return std::unexpected("Statement contains forbidden keyword " +
                               *keyword);
    }
    if (sql::hasStatementSeparator(cleaned)) {
        return std::unexpected("Multiple statements are not allowed");
    }
    return {};
}

auto quoteIdentifier(std::string_view name)
    -> std::expected<std::string, std::string> {
    if (!sql::isSafeIdentifier(name)) {
        return std::unexpected("Invalid identifier '" + std::string(name) +
                               "'");
    }
    return "`" + std::string(name) + "`";
}

auto compileFilters(const json& filters, json& params)
    -> std::expected<std::string, std::string> {
    if (filters.is_null() || (filters.is_object() && filters.empty())) {
        return std::string();
    }
    if (!filters.is_object()) {
        return std::unexpected("filters must be an object");
    }
    std::string clause;
    for (const auto& [field, value] : filters.items()) {
        auto column = quoteIdentifier(field);
        if (!column) {
            return std::unexpected(column.error());
        }
        clause += clause.empty() ? " WHERE " : " AND ";
        if (value.is_null()) {
            clause += *column + " IS NULL";
        } else if (value.is_array()) {
            if (value.empty()) {
                return std::unexpected("filter '" + field +
                                       "' has an empty value list");
            }
            clause += *column + " IN (";
            for (size_t i = 0; i < value.size(); ++i) {
                clause += i == 0 ? "?" : ", ?";
                params.push_back(value[i]);
            }
            clause += ")";
        } else if (value.is_object()) {
            return std::unexpected("filter '" + field +
                                   "' must be a scalar or a list");
        } else {
            clause += *column + " = ?";
            params.push_back(value);
        }
    }
    return clause;
}

DataProxy::DataProxy(std::shared_ptr<PlatformGateway> gateway,
                     CallerContext caller, size_t maxRows)
    : gateway_(std::move(gateway)),
      caller_(std::move(caller)),
      maxRows_(maxRows) {}

auto DataProxy::run(const CompiledQuery& compiled) -> json {
    if (closed_) {
        return errorResult("Data access is closed for this run", "BridgeClosed");
    }
    if (auto valid = validateReadOnly(compiled.statement); !valid) {
        spdlog::warn("Data proxy rejected statement for {}: {}", caller_.user,
                     valid.error());
        return securityRejection(valid.error());
    }

    json reply;
    try {
        reply = gateway_->executeReadQuery(caller_, compiled.statement,
                                           compiled.params);
    } catch (const std::exception& e) {
        spdlog::error("Read query failed: {}", e.what());
        return errorResult(e.what(), "QueryError");
    }

    if (!isSuccess(reply)) {
        std::string type = reply.value("error_type", "QueryError");
        if (type != "PermissionError") {
            type = "QueryError";
        }
        return errorResult(reply.value("error", "query failed"), type);
    }

    json rows = reply.value("data", json::array());
    if (!rows.is_array()) {
        rows = json::array({rows});
    }
    bool truncated = false;
    if (rows.size() > maxRows_) {
        rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(maxRows_),
                   rows.end());
        truncated = true;
    }
    json out = okResult(rows);
    out["count"] = rows.size();
    out["truncated"] = truncated;
    return out;
}

auto DataProxy::query(const std::string& statement, const json& params)
    -> json {
    json bound = params.is_null() ? json::array() : params;
    if (!bound.is_array() && !bound.is_object()) {
        return errorResult("params must be a list or a dict", "QueryError");
    }
    return run({statement, std::move(bound)});
}

auto DataProxy::exists(const std::string& source, const json& filters)
    -> json {
    auto table = quoteIdentifier(source);
    if (!table) {
        return securityRejection(table.error());
    }
    CompiledQuery compiled;
    auto where = compileFilters(filters, compiled.params);
    if (!where) {
        return securityRejection(where.error());
    }
    compiled.statement = "SELECT 1 FROM " + *table + *where + " LIMIT 1";
    json reply = run(compiled);
    if (!isSuccess(reply)) {
        return reply;
    }
    return okResult(!reply["data"].empty());
}

auto DataProxy::count(const std::string& source, const json& filters)
    -> json {
    auto table = quoteIdentifier(source);
    if (!table) {
        return securityRejection(table.error());
    }
    CompiledQuery compiled;
    auto where = compileFilters(filters, compiled.params);
    if (!where) {
        return securityRejection(where.error());
    }
    compiled.statement =
        "SELECT COUNT(*) AS `count` FROM " + *table + *where;
    json reply = run(compiled);
    if (!isSuccess(reply)) {
        return reply;
    }
    const auto& rows = reply["data"];
    if (rows.empty()) {
        return okResult(0);
    }
    const auto& first = rows.front();
    if (first.is_object()) {
        if (first.contains("count")) {
            return okResult(first["count"]);
        }
        return okResult(first.empty() ? json(0) : first.begin().value());
    }
    if (first.is_array() && !first.empty()) {
        return okResult(first.front());
    }
    return okResult(first);
}

auto DataProxy::getValue(const std::string& source, const json& filters,
                         const std::string& field) -> json {
    auto table = quoteIdentifier(source);
    if (!table) {
        return securityRejection(table.error());
    }
    auto column = quoteIdentifier(field);
    if (!column) {
        return securityRejection(column.error());
    }
    CompiledQuery compiled;
    auto where = compileFilters(filters, compiled.params);
    if (!where) {
        return securityRejection(where.error());
    }
    compiled.statement =
        "SELECT " + *column + " FROM " + *table + *where + " LIMIT 1";
    json reply = run(compiled);
    if (!isSuccess(reply)) {
        return reply;
    }
    const auto& rows = reply["data"];
    if (rows.empty()) {
        return okResult(nullptr);
    }
    const auto& first = rows.front();
    if (first.is_object()) {
        return okResult(first.value(field, json()));
    }
    if (first.is_array() && !first.empty()) {
        return okResult(first.front());
    }
    return okResult(first);
}

auto DataProxy::describe(const std::string& source) -> json {
    auto table = quoteIdentifier(source);
    if (!table) {
        return securityRejection(table.error());
    }
    json reply = run({"SHOW COLUMNS FROM " + *table, json::array()});
    if (!isSuccess(reply)) {
        return reply;
    }
    return okResult(reply["data"]);
}

}  // namespace assay::bridge
