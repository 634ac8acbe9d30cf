/*
 * data_proxy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file data_proxy.hpp
 * @brief Read-only query access exposed to sandboxed code as `db`
 *
 * Every statement is checked before it reaches the gateway: it must
 * open with a read verb, carry no mutating or privileged keyword and
 * hold at most one statement. A rejected statement never reaches the
 * gateway and is answered with security_violation=true, which callers
 * can tell apart from a query error reported by the gateway.
 */

#ifndef ASSAY_BRIDGE_DATA_PROXY_HPP
#define ASSAY_BRIDGE_DATA_PROXY_HPP

#include <atomic>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "gateway.hpp"

namespace assay::bridge {

/**
 * @brief A statement compiled from a convenience call
 */
struct CompiledQuery {
    std::string statement;
    json params = json::array();
};

/**
 * @brief Check that a statement is a single read-only statement
 * @return the reason for refusal on failure
 */
[[nodiscard]] auto validateReadOnly(std::string_view statement)
    -> std::expected<void, std::string>;

/**
 * @brief Quote a table or field name, refusing anything that is not a
 * plain identifier
 */
[[nodiscard]] auto quoteIdentifier(std::string_view name)
    -> std::expected<std::string, std::string>;

/**
 * @brief Build "WHERE ..." from a filter object
 *
 * Scalars compare with "=", arrays with "IN", null with "IS NULL".
 * Values are always bound parameters.
 */
[[nodiscard]] auto compileFilters(const json& filters, json& params)
    -> std::expected<std::string, std::string>;

class DataProxy {
public:
    DataProxy(std::shared_ptr<PlatformGateway> gateway, CallerContext caller,
              size_t maxRows);

    /**
     * @brief Run a read-only statement
     * @return {success, data: rows, count, truncated} or an error envelope
     */
    [[nodiscard]] auto query(const std::string& statement,
                             const json& params = json::array()) -> json;

    /**
     * @brief {success, data: bool}
     */
    [[nodiscard]] auto exists(const std::string& source, const json& filters)
        -> json;

    /**
     * @brief {success, data: int}
     */
    [[nodiscard]] auto count(const std::string& source, const json& filters)
        -> json;

    /**
     * @brief {success, data: value or null}
     */
    [[nodiscard]] auto getValue(const std::string& source, const json& filters,
                                const std::string& field) -> json;

    /**
     * @brief {success, data: column rows}
     */
    [[nodiscard]] auto describe(const std::string& source) -> json;

    void close() noexcept { closed_ = true; }
    [[nodiscard]] auto closed() const noexcept -> bool { return closed_; }

    [[nodiscard]] auto maxRows() const noexcept -> size_t { return maxRows_; }

private:
    auto run(const CompiledQuery& query) -> json;

    std::shared_ptr<PlatformGateway> gateway_;
    CallerContext caller_;
    size_t maxRows_;
    std::atomic<bool> closed_{false};
};

}  // namespace assay::bridge

#endif  // ASSAY_BRIDGE_DATA_PROXY_HPP
