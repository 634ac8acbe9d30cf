/*
 * tool_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file tool_bridge.hpp
 * @brief Platform read operations callable from sandboxed code
 *
 * One bridge is built per request for one caller and closed when the
 * run ends. Every call answers with a plain JSON envelope; failures are
 * values ({success: false, error, error_type}), never exceptions.
 */

#ifndef ASSAY_BRIDGE_TOOL_BRIDGE_HPP
#define ASSAY_BRIDGE_TOOL_BRIDGE_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "data_proxy.hpp"
#include "gateway.hpp"
#include "tools/descriptor.hpp"

namespace assay::bridge {

struct BridgeOptions {
    std::chrono::seconds reportWait{10};
    std::chrono::milliseconds reportPollInterval{250};
    size_t maxQueryRows{1000};
};

class ToolBridge {
public:
    using Clock = std::chrono::steady_clock;

    ToolBridge(std::shared_ptr<PlatformGateway> gateway, CallerContext caller,
               BridgeOptions options);

    ToolBridge(const ToolBridge&) = delete;
    ToolBridge& operator=(const ToolBridge&) = delete;

    /**
     * @brief Call a bridge function by name
     *
     * Unknown names, invalid arguments and collaborator failures are all
     * reported in the returned envelope.
     */
    [[nodiscard]] auto call(std::string_view name, const json& arguments)
        -> json;

    /**
     * @brief Names of the callable functions
     */
    [[nodiscard]] auto functionNames() const -> std::vector<std::string>;

    /**
     * @brief Name, description and input schema of each function
     */
    [[nodiscard]] auto describe() const -> json;

    /**
     * @brief Background waits never run past this point
     */
    void setDeadline(Clock::time_point deadline);

    /**
     * @brief Refuse further calls and wake any pending report wait
     */
    void close();

    [[nodiscard]] auto closed() const -> bool;

    [[nodiscard]] auto dataProxy() -> DataProxy& { return proxy_; }

    [[nodiscard]] auto caller() const -> const CallerContext& {
        return caller_;
    }

private:
    void registerFunctions();

    auto fetchRecords(const json& args) -> json;
    auto fetchRecord(const json& args) -> json;
    auto runReport(const json& args) -> json;
    auto describeReport(const json& args) -> json;
    auto listReports(const json& args) -> json;
    auto search(const json& args) -> json;
    auto describeSchema(const json& args) -> json;

    /**
     * @brief Poll a background report until it settles, the wait budget
     * runs out, or the bridge closes
     */
    auto awaitReport(const std::string& name, const std::string& jobId,
                     json status) -> json;

    std::shared_ptr<PlatformGateway> gateway_;
    CallerContext caller_;
    BridgeOptions options_;
    tools::ToolCatalog catalog_;
    DataProxy proxy_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool closed_{false};
    std::optional<Clock::time_point> deadline_;
};

/**
 * @brief error_type reported for a catalog failure code
 */
[[nodiscard]] auto failureType(tools::ToolError code) -> std::string_view;

}  // namespace assay::bridge

#endif  // ASSAY_BRIDGE_TOOL_BRIDGE_HPP
