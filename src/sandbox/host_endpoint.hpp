/*
 * host_endpoint.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file host_endpoint.hpp
 * @brief The host side of the sandbox's tools and db objects
 *
 * Sandboxed code reaches the platform only through a HostEndpoint. In
 * the calling process that is the run's ToolBridge; in an isolated
 * child it is a channel back to the parent, which serves each request
 * against the bridge with serveRequest().
 */

#ifndef ASSAY_SANDBOX_HOST_ENDPOINT_HPP
#define ASSAY_SANDBOX_HOST_ENDPOINT_HPP

#include <memory>
#include <string>

#include "bridge/tool_bridge.hpp"
#include "types.hpp"

namespace assay::sandbox {

class HostEndpoint {
public:
    virtual ~HostEndpoint() = default;

    /**
     * @brief Call a bridge function; the reply is its JSON envelope
     */
    [[nodiscard]] virtual auto call(const std::string& name,
                                    const json& arguments) -> json = 0;

    [[nodiscard]] virtual auto describe() -> json = 0;

    /**
     * @brief Read-only data operation: "query", "exists", "count",
     * "get_value" or "describe"
     */
    [[nodiscard]] virtual auto data(const std::string& operation,
                                    const json& arguments) -> json = 0;
};

/**
 * @brief Endpoint backed by the run's tool bridge
 */
class BridgeEndpoint : public HostEndpoint {
public:
    explicit BridgeEndpoint(std::shared_ptr<bridge::ToolBridge> bridge);

    [[nodiscard]] auto call(const std::string& name, const json& arguments)
        -> json override;
    [[nodiscard]] auto describe() -> json override;
    [[nodiscard]] auto data(const std::string& operation, const json& arguments)
        -> json override;

private:
    std::shared_ptr<bridge::ToolBridge> bridge_;
};

/**
 * @brief Request frame for an endpoint call, as sent over a channel
 */
[[nodiscard]] auto encodeCall(const std::string& name, const json& arguments)
    -> json;
[[nodiscard]] auto encodeDescribe() -> json;
[[nodiscard]] auto encodeData(const std::string& operation,
                              const json& arguments) -> json;

/**
 * @brief Answer one request frame against an endpoint
 *
 * Unknown requests are answered with an error envelope.
 */
[[nodiscard]] auto serveRequest(HostEndpoint& endpoint, const json& request)
    -> json;

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_HOST_ENDPOINT_HPP
