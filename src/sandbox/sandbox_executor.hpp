/*
 * sandbox_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file sandbox_executor.hpp
 * @brief Entry point of the sandbox: scan, govern, execute, report
 *
 * A request is scanned first; a rejected request never builds a bridge,
 * installs a limit or reaches the interpreter. An approved request runs
 * under the resource governor in a fresh execution context, and the
 * outcome is assembled into an ExecutionResult and audited.
 *
 * With process isolation (the default on POSIX) the governed run happens
 * in a forked child that is killed if it outlives its deadline; the tool
 * bridge stays in this process and serves the child's requests.
 */

#ifndef ASSAY_SANDBOX_SANDBOX_EXECUTOR_HPP
#define ASSAY_SANDBOX_SANDBOX_EXECUTOR_HPP

#include <expected>
#include <chrono>
#include <memory>
#include <optional>

#include "bridge/gateway.hpp"
#include "host_endpoint.hpp"
#include "output_manager.hpp"
#include "resource_governor.hpp"
#include "runtime_context.hpp"
#include "security_scanner.hpp"
#include "types.hpp"

namespace assay::sandbox {

class SandboxExecutor {
public:
    /**
     * @param runtime  shared Python runtime and helper engine
     * @param gateway  collaborator behind the tool bridge and data proxy
     * @param audit    audit sink; a LoggingAuditSink when null
     * @param limiter  resource limiter; chosen from the configuration when
     *                 null
     *
     * @throws InvalidRuleException if the configured deny-pattern file
     *         cannot be loaded
     */
    SandboxExecutor(std::shared_ptr<RuntimeContext> runtime,
                    std::shared_ptr<bridge::PlatformGateway> gateway,
                    std::shared_ptr<bridge::AuditSink> audit = nullptr,
                    std::shared_ptr<ResourceLimiter> limiter = nullptr);

    /**
     * @brief Run one request for one caller
     *
     * @return the execution result, or the security violation that
     *         stopped the request before it ran
     */
    [[nodiscard]] auto execute(const ExecutionRequest& request,
                               const tools::CallerContext& caller)
        -> std::expected<ExecutionResult, SecurityViolation>;

    [[nodiscard]] auto scanner() -> SecurityScanner& { return scanner_; }

    [[nodiscard]] auto config() const -> const config::SandboxConfig& {
        return runtime_->config();
    }

    [[nodiscard]] auto governor() const -> const ResourceGovernor& {
        return governor_;
    }

private:
    auto runApproved(const ExecutionRequest& request,
                     const tools::CallerContext& caller) -> ExecutionResult;

    /**
     * @brief Governed run in this process; the caller holds the GIL
     */
    auto runInline(const ExecutionRequest& request,
                   std::shared_ptr<HostEndpoint> host,
                   std::optional<json> prefetch,
                   std::chrono::steady_clock::time_point start)
        -> ExecutionResult;

    /**
     * @brief Governed run in a forked child; the caller holds the GIL
     */
    auto runIsolated(const ExecutionRequest& request,
                     std::shared_ptr<HostEndpoint> host,
                     std::optional<json> prefetch,
                     std::chrono::steady_clock::time_point start)
        -> ExecutionResult;

    [[nodiscard]] auto isolated() const -> bool;

    void audit(const tools::CallerContext& caller,
               const ExecutionRequest& request, long long durationMs,
               bool success, json resourceUsage, std::string outcome) noexcept;

    std::shared_ptr<RuntimeContext> runtime_;
    std::shared_ptr<bridge::PlatformGateway> gateway_;
    std::shared_ptr<bridge::AuditSink> audit_;
    SecurityScanner scanner_;
    ResourceGovernor governor_;
    ResultAssembler assembler_;
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_SANDBOX_EXECUTOR_HPP
