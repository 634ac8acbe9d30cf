/*
 * execution_context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file execution_context.hpp
 * @brief Runs submitted code in a fresh restricted namespace
 *
 * The context is built for one request. It binds the host endpoint
 * (tools and data proxy) and the pre-fetched data into the namespace, redirects
 * standard streams into the run's capture, and maps Python exceptions
 * onto governed limits or a raised error. Every member function must be
 * called with the GIL held.
 */

#ifndef ASSAY_SANDBOX_EXECUTION_CONTEXT_HPP
#define ASSAY_SANDBOX_EXECUTION_CONTEXT_HPP

#include <memory>
#include <optional>

#include "atom/type/noncopyable.hpp"

#include "host_endpoint.hpp"
#include "output_manager.hpp"
#include "resource_governor.hpp"
#include "runtime_context.hpp"
#include "types.hpp"

namespace assay::sandbox {

/**
 * @brief Per-run host objects exposed to the script
 */
struct RunBindings {
    std::shared_ptr<OutputCapture> capture;
    std::shared_ptr<HostEndpoint> host;  ///< serves tools.* and db.*
    std::optional<json> prefetch;  ///< fetch_records reply for data_query
};

class ExecutionContext : public NonCopyable {
public:
    /**
     * @throws py::error_already_set if the namespace cannot be built
     */
    ExecutionContext(RuntimeContext& runtime, const ExecutionRequest& request,
                     RunBindings bindings);
    ~ExecutionContext();

    /**
     * @brief Interpreter hooks for the resource governor
     *
     * The returned hooks refer to this context and must not outlive it.
     */
    [[nodiscard]] auto hooks() -> InterpreterHooks;

    /**
     * @brief Run the code
     *
     * @throws LimitExceeded when the run was interrupted by the governor
     *         or hit the memory or recursion ceiling
     */
    [[nodiscard]] auto execute() -> ScriptOutcome;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_EXECUTION_CONTEXT_HPP
