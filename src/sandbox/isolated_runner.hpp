/*
 * isolated_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file isolated_runner.hpp
 * @brief Runs one sandbox execution in a forked child process
 *
 * The child inherits the interpreter and the helper engine, runs the
 * body and reports its ExecutionResult over a HostChannel. Tool and data
 * requests from the child are served against the parent's endpoint.
 * The parent kills the child once the wall-clock deadline plus the kill
 * grace has passed, so a run that ignores the in-interpreter interrupt
 * still ends. POSIX only.
 */

#ifndef ASSAY_SANDBOX_ISOLATED_RUNNER_HPP
#define ASSAY_SANDBOX_ISOLATED_RUNNER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "atom/type/noncopyable.hpp"

#include "host_endpoint.hpp"
#include "types.hpp"

namespace assay::sandbox {

/**
 * @brief How the child ended
 *
 * Exactly one of result, killedFor and failure describes the run.
 */
struct ChildExit {
    std::optional<ExecutionResult> result;  ///< reported by the child
    std::optional<LimitKind> killedFor;     ///< limit that ended it unreported
    std::string failure;                    ///< host-side failure otherwise
    ResourceUsage usage;                    ///< from the reaped child
    bool engineFault{false};  ///< child invalidated its helper engine
};

/**
 * @brief What the child sends back when its body returns
 */
struct ChildReport {
    ExecutionResult result;
    bool engineFault{false};
};

class IsolatedRunner : public NonCopyable {
public:
    using Body = std::function<ChildReport(std::shared_ptr<HostEndpoint> host)>;

    IsolatedRunner(const ResourceLimits& limits, std::chrono::seconds killGrace);

    /**
     * @brief Fork, run body in the child and supervise it
     *
     * Must be called with the GIL held; the GIL is released while the
     * child runs. body runs only in the child and must not return
     * through any frame of the caller, the child exits right after it.
     */
    [[nodiscard]] auto run(HostEndpoint& host, const Body& body) -> ChildExit;

private:
    ResourceLimits limits_;
    std::chrono::seconds killGrace_;
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_ISOLATED_RUNNER_HPP
