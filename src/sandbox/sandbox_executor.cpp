/*
 * sandbox_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_executor.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

#include "bridge/tool_bridge.hpp"
#include "execution_context.hpp"
#ifndef _WIN32
#include "isolated_runner.hpp"
#endif

namespace assay::sandbox {

namespace {

auto elapsedSince(std::chrono::steady_clock::time_point start)
    -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

auto bridgeOptions(const config::SandboxConfig& config)
    -> bridge::BridgeOptions {
    bridge::BridgeOptions options;
    options.reportWait = std::chrono::seconds(config.reportWaitSeconds);
    options.reportPollInterval =
        std::chrono::milliseconds(config.reportPollIntervalMs);
    options.maxQueryRows = config.maxQueryRows;
    return options;
}

/**
 * Limits in force for a child killed by the parent. The wall clock and
 * the hard CPU cap are enforced from outside the child.
 */
auto killedEnforcement(const ResourceLimiter& limiter) -> EnforcementReport {
    EnforcementReport report;
    report.limiter = std::string(limiter.name());
    for (auto kind : {LimitKind::Recursion, LimitKind::Timeout, LimitKind::Cpu,
                      LimitKind::Memory}) {
        if (kind == LimitKind::Timeout || kind == LimitKind::Cpu ||
            limiter.supports(kind)) {
            report.enforced.push_back(kind);
        } else {
            report.skipped.emplace_back(kind, "not supported by limiter");
        }
    }
    return report;
}

}  // namespace

SandboxExecutor::SandboxExecutor(
    std::shared_ptr<RuntimeContext> runtime,
    std::shared_ptr<bridge::PlatformGateway> gateway,
    std::shared_ptr<bridge::AuditSink> audit,
    std::shared_ptr<ResourceLimiter> limiter)
    : runtime_(std::move(runtime)),
      gateway_(std::move(gateway)),
      audit_(audit ? std::move(audit)
                   : std::make_shared<bridge::LoggingAuditSink>()),
      governor_(limiter ? std::move(limiter)
                        : createPlatformLimiter(runtime_->config().limiterMode())) {
    const auto& patterns = runtime_->config().denyPatternsPath;
    if (!patterns.empty()) {
        scanner_.loadRules(patterns);
    }
#ifdef _WIN32
    if (runtime_->config().isolationMode() == config::IsolationMode::Process) {
        spdlog::warn("Process isolation is not available, running inline");
    }
#endif
    spdlog::info("Sandbox executor ready (limiter: {}, isolation: {})",
                 governor_.limiter().name(), isolated() ? "process" : "inline");
}

auto SandboxExecutor::execute(const ExecutionRequest& request,
                              const tools::CallerContext& caller)
    -> std::expected<ExecutionResult, SecurityViolation> {
    const auto start = std::chrono::steady_clock::now();
    spdlog::debug("Sandbox request from {} ({} bytes of code)", caller.user,
                  request.code.size());

    if (auto approved = scanner_.scan(request.code); !approved) {
        audit(caller, request, elapsedSince(start).count(), false,
              json::object(), std::string(errorKindToString(
                                  ErrorKind::SecurityViolation)));
        return std::unexpected(approved.error());
    }

    ExecutionResult result = runApproved(request, caller);

    const std::string outcome =
        result.success ? std::string("completed")
                       : std::string(errorKindToString(
                             result.error ? result.error->kind
                                          : ErrorKind::UnhandledRuntimeFailure));
    audit(caller, request, result.executionTime.count(), result.success,
          result.metadata.value("resource_usage", json::object()), outcome);

    spdlog::info("Sandbox run for {} finished: {} in {} ms", caller.user,
                 outcome, result.executionTime.count());
    return result;
}

auto SandboxExecutor::runApproved(const ExecutionRequest& request,
                                  const tools::CallerContext& caller)
    -> ExecutionResult {
    const auto start = std::chrono::steady_clock::now();
    auto bridge = std::make_shared<bridge::ToolBridge>(
        gateway_, caller, bridgeOptions(runtime_->config()));

    try {
        std::optional<json> prefetch;
        if (request.dataQuery) {
            prefetch = bridge->call("fetch_records", request.dataQuery->toJson());
        }
        bridge->setDeadline(std::chrono::steady_clock::now() +
                            std::chrono::seconds(request.limits.timeoutSeconds));
        auto host = std::make_shared<BridgeEndpoint>(bridge);

        py::gil_scoped_acquire gil;
        ExecutionResult result =
            isolated()
                ? runIsolated(request, std::move(host), std::move(prefetch), start)
                : runInline(request, std::move(host), std::move(prefetch), start);
        bridge->close();
        result.metadata["isolation"] = isolated() ? "process" : "inline";
        return result;
    } catch (const std::exception& e) {
        bridge->close();
        return assembler_.hostFailure(request, e.what(), elapsedSince(start));
    }
}

auto SandboxExecutor::runInline(const ExecutionRequest& request,
                                std::shared_ptr<HostEndpoint> host,
                                std::optional<json> prefetch,
                                std::chrono::steady_clock::time_point start)
    -> ExecutionResult {
    auto capture = std::make_shared<OutputCapture>(
        runtime_->config().outputCeilingBytes, request.captureOutput);
    ExecutionContext context(
        *runtime_, request,
        RunBindings{capture, std::move(host), std::move(prefetch)});
    const InterpreterHooks hooks = context.hooks();

    auto run = governor_.run(request.limits, hooks,
                             [&context] { return context.execute(); });
    return assembler_.assemble(request, run, *capture, elapsedSince(start));
}

#ifndef _WIN32

auto SandboxExecutor::runIsolated(const ExecutionRequest& request,
                                  std::shared_ptr<HostEndpoint> host,
                                  std::optional<json> prefetch,
                                  std::chrono::steady_clock::time_point start)
    -> ExecutionResult {
    const auto& config = runtime_->config();

    // Build the engine here so every child inherits it ready
    runtime_->engine();
    const auto generation = runtime_->generation();

    IsolatedRunner runner(request.limits,
                          std::chrono::seconds(config.killGraceSeconds));
    ChildExit child = runner.run(
        *host, [&](std::shared_ptr<HostEndpoint> childHost) {
            ChildReport report;
            report.result =
                runInline(request, std::move(childHost), prefetch, start);
            report.engineFault = runtime_->generation() != generation;
            return report;
        });

    if (child.engineFault) {
        runtime_->invalidate();
    }

    ExecutionResult result;
    if (child.result) {
        result = std::move(*child.result);
    } else if (child.killedFor) {
        OutputCapture empty(config.outputCeilingBytes, request.captureOutput);
        GovernedRun<ScriptOutcome> run{
            std::unexpected(makeViolation(*child.killedFor, request.limits)),
            killedEnforcement(governor_.limiter()), child.usage};
        result = assembler_.assemble(request, run, empty, elapsedSince(start));
        result.metadata["terminated"] = true;
        spdlog::warn("Sandbox run terminated by the host: {} limit",
                     limitKindToString(*child.killedFor));
    } else {
        result = assembler_.hostFailure(request, child.failure,
                                        elapsedSince(start));
    }
    result.executionTime = elapsedSince(start);
    return result;
}

#else

auto SandboxExecutor::runIsolated(const ExecutionRequest& request,
                                  std::shared_ptr<HostEndpoint> host,
                                  std::optional<json> prefetch,
                                  std::chrono::steady_clock::time_point start)
    -> ExecutionResult {
    return runInline(request, std::move(host), std::move(prefetch), start);
}

#endif

auto SandboxExecutor::isolated() const -> bool {
#ifdef _WIN32
    return false;
#else
    return runtime_->config().isolationMode() == config::IsolationMode::Process;
#endif
}

void SandboxExecutor::audit(const tools::CallerContext& caller,
                            const ExecutionRequest& request,
                            long long durationMs, bool success,
                            json resourceUsage, std::string outcome) noexcept {
    try {
        bridge::AuditRecord record;
        record.user = caller.user;
        const size_t limit = runtime_->config().auditSnippetChars;
        record.codeSnippet = request.code.substr(
            0, utf8SafePrefix(request.code, limit));
        record.durationMs = durationMs;
        record.success = success;
        record.resourceUsage = std::move(resourceUsage);
        record.outcome = std::move(outcome);
        audit_->record(record);
    } catch (const std::exception& e) {
        spdlog::error("Audit record for {} could not be written: {}",
                      caller.user, e.what());
    }
}

}  // namespace assay::sandbox
