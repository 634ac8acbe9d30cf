/*
 * sandbox_tool.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file sandbox_tool.hpp
 * @brief The code-execution tool as the protocol layer sees it
 */

#ifndef ASSAY_SANDBOX_SANDBOX_TOOL_HPP
#define ASSAY_SANDBOX_SANDBOX_TOOL_HPP

#include <memory>
#include <string_view>

#include "sandbox_executor.hpp"
#include "tools/descriptor.hpp"

namespace assay::sandbox {

inline constexpr std::string_view kSandboxToolName = "run_python_code";

/**
 * @brief JSON input schema of the tool
 */
[[nodiscard]] auto sandboxToolSchema() -> json;

/**
 * @brief Descriptor whose handler parses the arguments into an
 * ExecutionRequest and runs it
 *
 * The handler answers with ExecutionResult::toJson(), the violation's
 * toJson() when the scanner rejects the code, or an InvalidRequest
 * error when the arguments cannot form a request.
 */
[[nodiscard]] auto makeSandboxTool(std::shared_ptr<SandboxExecutor> executor)
    -> tools::ToolDescriptor;

/**
 * @brief Register the tool in a catalog
 */
[[nodiscard]] auto registerSandboxTool(tools::ToolCatalog& catalog,
                                       std::shared_ptr<SandboxExecutor> executor)
    -> tools::ToolResult<void>;

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_SANDBOX_TOOL_HPP
