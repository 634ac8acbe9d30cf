/*
 * test_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "config/sections/sandbox_config.hpp"
#include "sandbox/types.hpp"

using namespace assay::sandbox;
using assay::config::SandboxConfig;

class ExecutionRequestTest : public ::testing::Test {
protected:
    SandboxConfig config;
};

TEST_F(ExecutionRequestTest, MissingLimitsTakeConfiguredDefaults) {
    config.defaultTimeoutSeconds = 12;
    auto request = ExecutionRequest::fromJson({{"code", "print(1)"}}, config);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->code, "print(1)");
    EXPECT_EQ(request->limits.timeoutSeconds, 12);
    EXPECT_EQ(request->limits.memoryLimitMb, 512);
    EXPECT_EQ(request->limits.cpuLimitSeconds, 60);
    EXPECT_EQ(request->limits.maxRecursionDepth, 100);
    EXPECT_TRUE(request->captureOutput);
    EXPECT_TRUE(request->returnVariables.empty());
    EXPECT_FALSE(request->dataQuery.has_value());
    EXPECT_TRUE(request->adjustedLimits.empty());
}

TEST_F(ExecutionRequestTest, OutOfRangeLimitsAreClamped) {
    auto request = ExecutionRequest::fromJson({{"code", "x = 1"},
                                               {"timeout_seconds", 0},
                                               {"memory_limit_mb", 100000},
                                               {"cpu_limit_seconds", 301},
                                               {"max_recursion_depth", 10}},
                                              config);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->limits.timeoutSeconds, bounds::kMinTimeoutSeconds);
    EXPECT_EQ(request->limits.memoryLimitMb, bounds::kMaxMemoryMb);
    EXPECT_EQ(request->limits.cpuLimitSeconds, bounds::kMaxCpuSeconds);
    EXPECT_EQ(request->limits.maxRecursionDepth, bounds::kMinRecursionDepth);
    EXPECT_EQ(request->adjustedLimits,
              (std::vector<std::string>{"timeout_seconds", "memory_limit_mb",
                                        "cpu_limit_seconds",
                                        "max_recursion_depth"}));
}

TEST_F(ExecutionRequestTest, LimitsBeyondTheIntRangeAreClampedNotWrapped) {
    auto request = ExecutionRequest::fromJson({{"code", "x = 1"},
                                               {"timeout_seconds", 4294967297LL},
                                               {"memory_limit_mb", 1e20},
                                               {"cpu_limit_seconds", -4294967295LL},
                                               {"max_recursion_depth", 2147483648LL}},
                                              config);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->limits.timeoutSeconds, bounds::kMaxTimeoutSeconds);
    EXPECT_EQ(request->limits.memoryLimitMb, bounds::kMaxMemoryMb);
    EXPECT_EQ(request->limits.cpuLimitSeconds, bounds::kMinCpuSeconds);
    EXPECT_EQ(request->limits.maxRecursionDepth, bounds::kMaxRecursionDepth);
    EXPECT_EQ(request->adjustedLimits,
              (std::vector<std::string>{"timeout_seconds", "memory_limit_mb",
                                        "cpu_limit_seconds",
                                        "max_recursion_depth"}));
}

TEST_F(ExecutionRequestTest, IntegralFloatsAreAcceptedFractionalRejected) {
    auto whole = ExecutionRequest::fromJson(
        {{"code", "x = 1"}, {"timeout_seconds", 10.0}}, config);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->limits.timeoutSeconds, 10);
    EXPECT_TRUE(whole->adjustedLimits.empty());

    auto fractional = ExecutionRequest::fromJson(
        {{"code", "x = 1"}, {"timeout_seconds", 2.5}}, config);
    ASSERT_FALSE(fractional.has_value());
    EXPECT_EQ(fractional.error().field, "timeout_seconds");

    auto text = ExecutionRequest::fromJson(
        {{"code", "x = 1"}, {"memory_limit_mb", "64"}}, config);
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().field, "memory_limit_mb");
}

TEST_F(ExecutionRequestTest, HugeDataQueryLimitSaturates) {
    auto request = ExecutionRequest::fromJson(
        {{"code", "x = 1"},
         {"data_query", {{"source", "Customer"}, {"limit", 2147483648LL}}}},
        config);
    ASSERT_TRUE(request.has_value());
    ASSERT_TRUE(request->dataQuery.has_value());
    EXPECT_GT(request->dataQuery->limit, 0);
}

TEST_F(ExecutionRequestTest, BoundaryValuesAreKept) {
    auto request = ExecutionRequest::fromJson({{"code", "x = 1"},
                                               {"timeout_seconds", 300},
                                               {"memory_limit_mb", 64},
                                               {"max_recursion_depth", 500}},
                                              config);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->limits.timeoutSeconds, 300);
    EXPECT_EQ(request->limits.memoryLimitMb, 64);
    EXPECT_EQ(request->limits.maxRecursionDepth, 500);
    EXPECT_TRUE(request->adjustedLimits.empty());
}

TEST_F(ExecutionRequestTest, InvalidRequests) {
    auto empty = ExecutionRequest::fromJson({{"code", ""}}, config);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().field, "code");

    EXPECT_FALSE(ExecutionRequest::fromJson(json::object(), config).has_value());
    EXPECT_FALSE(ExecutionRequest::fromJson(json::array(), config).has_value());

    auto badType = ExecutionRequest::fromJson(
        {{"code", "x = 1"}, {"timeout_seconds", "forever"}}, config);
    ASSERT_FALSE(badType.has_value());
    EXPECT_EQ(badType.error().field, "timeout_seconds");

    auto badNames = ExecutionRequest::fromJson(
        {{"code", "x = 1"}, {"return_variables", "x"}}, config);
    EXPECT_FALSE(badNames.has_value());
}

TEST_F(ExecutionRequestTest, DataQueryIsParsed) {
    auto request = ExecutionRequest::fromJson(
        {{"code", "print(len(data))"},
         {"return_variables", {"total"}},
         {"data_query",
          {{"source", "Invoice"},
           {"filters", {{"status", "Paid"}}},
           {"fields", {"name", "amount"}},
           {"limit", 25}}}},
        config);
    ASSERT_TRUE(request.has_value());
    ASSERT_TRUE(request->dataQuery.has_value());
    EXPECT_EQ(request->dataQuery->source, "Invoice");
    EXPECT_EQ(request->dataQuery->limit, 25);
    EXPECT_EQ(request->returnVariables, std::vector<std::string>{"total"});

    auto payload = request->dataQuery->toJson();
    EXPECT_EQ(payload["filters"]["status"], "Paid");
    EXPECT_EQ(payload["fields"].size(), 2u);

    auto noSource = ExecutionRequest::fromJson(
        {{"code", "x = 1"}, {"data_query", {{"filters", json::object()}}}},
        config);
    ASSERT_FALSE(noSource.has_value());
    EXPECT_EQ(noSource.error().field, "data_query");

    auto badLimit = ExecutionRequest::fromJson(
        {{"code", "x = 1"}, {"data_query", {{"source", "Invoice"}, {"limit", 0}}}},
        config);
    EXPECT_FALSE(badLimit.has_value());
}

TEST(ResultTypesTest, ExecutionResultJsonShape) {
    ExecutionResult result;
    result.success = false;
    result.output = "partial\n";
    result.variables = {{"total", "42"}};
    ErrorInfo error;
    error.kind = ErrorKind::TimeoutExceeded;
    error.message = "timed out";
    error.limit = 5;
    error.limitUnit = "seconds";
    error.hints = hintsFor(ErrorKind::TimeoutExceeded, 5);
    result.error = error;
    result.executionTime = std::chrono::milliseconds(5012);

    auto j = result.toJson();
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["output"], "partial\n");
    EXPECT_EQ(j["variables"]["total"], "42");
    EXPECT_EQ(j["error"]["kind"], "TimeoutExceeded");
    EXPECT_EQ(j["error"]["limit"], 5);
    EXPECT_EQ(j["error"]["limit_unit"], "seconds");
    EXPECT_EQ(j["execution_time_ms"], 5012);
    EXPECT_FALSE(j.contains("traceback"));
}

TEST(ResultTypesTest, ResultRebuiltFromChildReport) {
    json report = {{"success", false},
                   {"output", "line\n"},
                   {"variables", {{"x", "1"}}},
                   {"execution_time_ms", 250},
                   {"metadata", {{"output_bytes", 5}}},
                   {"error",
                    {{"kind", "CpuLimitExceeded"},
                     {"message", "CPU time limit of 2 seconds exceeded."},
                     {"hints", {"reduce work"}},
                     {"limit", 2},
                     {"limit_unit", "seconds"}}},
                   {"traceback", "Traceback ..."}};

    auto result = ExecutionResult::fromJson(report);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "line\n");
    EXPECT_EQ(result.variables.at("x"), "1");
    EXPECT_EQ(result.executionTime.count(), 250);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::CpuLimitExceeded);
    EXPECT_EQ(result.error->limit.value_or(0), 2);
    EXPECT_EQ(result.traceback.value_or(""), "Traceback ...");
    EXPECT_EQ(result.metadata["output_bytes"], 5);

    EXPECT_EQ(errorKindFromString("NoSuchKind"),
              ErrorKind::UnhandledRuntimeFailure);
    EXPECT_THROW(static_cast<void>(ExecutionResult::fromJson({{"output", 1}})),
                 json::exception);
}

TEST(ResultTypesTest, SecurityViolationJsonShape) {
    SecurityViolation violation;
    violation.matchedPattern = "import os";
    violation.category = "process_network";
    violation.message = "Importing system modules is not allowed";
    violation.line = 3;
    violation.hints = {"use the tools"};

    auto j = violation.toJson();
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["error"]["kind"], "SecurityViolation");
    EXPECT_EQ(j["error"]["line"], 3);
    EXPECT_EQ(j["error"]["matched_pattern"], "import os");
}

TEST(ResultTypesTest, EveryErrorKindHasHints) {
    for (auto kind :
         {ErrorKind::SecurityViolation, ErrorKind::TimeoutExceeded,
          ErrorKind::MemoryLimitExceeded, ErrorKind::CpuLimitExceeded,
          ErrorKind::RecursionLimitExceeded, ErrorKind::ToolCallFailure,
          ErrorKind::UnhandledRuntimeFailure, ErrorKind::InvalidRequest}) {
        EXPECT_FALSE(hintsFor(kind).empty()) << errorKindToString(kind);
    }
    auto memory = hintsFor(ErrorKind::MemoryLimitExceeded, 256);
    EXPECT_NE(memory.front().find("256"), std::string::npos);
}

TEST(ResultTypesTest, LimitKindMapping) {
    EXPECT_EQ(limitKindToErrorKind(LimitKind::Cpu), ErrorKind::CpuLimitExceeded);
    EXPECT_EQ(limitUnit(LimitKind::Memory), "MB");
    EXPECT_EQ(limitUnit(LimitKind::Recursion), "frames");
    ResourceLimits limits{7, 128, 9, 60};
    EXPECT_EQ(limits.valueOf(LimitKind::Timeout), 7);
    EXPECT_EQ(limits.valueOf(LimitKind::Recursion), 60);
}
