/*
 * test_execution_isolation.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-18

Description: Runs must not see each other's state, and every run must
leave the interpreter as it found it

**************************************************/

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <utility>

#include <pybind11/embed.h>
#include <sys/resource.h>

#include "bridge/fake_gateway.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "sandbox/test_runtime.hpp"

namespace py = pybind11;

using namespace assay::sandbox;
using assay::test::FakeGateway;
using assay::test::makeRequest;
using assay::tools::CallerContext;

class ExecutionIsolationTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor = std::make_unique<SandboxExecutor>(
            assay::test::runtime(), std::make_shared<FakeGateway>(),
            std::make_shared<assay::test::RecordingAuditSink>());
    }

    auto run(const std::string& code, json extra = json::object())
        -> ExecutionResult {
        auto result = executor->execute(makeRequest(code, std::move(extra)), caller);
        if (!result) {
            ADD_FAILURE() << "rejected: " << result.error().message;
            return {};
        }
        return *result;
    }

    static auto recursionLimit() -> int {
        py::gil_scoped_acquire gil;
        return Py_GetRecursionLimit();
    }

    CallerContext caller{"analyst@example.com", {}};
    std::unique_ptr<SandboxExecutor> executor;
};

TEST_F(ExecutionIsolationTest, GlobalsDoNotLeakBetweenRuns) {
    auto first = run("leaked = 42\ndef helper():\n    return 1");
    ASSERT_TRUE(first.success);

    auto second = run(R"(
try:
    leaked
    state = 'visible'
except NameError:
    state = 'gone'
try:
    helper
    fn = 'visible'
except NameError:
    fn = 'gone'
)",
                      {{"return_variables", {"state", "fn"}}});
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.variables.at("state"), "gone");
    EXPECT_EQ(second.variables.at("fn"), "gone");
}

TEST_F(ExecutionIsolationTest, FailedMutationLeavesModulesIntact) {
    auto attempt = run("math.pi = 3");
    EXPECT_FALSE(attempt.success);

    auto check = run("value = math.pi", {{"return_variables", {"value"}}});
    ASSERT_TRUE(check.success);
    EXPECT_EQ(check.variables.at("value"), "3.141592653589793");
}

TEST_F(ExecutionIsolationTest, InterpreterLimitsAreRestored) {
    const int before = recursionLimit();

    run("x = 1", {{"max_recursion_depth", 75}});
    EXPECT_EQ(recursionLimit(), before);

    run("def dive(n):\n    return dive(n + 1)\n\ndive(0)",
        {{"max_recursion_depth", 50}});
    EXPECT_EQ(recursionLimit(), before);

    run("while True:\n    pass", {{"timeout_seconds", 1}});
    EXPECT_EQ(recursionLimit(), before);

    // Deep but legal recursion works again after a limited run
    auto deep = run("def depth(n):\n    return 0 if n == 0 else 1 + depth(n - 1)\n"
                    "d = depth(400)",
                    {{"max_recursion_depth", 500}, {"return_variables", {"d"}}});
    ASSERT_TRUE(deep.success) << deep.toJson().dump();
    EXPECT_EQ(deep.variables.at("d"), "400");
}

TEST_F(ExecutionIsolationTest, StreamsAreRestoredAfterRuns) {
    run("print('inside')");
    py::gil_scoped_acquire gil;
    auto sys = py::module_::import("sys");
    EXPECT_NE(py::str(sys.attr("stdout").get_type().attr("__name__"))
                  .cast<std::string>(),
              "OutputSink");
}

TEST_F(ExecutionIsolationTest, OutputBelongsToOneRun) {
    auto first = run("print('first run')");
    auto second = run("print('second run')");
    EXPECT_EQ(first.output, "first run\n");
    EXPECT_EQ(second.output, "second run\n");
}

TEST_F(ExecutionIsolationTest, RunAfterInterruptIsClean) {
    auto interrupted = run("while True:\n    pass", {{"timeout_seconds", 1}});
    ASSERT_TRUE(interrupted.error.has_value());
    EXPECT_EQ(interrupted.error->kind, ErrorKind::TimeoutExceeded);

    auto next = run("import time\nt0 = time.monotonic()\ntotal = sum(range(100000))",
                    {{"return_variables", {"total"}}});
    ASSERT_TRUE(next.success) << next.toJson().dump();
    EXPECT_EQ(next.variables.at("total"), "4999950000");
}

TEST_F(ExecutionIsolationTest, HelperEngineIsRebuiltAfterInvalidate) {
    auto runtime = assay::test::runtime();
    run("x = 1");
    const auto generation = runtime->generation();

    {
        py::gil_scoped_acquire gil;
        runtime->invalidate();
    }
    auto result = run("y = sum([1, 2, 3])", {{"return_variables", {"y"}}});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.variables.at("y"), "6");
    EXPECT_EQ(runtime->generation(), generation + 1);

    run("z = 2");
    EXPECT_EQ(runtime->generation(), generation + 1);
}

/**
 * Same guarantees when runs share the calling process.
 */
class InlineExecutionTest : public ExecutionIsolationTest {
protected:
    void SetUp() override {
        auto config = assay::test::sandboxTestConfig();
        config.isolation = "inline";
        runtime = std::make_shared<RuntimeContext>(config);
        executor = std::make_unique<SandboxExecutor>(
            runtime, std::make_shared<FakeGateway>(),
            std::make_shared<assay::test::RecordingAuditSink>());
    }

    void TearDown() override {
        executor.reset();
        runtime.reset();
    }

    static auto currentLimit(int resource) -> std::pair<rlim_t, rlim_t> {
        struct rlimit limit {};
        EXPECT_EQ(getrlimit(resource, &limit), 0);
        return {limit.rlim_cur, limit.rlim_max};
    }

    std::shared_ptr<RuntimeContext> runtime;
};

TEST_F(InlineExecutionTest, RunsInTheCallingProcess) {
    auto result = run("value = 2 ** 10", {{"return_variables", {"value"}}});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.variables.at("value"), "1024");
    EXPECT_EQ(result.metadata["isolation"], "inline");
    EXPECT_FALSE(result.metadata.contains("terminated"));
}

TEST_F(InlineExecutionTest, LoopCatchingEveryExceptionStillTimesOut) {
    const auto start = std::chrono::steady_clock::now();
    auto result = run(R"(
caught = 0
while True:
    try:
        while True:
            pass
    except BaseException:
        caught += 1
)",
                      {{"timeout_seconds", 1}});
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::TimeoutExceeded);

    auto next = run("total = sum(range(10))", {{"return_variables", {"total"}}});
    ASSERT_TRUE(next.success) << next.toJson().dump();
    EXPECT_EQ(next.variables.at("total"), "45");
}

TEST_F(InlineExecutionTest, ProcessLimitsAreRestoredAfterLimitedRuns) {
    const auto addressSpace = currentLimit(RLIMIT_AS);
    const auto cpu = currentLimit(RLIMIT_CPU);
    const int depth = recursionLimit();

    auto limited = run("blob = bytearray(1024 * 1024 * 1024)",
                       {{"memory_limit_mb", 64}});
    const auto& enforced = limited.metadata["enforced_limits"]["enforced"];
    if (std::find(enforced.begin(), enforced.end(), "memory") != enforced.end()) {
        ASSERT_TRUE(limited.error.has_value());
        EXPECT_EQ(limited.error->kind, ErrorKind::MemoryLimitExceeded);
    }
    EXPECT_EQ(currentLimit(RLIMIT_AS), addressSpace);
    EXPECT_EQ(currentLimit(RLIMIT_CPU), cpu);
    EXPECT_EQ(recursionLimit(), depth);

    auto next = run("chunk = bytearray(8 * 1024 * 1024)\nsize = len(chunk)",
                    {{"return_variables", {"size"}}});
    ASSERT_TRUE(next.success) << next.toJson().dump();
    EXPECT_EQ(next.variables.at("size"), "8388608");
}
