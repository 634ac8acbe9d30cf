/*
 * test_output_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "sandbox/output_manager.hpp"

using namespace assay::sandbox;
using namespace std::chrono_literals;

TEST(Utf8PrefixTest, NeverSplitsASequence) {
    const std::string text = "h\xC3\xA9llo";  // "héllo"
    EXPECT_EQ(utf8SafePrefix(text, 100), text.size());
    EXPECT_EQ(utf8SafePrefix(text, 1), 1u);
    EXPECT_EQ(utf8SafePrefix(text, 2), 1u);
    EXPECT_EQ(utf8SafePrefix(text, 3), 3u);

    const std::string euro = "\xE2\x82\xAC\xE2\x82\xAC";  // two euro signs
    EXPECT_EQ(utf8SafePrefix(euro, 4), 3u);
    EXPECT_EQ(utf8SafePrefix(euro, 2), 0u);
}

TEST(TruncationTest, MarkerReportsCeilingAndOriginalSize) {
    EXPECT_EQ(truncationMarker(10240, 20480),
              "\n\n... [OUTPUT TRUNCATED - exceeded 10KB limit. Original size: "
              "20KB (20480 bytes)]");

    EXPECT_EQ(truncateOutput("short", 10), "short");
    const std::string cut = truncateOutput(std::string(50, 'x'), 10);
    EXPECT_EQ(cut.substr(0, 10), std::string(10, 'x'));
    EXPECT_NE(cut.find("(50 bytes)"), std::string::npos);
}

TEST(OutputBufferTest, KeepsPrefixAndCountsEverything) {
    OutputBuffer buffer(8);
    buffer.write("hello ");
    buffer.write("world!");
    buffer.write("more");
    EXPECT_EQ(buffer.contents(), "hello wo");
    EXPECT_EQ(buffer.totalBytes(), 16u);
    EXPECT_TRUE(buffer.truncated());
    EXPECT_NE(buffer.render().find("(16 bytes)"), std::string::npos);

    buffer.clear();
    EXPECT_EQ(buffer.totalBytes(), 0u);
    EXPECT_FALSE(buffer.truncated());
    buffer.write("ok");
    EXPECT_EQ(buffer.render(), "ok");
}

TEST(OutputCaptureTest, StderrFollowsSeparator) {
    OutputCapture capture(1024, true);
    capture.write(OutputStream::Stdout, "out\n");
    capture.write(OutputStream::Stderr, "warn\n");
    capture.write(OutputStream::Stdout, "more\n");
    EXPECT_EQ(capture.render(), "out\nmore\n\n--- stderr ---\nwarn\n");
    EXPECT_EQ(capture.totalBytes(), 14u);
    EXPECT_FALSE(capture.truncated());
}

TEST(OutputCaptureTest, CeilingAppliesToCombinedOutput) {
    OutputCapture capture(16, true);
    capture.write(OutputStream::Stdout, "0123456789");
    capture.write(OutputStream::Stderr, "abcdef");
    EXPECT_TRUE(capture.truncated());
    const std::string rendered = capture.render();
    EXPECT_EQ(rendered.substr(0, 16), "0123456789\n--- s");
    EXPECT_NE(rendered.find("OUTPUT TRUNCATED"), std::string::npos);
}

TEST(OutputCaptureTest, DisabledCaptureDropsWrites) {
    OutputCapture capture(1024, false);
    capture.write(OutputStream::Stdout, "ignored");
    EXPECT_FALSE(capture.enabled());
    EXPECT_EQ(capture.render(), "");
    EXPECT_EQ(capture.totalBytes(), 0u);
}

class ResultAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        request.code = "x = 1";
        request.limits = {5, 256, 10, 80};
        request.adjustedLimits = {"timeout_seconds"};
        enforcement.limiter = "posix";
        enforcement.enforced = {LimitKind::Recursion, LimitKind::Timeout};
        enforcement.skipped = {{LimitKind::Memory, "not supported by limiter"}};
        capture.write(OutputStream::Stdout, "done\n");
    }

    ExecutionRequest request;
    EnforcementReport enforcement;
    OutputCapture capture{1024, true};
    ResultAssembler assembler;
};

TEST_F(ResultAssemblerTest, CompletedRun) {
    ScriptOutcome outcome;
    outcome.variables = {{"x", "1"}};
    outcome.helpers = {"pd", "np"};
    GovernedRun<ScriptOutcome> run{outcome, enforcement, ResourceUsage{}};

    auto result = assembler.assemble(request, run, capture, 42ms);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "done\n");
    EXPECT_EQ(result.variables.at("x"), "1");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.executionTime, 42ms);

    EXPECT_EQ(result.metadata["limits"]["timeout_seconds"], 5);
    EXPECT_EQ(result.metadata["adjusted_limits"][0], "timeout_seconds");
    EXPECT_EQ(result.metadata["enforced_limits"]["limiter"], "posix");
    EXPECT_EQ(result.metadata["enforced_limits"]["skipped"]["memory"],
              "not supported by limiter");
    EXPECT_EQ(result.metadata["output_bytes"], 5);
    EXPECT_FALSE(result.metadata["output_truncated"].get<bool>());
    EXPECT_EQ(result.metadata["helpers"].size(), 2u);
}

TEST_F(ResultAssemblerTest, RaisedErrorKeepsVariablesAndTraceback) {
    ScriptOutcome outcome;
    outcome.variables = {{"partial", "[1, 2]"}};
    outcome.raised = RaisedError{"ZeroDivisionError", "division by zero",
                                 "Traceback (most recent call last):\n..."};
    GovernedRun<ScriptOutcome> run{outcome, enforcement, ResourceUsage{}};

    auto result = assembler.assemble(request, run, capture, 3ms);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::UnhandledRuntimeFailure);
    EXPECT_EQ(result.error->message, "ZeroDivisionError: division by zero");
    EXPECT_EQ(result.traceback.value_or(""),
              "Traceback (most recent call last):\n...");
    EXPECT_EQ(result.variables.at("partial"), "[1, 2]");
    EXPECT_EQ(result.output, "done\n");
}

TEST_F(ResultAssemblerTest, LimitViolationCarriesLimitAndUnit) {
    LimitViolation violation{LimitKind::Timeout, 5, "timed out", {"simplify"}};
    GovernedRun<ScriptOutcome> run{std::unexpected(violation), enforcement,
                                   ResourceUsage{}};

    auto result = assembler.assemble(request, run, capture, 5001ms);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::TimeoutExceeded);
    EXPECT_EQ(result.error->limit.value_or(0), 5);
    EXPECT_EQ(result.error->limitUnit, "seconds");
    EXPECT_EQ(result.error->hints, std::vector<std::string>{"simplify"});
    EXPECT_TRUE(result.variables.empty());
    EXPECT_EQ(result.output, "done\n");
    EXPECT_FALSE(result.traceback.has_value());
}

TEST_F(ResultAssemblerTest, HostFailure) {
    auto result = assembler.hostFailure(request, "interpreter unavailable", 1ms);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::UnhandledRuntimeFailure);
    EXPECT_EQ(result.error->message, "interpreter unavailable");
    EXPECT_FALSE(result.error->hints.empty());
    EXPECT_TRUE(result.metadata.contains("limits"));
}
