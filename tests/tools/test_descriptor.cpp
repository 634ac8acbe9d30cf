/*
 * test_descriptor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <climits>
#include <limits>
#include <stdexcept>

#include "tools/descriptor.hpp"

using namespace assay::tools;

namespace {

auto echoTool(std::string name, std::vector<std::string> roles = {})
    -> ToolDescriptor {
    ToolDescriptor descriptor;
    descriptor.name = std::move(name);
    descriptor.description = "Echo the arguments back";
    descriptor.inputSchema = {
        {"type", "object"},
        {"properties",
         {{"text", {{"type", "string"}}},
          {"count", {{"type", "integer"}, {"minimum", 1}, {"maximum", 10}}},
          {"mode", {{"type", "string"}, {"enum", {"plain", "loud"}}}},
          {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}}}}},
        {"required", {"text"}},
        {"additionalProperties", false}};
    descriptor.requiredRoles = std::move(roles);
    descriptor.handler = [](const json& args, const CallerContext& caller) {
        return json{{"text", args["text"]}, {"user", caller.user}};
    };
    return descriptor;
}

}  // namespace

class ToolCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(catalog.registerTool(echoTool("echo")).has_value());
    }

    ToolCatalog catalog;
    CallerContext analyst{"analyst@example.com", {"Analyst"}};
};

TEST_F(ToolCatalogTest, InvokeRunsHandler) {
    auto result = catalog.invoke("echo", {{"text", "hi"}}, analyst);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["text"], "hi");
    EXPECT_EQ((*result)["user"], "analyst@example.com");
}

TEST_F(ToolCatalogTest, DuplicateAndIncompleteRegistrationsAreRefused) {
    auto duplicate = catalog.registerTool(echoTool("echo"));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, ToolError::AlreadyRegistered);

    ToolDescriptor nameless = echoTool("");
    EXPECT_EQ(catalog.registerTool(nameless).error().code,
              ToolError::InvalidArguments);

    ToolDescriptor noHandler = echoTool("silent");
    noHandler.handler = nullptr;
    EXPECT_FALSE(catalog.registerTool(noHandler).has_value());
    EXPECT_FALSE(catalog.contains("silent"));
}

TEST_F(ToolCatalogTest, UnknownTool) {
    auto result = catalog.invoke("nope", json::object(), analyst);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ToolError::ToolNotFound);
}

TEST_F(ToolCatalogTest, ArgumentsAreValidatedBeforeTheHandler) {
    auto missing = catalog.invoke("echo", json::object(), analyst);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ToolError::InvalidArguments);
    EXPECT_NE(missing.error().message.find("text"), std::string::npos);

    EXPECT_FALSE(catalog.invoke("echo", {{"text", 5}}, analyst).has_value());
    EXPECT_FALSE(
        catalog.invoke("echo", {{"text", "a"}, {"count", 0}}, analyst).has_value());
    EXPECT_FALSE(
        catalog.invoke("echo", {{"text", "a"}, {"count", 11}}, analyst).has_value());
    EXPECT_FALSE(
        catalog.invoke("echo", {{"text", "a"}, {"mode", "quiet"}}, analyst)
            .has_value());
    EXPECT_FALSE(catalog
                     .invoke("echo", {{"text", "a"}, {"tags", {"x", 1}}},
                             analyst)
                     .has_value());
    EXPECT_FALSE(
        catalog.invoke("echo", {{"text", "a"}, {"extra", true}}, analyst)
            .has_value());
}

TEST_F(ToolCatalogTest, NullOptionalArgumentCountsAsAbsent) {
    auto result =
        catalog.invoke("echo", {{"text", "a"}, {"count", nullptr}}, analyst);
    EXPECT_TRUE(result.has_value());

    auto nullRequired = catalog.invoke("echo", {{"text", nullptr}}, analyst);
    EXPECT_FALSE(nullRequired.has_value());
}

TEST_F(ToolCatalogTest, RolesAreEnforced) {
    ASSERT_TRUE(
        catalog.registerTool(echoTool("admin_echo", {"System Manager"}))
            .has_value());

    auto denied = catalog.invoke("admin_echo", {{"text", "x"}}, analyst);
    ASSERT_FALSE(denied.has_value());
    EXPECT_EQ(denied.error().code, ToolError::PermissionDenied);
    EXPECT_EQ(toolErrorToString(denied.error().code), "PermissionError");

    CallerContext admin{"admin", {"System Manager"}};
    EXPECT_TRUE(catalog.invoke("admin_echo", {{"text", "x"}}, admin).has_value());
}

TEST_F(ToolCatalogTest, ThrowingHandlerBecomesInvocationFailure) {
    ToolDescriptor failing = echoTool("failing");
    failing.handler = [](const json&, const CallerContext&) -> json {
        throw std::runtime_error("backend unavailable");
    };
    ASSERT_TRUE(catalog.registerTool(failing).has_value());

    auto result = catalog.invoke("failing", {{"text", "x"}}, analyst);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ToolError::InvocationFailed);
    EXPECT_NE(result.error().message.find("backend unavailable"),
              std::string::npos);
}

TEST_F(ToolCatalogTest, ListingCarriesSchemas) {
    ASSERT_TRUE(catalog.registerTool(echoTool("another")).has_value());
    EXPECT_EQ(catalog.names(), (std::vector<std::string>{"another", "echo"}));

    auto listing = catalog.list();
    ASSERT_EQ(listing.size(), 2u);
    EXPECT_EQ(listing[1]["name"], "echo");
    EXPECT_EQ(listing[1]["inputSchema"]["required"][0], "text");
}

TEST(ValidateArgumentsTest, UnionTypes) {
    json schema = {
        {"type", "object"},
        {"properties", {{"id", {{"type", json::array({"string", "integer"})}}}}}};
    EXPECT_TRUE(validateArguments(schema, {{"id", "CUST-1"}}).has_value());
    EXPECT_TRUE(validateArguments(schema, {{"id", 42}}).has_value());
    EXPECT_FALSE(validateArguments(schema, {{"id", 4.5}}).has_value());
    EXPECT_FALSE(validateArguments(schema, json::array()).has_value());
}

TEST(IntegerValueTest, SaturatesInsteadOfWrapping) {
    EXPECT_EQ(integerValue(json(42)).value(), 42);
    EXPECT_EQ(integerValue(json(-7)).value(), -7);
    EXPECT_EQ(integerValue(json(2147483648LL)).value(), INT_MAX);
    EXPECT_EQ(integerValue(json(4294967297LL)).value(), INT_MAX);
    EXPECT_EQ(integerValue(json(-4294967297LL)).value(), INT_MIN);
    EXPECT_EQ(integerValue(json(18446744073709551615ULL)).value(), INT_MAX);
    EXPECT_EQ(integerValue(json(1e20)).value(), INT_MAX);
    EXPECT_EQ(integerValue(json(-1e20)).value(), INT_MIN);
    EXPECT_EQ(integerValue(json(8.0)).value(), 8);
}

TEST(IntegerValueTest, RejectsNonIntegers) {
    EXPECT_FALSE(integerValue(json(2.5)).has_value());
    EXPECT_FALSE(integerValue(json(std::numeric_limits<double>::infinity()))
                     .has_value());
    EXPECT_FALSE(integerValue(json("12")).has_value());
    EXPECT_FALSE(integerValue(json(true)).has_value());
}

TEST(CallerContextTest, EmptyRoleListAllowsEveryone) {
    CallerContext guest{"guest", {}};
    EXPECT_TRUE(guest.hasAnyRole({}));
    EXPECT_FALSE(guest.hasAnyRole({"Accounts User"}));
}
