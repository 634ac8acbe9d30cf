/*
 * test_host_endpoint.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-09

Description: Request frames from an isolated run are served against the
run's tool bridge

**************************************************/

#include <gtest/gtest.h>

#include "bridge/fake_gateway.hpp"
#include "sandbox/host_endpoint.hpp"

using namespace assay::sandbox;
using assay::test::FakeGateway;

class HostEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway = std::make_shared<FakeGateway>();
        assay::bridge::BridgeOptions options;
        options.maxQueryRows = 50;
        endpoint = std::make_unique<BridgeEndpoint>(
            std::make_shared<assay::bridge::ToolBridge>(gateway, caller,
                                                        options));
    }

    assay::bridge::CallerContext caller{"analyst@example.com", {"Analyst"}};
    std::shared_ptr<FakeGateway> gateway;
    std::unique_ptr<BridgeEndpoint> endpoint;
};

TEST_F(HostEndpointTest, CallFramesReachTheBridge) {
    auto reply = serveRequest(
        *endpoint, encodeCall("fetch_records",
                              {{"source", "Customer"}, {"limit", 1}}));
    ASSERT_TRUE(reply["success"].get<bool>()) << reply.dump();
    EXPECT_EQ(reply["data"].size(), 1u);
    EXPECT_EQ(gateway->lastQuery.source, "Customer");
}

TEST_F(HostEndpointTest, DescribeListsTheBridgeFunctions) {
    auto reply = serveRequest(*endpoint, encodeDescribe());
    ASSERT_TRUE(reply.is_array());
    EXPECT_EQ(reply.size(), 7u);
}

TEST_F(HostEndpointTest, DataFramesReachTheProxy) {
    gateway->queryRows = json::array({{{"credit_limit", 5000}}});
    auto value = serveRequest(
        *endpoint,
        encodeData("get_value", {{"source", "Customer"},
                                 {"filters", {{"name", "CUST-001"}}},
                                 {"field", "credit_limit"}}));
    EXPECT_EQ(value["data"], 5000);
    EXPECT_EQ(gateway->statements.back(),
              "SELECT `credit_limit` FROM `Customer` WHERE `name` = ? LIMIT 1");

    auto query = serveRequest(
        *endpoint,
        encodeData("query", {{"statement", "SELECT name FROM `tabCustomer`"},
                             {"params", json::array()}}));
    EXPECT_TRUE(query["success"].get<bool>()) << query.dump();

    auto refused = serveRequest(
        *endpoint, encodeData("query", {{"statement", "DELETE FROM `tabCustomer`"}}));
    EXPECT_FALSE(refused["success"].get<bool>());
    EXPECT_EQ(refused["error_type"], "SecurityViolation");
}

TEST_F(HostEndpointTest, UnknownRequestsGetErrorEnvelopes) {
    auto unknownOp = serveRequest(*endpoint, {{"op", "shell"}});
    EXPECT_FALSE(unknownOp["success"].get<bool>());
    EXPECT_EQ(unknownOp["error_type"], "ToolCallFailure");

    auto notAnObject = serveRequest(*endpoint, json::array({1, 2}));
    EXPECT_FALSE(notAnObject["success"].get<bool>());

    auto unknownData = serveRequest(*endpoint, encodeData("drop", json::object()));
    EXPECT_FALSE(unknownData["success"].get<bool>());
    EXPECT_EQ(unknownData["error_type"], "QueryError");
    EXPECT_TRUE(gateway->statements.empty());
}
