/*
 * test_data_proxy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "bridge/data_proxy.hpp"
#include "bridge/fake_gateway.hpp"

using namespace assay::bridge;
using assay::test::FakeGateway;
using assay::test::MockGateway;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class DataProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway = std::make_shared<FakeGateway>();
        proxy = std::make_unique<DataProxy>(gateway, caller, 2);
    }

    CallerContext caller{"analyst@example.com", {"Analyst"}};
    std::shared_ptr<FakeGateway> gateway;
    std::unique_ptr<DataProxy> proxy;
};

TEST_F(DataProxyTest, QueryForwardsStatementAndParams) {
    auto reply = proxy->query("SELECT name FROM `tabCustomer` WHERE territory = ?",
                              json::array({"North"}));
    EXPECT_TRUE(reply["success"].get<bool>());
    EXPECT_EQ(reply["count"], 1);
    EXPECT_FALSE(reply["truncated"].get<bool>());
    ASSERT_EQ(gateway->statements.size(), 1u);
    EXPECT_EQ(gateway->lastParams, json::array({"North"}));
}

TEST_F(DataProxyTest, RowsAreCappedAtMaxRows) {
    gateway->queryRows = json::array({{{"a", 1}}, {{"a", 2}}, {{"a", 3}}});
    auto reply = proxy->query("SELECT a FROM t");
    EXPECT_EQ(reply["data"].size(), 2u);
    EXPECT_EQ(reply["count"], 2);
    EXPECT_TRUE(reply["truncated"].get<bool>());
}

TEST_F(DataProxyTest, RejectedStatementNeverReachesGateway) {
    for (const char* statement :
         {"DELETE FROM `tabCustomer`", "SELECT 1; DROP TABLE t",
          "SELECT * FROM t WHERE x = (UPDATE t SET y = 1)"}) {
        auto reply = proxy->query(statement);
        EXPECT_FALSE(reply["success"].get<bool>()) << statement;
        EXPECT_EQ(reply["error_type"], "SecurityViolation");
        EXPECT_TRUE(reply["security_violation"].get<bool>());
    }
    EXPECT_TRUE(gateway->statements.empty());
}

TEST_F(DataProxyTest, GatewayFailuresAreQueryErrors) {
    gateway->queryFails = true;
    auto reply = proxy->query("SELECT nope FROM t");
    EXPECT_FALSE(reply["success"].get<bool>());
    EXPECT_EQ(reply["error_type"], "QueryError");
    EXPECT_FALSE(reply.contains("security_violation"));
}

TEST_F(DataProxyTest, PermissionErrorsKeepTheirType) {
    gateway->deniedSources["analyst@example.com"] = {"query"};
    auto reply = proxy->query("SELECT 1");
    EXPECT_EQ(reply["error_type"], "PermissionError");
}

TEST_F(DataProxyTest, ParamsMustBeListOrDict) {
    auto reply = proxy->query("SELECT ?", json("x"));
    EXPECT_FALSE(reply["success"].get<bool>());
    EXPECT_EQ(reply["error_type"], "QueryError");
    EXPECT_TRUE(proxy->query("SELECT %(a)s", {{"a", 1}})["success"].get<bool>());
}

TEST_F(DataProxyTest, ExistsCompilesLimitOneQuery) {
    auto reply = proxy->exists("Customer", {{"territory", "North"}});
    EXPECT_TRUE(reply["success"].get<bool>());
    EXPECT_TRUE(reply["data"].get<bool>());
    ASSERT_EQ(gateway->statements.size(), 1u);
    EXPECT_EQ(gateway->statements.back(),
              "SELECT 1 FROM `Customer` WHERE `territory` = ? LIMIT 1");

    gateway->queryRows = json::array();
    EXPECT_FALSE(proxy->exists("Customer", json::object())["data"].get<bool>());
}

TEST_F(DataProxyTest, CountReadsCountColumn) {
    gateway->queryRows = json::array({{{"count", 7}}});
    auto reply = proxy->count("Invoice", {{"status", {"Paid", "Unpaid"}}});
    EXPECT_EQ(reply["data"], 7);
    EXPECT_EQ(gateway->statements.back(),
              "SELECT COUNT(*) AS `count` FROM `Invoice` WHERE `status` IN (?, ?)");

    gateway->queryRows = json::array({json::array({4})});
    EXPECT_EQ(proxy->count("Invoice", json::object())["data"], 4);
}

TEST_F(DataProxyTest, GetValueReturnsFieldOrNull) {
    gateway->queryRows = json::array({{{"credit_limit", 5000}}});
    auto reply = proxy->getValue("Customer", {{"name", "CUST-001"}}, "credit_limit");
    EXPECT_EQ(reply["data"], 5000);
    EXPECT_EQ(gateway->statements.back(),
              "SELECT `credit_limit` FROM `Customer` WHERE `name` = ? LIMIT 1");

    gateway->queryRows = json::array();
    EXPECT_TRUE(proxy->getValue("Customer", json::object(), "credit_limit")["data"]
                    .is_null());
}

TEST_F(DataProxyTest, DescribeShowsColumns) {
    gateway->queryRows = json::array({{{"Field", "name"}}});
    auto reply = proxy->describe("Customer");
    EXPECT_TRUE(reply["success"].get<bool>());
    EXPECT_EQ(gateway->statements.back(), "SHOW COLUMNS FROM `Customer`");
}

TEST_F(DataProxyTest, UnsafeIdentifiersAreSecurityRejections) {
    auto reply = proxy->count("Customer`; DROP TABLE x; --", json::object());
    EXPECT_TRUE(reply["security_violation"].get<bool>());
    EXPECT_TRUE(
        proxy->getValue("Customer", json::object(), "a,b")["security_violation"]
            .get<bool>());
    EXPECT_TRUE(gateway->statements.empty());
}

TEST_F(DataProxyTest, ClosedProxyRefusesCalls) {
    proxy->close();
    EXPECT_TRUE(proxy->closed());
    auto reply = proxy->query("SELECT 1");
    EXPECT_EQ(reply["error_type"], "BridgeClosed");
    EXPECT_TRUE(gateway->statements.empty());
}

TEST(DataProxyMockTest, GatewayExceptionBecomesQueryError) {
    auto gateway = std::make_shared<MockGateway>();
    EXPECT_CALL(*gateway, executeReadQuery(_, _, _))
        .WillOnce(Throw(std::runtime_error("connection reset")));

    DataProxy proxy(gateway, {"analyst", {}}, 100);
    auto reply = proxy.query("SELECT 1");
    EXPECT_EQ(reply["error_type"], "QueryError");
    EXPECT_EQ(reply["error"], "connection reset");
}

TEST(DataProxyMockTest, MutationIsNeverForwarded) {
    auto gateway = std::make_shared<MockGateway>();
    EXPECT_CALL(*gateway, executeReadQuery(_, _, _)).Times(0);

    DataProxy proxy(gateway, {"analyst", {}}, 100);
    EXPECT_FALSE(proxy.query("INSERT INTO t VALUES (1)")["success"].get<bool>());
    EXPECT_FALSE(
        proxy.query("select * from t; truncate t")["success"].get<bool>());
}
