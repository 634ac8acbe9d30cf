/*
 * fake_gateway.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: In-memory platform gateway and gmock doubles shared by the
bridge and sandbox tests

**************************************************/

#ifndef ASSAY_TESTS_BRIDGE_FAKE_GATEWAY_HPP
#define ASSAY_TESTS_BRIDGE_FAKE_GATEWAY_HPP

#include <gmock/gmock.h>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "bridge/gateway.hpp"

namespace assay::test {

using json = nlohmann::json;
using bridge::CallerContext;
using bridge::errorResult;
using bridge::okResult;

/**
 * @brief Platform with a few record sources, reports and a query table
 *
 * Users listed in deniedSources cannot read those sources. Reports with
 * pendingPolls > 0 run in the background; each reportJob() call counts
 * one poll down. A finished report is cached and returned directly by
 * later runReport() calls.
 */
class FakeGateway : public bridge::PlatformGateway {
public:
    struct Report {
        json rows = json::array();
        json columns = json::array();
        int pendingPolls{0};
        bool fails{false};
    };

    FakeGateway() {
        records["Customer"] = json::array({
            {{"name", "CUST-001"}, {"customer_name", "Acme"},
             {"territory", "North"}, {"credit_limit", 5000}},
            {{"name", "CUST-002"}, {"customer_name", "Globex"},
             {"territory", "South"}, {"credit_limit", 12000}},
            {{"name", "CUST-003"}, {"customer_name", "Initech"},
             {"territory", "North"}, {"credit_limit", 800}},
        });
        records["Invoice"] = json::array({
            {{"name", "INV-1"}, {"customer", "CUST-001"}, {"amount", 100.5},
             {"status", "Paid"}},
            {{"name", "INV-2"}, {"customer", "CUST-001"}, {"amount", 250},
             {"status", "Unpaid"}},
            {{"name", "INV-3"}, {"customer", "CUST-002"}, {"amount", 75},
             {"status", "Paid"}},
        });
        reports["Sales Summary"] = {
            json::array({{{"territory", "North"}, {"total", 350.5}},
                         {{"territory", "South"}, {"total", 75}}}),
            json::array({"territory", "total"}), 0, false};
    }

    auto fetchRecords(const CallerContext& caller, const bridge::RecordQuery& query)
        -> json override {
        std::lock_guard lock(mutex);
        ++fetchCalls;
        lastQuery = query;
        if (denied(caller, query.source)) {
            return errorResult("Not permitted to read " + query.source,
                               "PermissionError");
        }
        auto it = records.find(query.source);
        if (it == records.end()) {
            return errorResult("Unknown source " + query.source,
                               "DoesNotExistError");
        }
        json rows = json::array();
        for (const auto& row : it->second) {
            if (!matches(row, query.filters)) {
                continue;
            }
            if (static_cast<int>(rows.size()) >= query.limit) {
                break;
            }
            rows.push_back(project(row, query.fields));
        }
        return okResult(rows);
    }

    auto fetchRecord(const CallerContext& caller, const std::string& source,
                     const std::string& id) -> json override {
        std::lock_guard lock(mutex);
        if (denied(caller, source)) {
            return errorResult("Not permitted to read " + source,
                               "PermissionError");
        }
        auto it = records.find(source);
        if (it != records.end()) {
            for (const auto& row : it->second) {
                if (row.value("name", "") == id) {
                    return okResult(row);
                }
            }
        }
        return errorResult(source + " " + id + " not found",
                           "DoesNotExistError");
    }

    auto runReport(const CallerContext& caller, const std::string& name,
                   const json& /*filters*/) -> json override {
        std::lock_guard lock(mutex);
        ++reportRuns;
        if (denied(caller, name)) {
            return errorResult("Not permitted to run " + name,
                               "PermissionError");
        }
        auto it = reports.find(name);
        if (it == reports.end()) {
            return errorResult("Report " + name + " not found",
                               "DoesNotExistError");
        }
        if (completedReports.contains(name) || it->second.pendingPolls == 0) {
            return okResult(finished(it->second));
        }
        const std::string jobId = "job-" + name;
        jobs[jobId] = name;
        return okResult({{"status", "queued"}, {"job_id", jobId}});
    }

    auto reportJob(const CallerContext& /*caller*/, const std::string& jobId)
        -> json override {
        std::lock_guard lock(mutex);
        ++jobPolls;
        auto job = jobs.find(jobId);
        if (job == jobs.end()) {
            return errorResult("Unknown job " + jobId, "DoesNotExistError");
        }
        auto& report = reports[job->second];
        if (report.pendingPolls > 0) {
            --report.pendingPolls;
        }
        if (report.pendingPolls > 0) {
            return okResult({{"status", "running"}, {"job_id", jobId}});
        }
        completedReports.insert(job->second);
        return okResult(finished(report));
    }

    auto describeReport(const CallerContext& /*caller*/, const std::string& name)
        -> json override {
        std::lock_guard lock(mutex);
        auto it = reports.find(name);
        if (it == reports.end()) {
            return errorResult("Report " + name + " not found",
                               "DoesNotExistError");
        }
        return okResult({{"name", name},
                         {"columns", it->second.columns},
                         {"filter_guidance",
                          json::array({"company is required"})}});
    }

    auto listReports(const CallerContext& /*caller*/,
                     const std::optional<std::string>& module,
                     const std::optional<std::string>& /*type*/)
        -> json override {
        std::lock_guard lock(mutex);
        lastReportModule = module;
        json names = json::array();
        for (const auto& [name, report] : reports) {
            names.push_back({{"name", name}, {"module", "Selling"}});
        }
        return okResult(names);
    }

    auto search(const CallerContext& /*caller*/, const std::string& query,
                const std::optional<std::string>& source, int limit)
        -> json override {
        std::lock_guard lock(mutex);
        lastSearchLimit = limit;
        json hits = json::array();
        for (const auto& [name, rows] : records) {
            if (source && *source != name) {
                continue;
            }
            for (const auto& row : rows) {
                if (row.dump().find(query) != std::string::npos) {
                    hits.push_back({{"source", name}, {"name", row["name"]}});
                }
            }
        }
        return okResult(hits);
    }

    auto describeSchema(const CallerContext& /*caller*/, const std::string& source)
        -> json override {
        std::lock_guard lock(mutex);
        auto it = records.find(source);
        if (it == records.end() || it->second.empty()) {
            return errorResult("Unknown source " + source, "DoesNotExistError");
        }
        json fields = json::array();
        for (const auto& [key, value] : it->second.front().items()) {
            fields.push_back({{"fieldname", key}});
        }
        return okResult({{"source", source}, {"fields", fields}});
    }

    auto executeReadQuery(const CallerContext& caller,
                          const std::string& statement, const json& params)
        -> json override {
        std::lock_guard lock(mutex);
        statements.push_back(statement);
        lastParams = params;
        if (denied(caller, "query")) {
            return errorResult("Queries are not permitted", "PermissionError");
        }
        if (queryFails) {
            return errorResult("Unknown column 'nope'", "OperationalError");
        }
        return okResult(queryRows);
    }

    std::mutex mutex;
    std::map<std::string, json> records;
    std::map<std::string, Report> reports;
    std::map<std::string, std::string> jobs;
    std::set<std::string> completedReports;
    std::map<std::string, std::set<std::string>> deniedSources;

    json queryRows = json::array({{{"count", 3}}});
    bool queryFails{false};
    std::vector<std::string> statements;
    json lastParams;

    bridge::RecordQuery lastQuery;
    std::optional<std::string> lastReportModule;
    int lastSearchLimit{0};
    int fetchCalls{0};
    int reportRuns{0};
    int jobPolls{0};

private:
    auto denied(const CallerContext& caller, const std::string& what) const
        -> bool {
        auto it = deniedSources.find(caller.user);
        return it != deniedSources.end() && it->second.contains(what);
    }

    static auto matches(const json& row, const json& filters) -> bool {
        if (!filters.is_object()) {
            return true;
        }
        for (const auto& [key, value] : filters.items()) {
            if (!row.contains(key) || row[key] != value) {
                return false;
            }
        }
        return true;
    }

    static auto project(const json& row, const std::vector<std::string>& fields)
        -> json {
        if (fields.empty()) {
            return row;
        }
        json out = json::object();
        for (const auto& field : fields) {
            if (row.contains(field)) {
                out[field] = row[field];
            }
        }
        return out;
    }

    static auto finished(const Report& report) -> json {
        if (report.fails) {
            return {{"status", "failed"}, {"error", "report query failed"}};
        }
        return {{"status", "completed"},
                {"result", report.rows},
                {"columns", report.columns}};
    }
};

class MockGateway : public bridge::PlatformGateway {
public:
    MOCK_METHOD(json, fetchRecords,
                (const CallerContext&, const bridge::RecordQuery&), (override));
    MOCK_METHOD(json, fetchRecord,
                (const CallerContext&, const std::string&, const std::string&),
                (override));
    MOCK_METHOD(json, runReport,
                (const CallerContext&, const std::string&, const json&),
                (override));
    MOCK_METHOD(json, reportJob, (const CallerContext&, const std::string&),
                (override));
    MOCK_METHOD(json, describeReport,
                (const CallerContext&, const std::string&), (override));
    MOCK_METHOD(json, listReports,
                (const CallerContext&, const std::optional<std::string>&,
                 const std::optional<std::string>&),
                (override));
    MOCK_METHOD(json, search,
                (const CallerContext&, const std::string&,
                 const std::optional<std::string>&, int),
                (override));
    MOCK_METHOD(json, describeSchema,
                (const CallerContext&, const std::string&), (override));
    MOCK_METHOD(json, executeReadQuery,
                (const CallerContext&, const std::string&, const json&),
                (override));
};

class MockAuditSink : public bridge::AuditSink {
public:
    MOCK_METHOD(void, record, (const bridge::AuditRecord&), (override));
};

/**
 * @brief Audit sink that keeps every record
 */
class RecordingAuditSink : public bridge::AuditSink {
public:
    void record(const bridge::AuditRecord& record) override {
        std::lock_guard lock(mutex);
        records.push_back(record);
    }

    auto last() -> bridge::AuditRecord {
        std::lock_guard lock(mutex);
        return records.back();
    }

    std::mutex mutex;
    std::vector<bridge::AuditRecord> records;
};

}  // namespace assay::test

#endif  // ASSAY_TESTS_BRIDGE_FAKE_GATEWAY_HPP
