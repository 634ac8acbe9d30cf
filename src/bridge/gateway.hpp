/*
 * gateway.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file gateway.hpp
 * @brief Outbound interfaces to the business-data platform and audit store
 *
 * Every gateway operation returns a JSON object of the form
 * {"success": true, "data": ...} or
 * {"success": false, "error": "...", "error_type": "..."}.
 * Implementations enforce the caller's permissions themselves.
 */

#ifndef ASSAY_BRIDGE_GATEWAY_HPP
#define ASSAY_BRIDGE_GATEWAY_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "atom/type/json.hpp"

#include "tools/descriptor.hpp"

namespace spdlog {
class logger;
}

namespace assay::bridge {

using json = nlohmann::json;
using tools::CallerContext;

/**
 * @brief Record fetch parameters
 */
struct RecordQuery {
    std::string source;
    json filters = json::object();
    std::vector<std::string> fields;
    int limit{100};
};

/**
 * @brief Background report job reference
 */
struct ReportJob {
    std::string jobId;
    std::string status;  ///< "queued", "running", "completed" or "failed"
};

class PlatformGateway {
public:
    virtual ~PlatformGateway() = default;

    virtual auto fetchRecords(const CallerContext& caller,
                              const RecordQuery& query) -> json = 0;

    virtual auto fetchRecord(const CallerContext& caller,
                             const std::string& source,
                             const std::string& id) -> json = 0;

    /**
     * @brief Start or fetch a report
     *
     * A report that runs in the background answers with data.status
     * "queued" or "running" and data.job_id; a completed one carries
     * data.result and data.columns.
     */
    virtual auto runReport(const CallerContext& caller,
                           const std::string& name,
                           const json& filters) -> json = 0;

    /**
     * @brief Status (and, once complete, the result) of a background job
     */
    virtual auto reportJob(const CallerContext& caller,
                           const std::string& jobId) -> json = 0;

    virtual auto describeReport(const CallerContext& caller,
                                const std::string& name) -> json = 0;

    virtual auto listReports(const CallerContext& caller,
                             const std::optional<std::string>& module,
                             const std::optional<std::string>& type)
        -> json = 0;

    virtual auto search(const CallerContext& caller, const std::string& query,
                        const std::optional<std::string>& source,
                        int limit) -> json = 0;

    virtual auto describeSchema(const CallerContext& caller,
                                const std::string& source) -> json = 0;

    /**
     * @brief Run a read-only statement with bound parameters
     *
     * Implementations must refuse anything but a read.
     */
    virtual auto executeReadQuery(const CallerContext& caller,
                                  const std::string& statement,
                                  const json& params) -> json = 0;
};

/**
 * @brief One sandbox execution, as recorded for audit
 */
struct AuditRecord {
    std::string user;
    std::string codeSnippet;
    long long durationMs{0};
    bool success{false};
    json resourceUsage = json::object();
    std::string outcome;  ///< "completed", an ErrorKind name, or "rejected"

    [[nodiscard]] auto toJson() const -> json;
};

class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void record(const AuditRecord& record) = 0;
};

/**
 * @brief Writes audit records as JSON through the "assay.audit" logger
 */
class LoggingAuditSink : public AuditSink {
public:
    LoggingAuditSink();
    explicit LoggingAuditSink(std::shared_ptr<spdlog::logger> logger);

    void record(const AuditRecord& record) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Success envelope
 */
[[nodiscard]] auto okResult(json data) -> json;

/**
 * @brief Failure envelope
 */
[[nodiscard]] auto errorResult(std::string_view message,
                               std::string_view errorType) -> json;

/**
 * @brief Whether a gateway reply is a well-formed success
 */
[[nodiscard]] auto isSuccess(const json& reply) -> bool;

}  // namespace assay::bridge

#endif  // ASSAY_BRIDGE_GATEWAY_HPP
