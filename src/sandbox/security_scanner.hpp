/*
 * security_scanner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file security_scanner.hpp
 * @brief Lexical deny-list check run before any submitted code executes
 *
 * The scanner works on raw source text. It is one layer of several:
 * string building, attribute tricks or encodings it does not recognise
 * are expected to be stopped by the restricted builtins, the import
 * guard and the read-only data proxy at run time.
 */

#ifndef ASSAY_SANDBOX_SECURITY_SCANNER_HPP
#define ASSAY_SANDBOX_SECURITY_SCANNER_HPP

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "atom/error/exception.hpp"
#include "atom/type/noncopyable.hpp"

#include "types.hpp"

namespace assay::sandbox {

class InvalidRuleException : public atom::error::Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_RULE(...)                                          \
    throw assay::sandbox::InvalidRuleException(ATOM_FILE_NAME,           \
                                               ATOM_FILE_LINE,           \
                                               ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Rule categories
 */
namespace category {
inline constexpr const char* kDynamicEvaluation = "dynamic_evaluation";
inline constexpr const char* kFileAccess = "file_access";
inline constexpr const char* kProcessNetwork = "process_network";
inline constexpr const char* kFrameworkTampering = "framework_tampering";
inline constexpr const char* kDataMutation = "data_mutation";
inline constexpr const char* kObfuscation = "obfuscation";
}  // namespace category

/**
 * @brief One deny-list entry, matched case-insensitively per line
 */
struct DenyRule {
    std::string id;
    std::string category;
    std::string pattern;  ///< ECMAScript regular expression
    std::string reason;
};

class SecurityScannerImpl;

class SecurityScanner : public NonCopyable {
public:
    /**
     * @brief Scanner with the built-in deny-list only
     */
    SecurityScanner();

    /**
     * @brief Scanner with the built-in deny-list plus rules from a file
     *
     * The file holds {"python_danger_patterns": [{"pattern", "reason",
     * "category"}]}.
     *
     * @throws InvalidRuleException on unreadable files or bad patterns
     */
    explicit SecurityScanner(const std::filesystem::path& rulesFile);

    ~SecurityScanner() override;

    /**
     * @brief Check code against the deny-list
     * @return Nothing when approved, the first violation otherwise
     */
    [[nodiscard]] auto scan(const std::string& code) const
        -> std::expected<void, SecurityViolation>;

    /**
     * @brief Every violation found, for diagnostics
     */
    [[nodiscard]] auto scanAll(const std::string& code) const
        -> std::vector<SecurityViolation>;

    /**
     * @brief Add a rule at runtime
     * @throws InvalidRuleException if the pattern does not compile or a
     *         field is empty
     */
    void addRule(const DenyRule& rule);

    /**
     * @brief Load additional rules from a JSON file
     * @throws InvalidRuleException
     */
    void loadRules(const std::filesystem::path& rulesFile);

    [[nodiscard]] auto rules() const -> std::vector<DenyRule>;

private:
    std::unique_ptr<SecurityScannerImpl> impl_;
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_SECURITY_SCANNER_HPP
