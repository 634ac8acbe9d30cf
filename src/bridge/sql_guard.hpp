/*
 * sql_guard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file sql_guard.hpp
 * @brief Lexical checks for read-only data queries
 *
 * Shared by the security scanner (query-shaped string literals in
 * submitted code) and the read-only data proxy (statements handed to
 * db.query at run time).
 */

#ifndef ASSAY_BRIDGE_SQL_GUARD_HPP
#define ASSAY_BRIDGE_SQL_GUARD_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace assay::bridge::sql {

/**
 * @brief Keywords that make an embedded query string a mutation
 */
inline constexpr std::string_view kMutatingKeywords[] = {
    "DELETE", "DROP", "INSERT", "UPDATE", "ALTER", "CREATE", "TRUNCATE", "EXEC"};

/**
 * @brief Mutating keywords plus the privilege, procedure and file verbs
 * the proxy also refuses
 */
inline constexpr std::string_view kProxyDeniedKeywords[] = {
    "DELETE", "DROP",    "INSERT",  "UPDATE", "ALTER",    "CREATE",
    "TRUNCATE", "EXEC",  "EXECUTE", "GRANT",  "REVOKE",   "REPLACE",
    "MERGE",  "CALL",    "RENAME",  "OUTFILE", "DUMPFILE", "LOAD_FILE",
    "LOCK",   "HANDLER"};

/**
 * @brief Statement verbs accepted as read-only
 */
inline constexpr std::string_view kReadVerbs[] = {
    "SELECT", "WITH", "SHOW", "DESCRIBE", "DESC", "EXPLAIN"};

/**
 * @brief Remove SQL comments (-- line, # line and block comments)
 *
 * Quoted text is kept verbatim so comment markers inside literals are
 * not treated as comments.
 */
[[nodiscard]] auto stripComments(std::string_view statement) -> std::string;

/**
 * @brief First keyword from the list appearing as a whole word
 *
 * Case-insensitive; a word boundary is anything outside [A-Za-z0-9_].
 */
[[nodiscard]] auto findKeyword(std::string_view text,
                               std::span<const std::string_view> keywords)
    -> std::optional<std::string>;

/**
 * @brief Whether a statement separator appears anywhere except as a
 * single trailing terminator
 */
[[nodiscard]] auto hasStatementSeparator(std::string_view statement) -> bool;

/**
 * @brief Upper-cased first word of the statement (after comments)
 */
[[nodiscard]] auto leadingVerb(std::string_view statement) -> std::string;

/**
 * @brief Heuristic: does this text read as a data query?
 *
 * True when it starts with a read or mutating verb, or contains a
 * FROM/INTO/TABLE/SET clause shape.
 */
[[nodiscard]] auto looksLikeQuery(std::string_view text) -> bool;

/**
 * @brief Whether a string is a safe bare identifier (source, field)
 */
[[nodiscard]] auto isSafeIdentifier(std::string_view name) -> bool;

}  // namespace assay::bridge::sql

#endif  // ASSAY_BRIDGE_SQL_GUARD_HPP
