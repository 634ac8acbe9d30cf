/*
 * sql_guard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sql_guard.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace assay::bridge::sql {

namespace {

auto isWordChar(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto toUpper(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return out;
}

auto trimRight(std::string_view text) -> std::string_view {
    while (!text.empty() &&
           std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

auto stripComments(std::string_view statement) -> std::string {
    std::string out;
    out.reserve(statement.size());
    char quote = '\0';
    for (size_t i = 0; i < statement.size(); ++i) {
        char c = statement[i];
        if (quote != '\0') {
            out += c;
            if (c == '\\' && i + 1 < statement.size()) {
                out += statement[++i];
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            out += c;
            continue;
        }
        if (c == '#' ||
            (c == '-' && i + 1 < statement.size() && statement[i + 1] == '-')) {
            while (i < statement.size() && statement[i] != '\n') {
                ++i;
            }
            out += ' ';
            continue;
        }
        if (c == '/' && i + 1 < statement.size() && statement[i + 1] == '*') {
            auto end = statement.find("*/", i + 2);
            i = end == std::string_view::npos ? statement.size() : end + 1;
            out += ' ';
            continue;
        }
        out += c;
    }
    return out;
}

auto findKeyword(std::string_view text,
                 std::span<const std::string_view> keywords)
    -> std::optional<std::string> {
    const std::string upper = toUpper(text);
    for (auto keyword : keywords) {
        size_t pos = 0;
        while ((pos = upper.find(keyword, pos)) != std::string::npos) {
            bool startOk = pos == 0 || !isWordChar(upper[pos - 1]);
            size_t end = pos + keyword.size();
            bool endOk = end >= upper.size() || !isWordChar(upper[end]);
            if (startOk && endOk) {
                return std::string(keyword);
            }
            pos = end;
        }
    }
    return std::nullopt;
}

auto hasStatementSeparator(std::string_view statement) -> bool {
    auto trimmed = trimRight(statement);
    if (!trimmed.empty() && trimmed.back() == ';') {
        trimmed.remove_suffix(1);
    }
    return trimmed.find(';') != std::string_view::npos;
}

auto leadingVerb(std::string_view statement) -> std::string {
    const std::string cleaned = stripComments(statement);
    size_t start = 0;
    while (start < cleaned.size() &&
           (std::isspace(static_cast<unsigned char>(cleaned[start])) != 0 ||
            cleaned[start] == '(')) {
        ++start;
    }
    size_t end = start;
    while (end < cleaned.size() && isWordChar(cleaned[end])) {
        ++end;
    }
    return toUpper(std::string_view(cleaned).substr(start, end - start));
}

auto looksLikeQuery(std::string_view text) -> bool {
    const std::string verb = leadingVerb(text);
    if (!verb.empty()) {
        for (auto v : kReadVerbs) {
            if (verb == v) {
                return true;
            }
        }
        for (auto v : kProxyDeniedKeywords) {
            if (verb == v) {
                return true;
            }
        }
    }
    static const std::regex clauseShape(
        R"(\b(from|into|join)\s+[`"\w]|\btable\s+[`"\w]|\bset\s+\w+\s*=)",
        std::regex::icase);
    return std::regex_search(text.begin(), text.end(), clauseShape);
}

auto isSafeIdentifier(std::string_view name) -> bool {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    if (std::isspace(static_cast<unsigned char>(name.front())) != 0 ||
        std::isspace(static_cast<unsigned char>(name.back())) != 0) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return isWordChar(c) || c == ' ' || c == '-';
    });
}

}  // namespace assay::bridge::sql
