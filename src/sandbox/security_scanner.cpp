/*
 * security_scanner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "security_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <regex>
#include <shared_mutex>
#include <sstream>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "atom/type/json.hpp"

#include "bridge/sql_guard.hpp"

namespace assay::sandbox {

using json = nlohmann::json;

namespace {

// clang-format off
const std::vector<DenyRule> kBuiltinRules = {
    // Dynamic evaluation
    {"eval_call", category::kDynamicEvaluation, R"((^|[^\w.])eval\s*\()",
     "Dynamic code evaluation (eval) is not allowed"},
    {"exec_call", category::kDynamicEvaluation, R"((^|[^\w.])exec\s*\()",
     "Dynamic code execution (exec) is not allowed"},
    {"compile_call", category::kDynamicEvaluation, R"((^|[^\w.])compile\s*\()",
     "Compiling code objects is not allowed"},
    {"dunder_import", category::kDynamicEvaluation, R"(__import__)",
     "Dynamic import (__import__) is not allowed"},
    {"importlib", category::kDynamicEvaluation, R"(\b(importlib|runpy|execfile|zipimport)\b)",
     "Dynamic module loading is not allowed"},

    // File access
    {"open_call", category::kFileAccess, R"((^|[^\w.])open\s*\()",
     "Opening files is not allowed"},
    {"io_open", category::kFileAccess, R"(\b(io|codecs|os)\s*\.\s*(open|fdopen)\b)",
     "Opening file handles is not allowed"},
    {"file_modules", category::kFileAccess, R"(\b(pathlib|shutil|tempfile|fileinput|glob)\s*\.)",
     "Filesystem modules are not available"},
    {"frame_file_io", category::kFileAccess,
     R"(\.\s*(read_csv|read_excel|read_json|read_parquet|read_pickle|read_sql|read_sql_query|read_sql_table|read_html|read_table|read_fwf|read_hdf|read_feather|read_orc|read_sas|read_spss|read_stata|read_xml|read_clipboard|to_pickle|to_parquet|to_excel|to_hdf|to_feather|to_stata|to_sql|to_clipboard|to_orc|savefig|imsave|imread|tofile|fromfile|loadtxt|savetxt|genfromtxt|savez|savez_compressed|memmap)\s*\()",
     "Reading or writing files through data helpers is not allowed"},
    {"frame_file_export", category::kFileAccess,
     R"(\.\s*(to_csv|to_json|to_html|to_latex|to_xml|to_markdown)\s*\(\s*(path_or_buf\s*=|buf\s*=|[rbf]?['"]|[A-Za-z_][\w.]*\s*[,)]))",
     "Writing data helpers to a path is not allowed"},
    {"numpy_file_io", category::kFileAccess, R"(\bnp\s*\.\s*(save|load)\s*\()",
     "Reading or writing array files is not allowed"},

    // Process and network
    {"restricted_import", category::kProcessNetwork,
     R"((^|[;:])\s*(import|from)\s+[\w\s,.]*?\b(os|sys|subprocess|socket|shutil|ctypes|cffi|pickle|marshal|shelve|dill|signal|threading|_thread|multiprocessing|asyncio|importlib|gc|builtins|io|pathlib|tempfile|urllib|urllib2|urllib3|requests|http|ftplib|smtplib|telnetlib|ssl|select|selectors|inspect|code|codeop|pty|resource|mmap|sqlite3|webbrowser)\b)",
     "Importing system, process or network modules is not allowed"},
    {"process_modules", category::kProcessNetwork,
     R"(\b(subprocess|socket|multiprocessing|_thread|ctypes|cffi|ftplib|smtplib|telnetlib|pty)\b)",
     "Process and network primitives are not allowed"},
    {"system_modules", category::kProcessNetwork,
     R"((^|[^\w.])(os|sys|signal|threading|urllib|asyncio|ssl)\s*\.\w)",
     "System modules are not available"},
    {"process_calls", category::kProcessNetwork,
     R"(\.\s*(system|popen|fork|spawnl|spawnle|spawnlp|spawnv|spawnve|spawnvp|posix_spawn|posix_spawnp|execv|execve|execvp|execvpe|execl|execle|execlp|execlpe|_exit|kill|killpg)\s*\(|(^|[^\w.])(popen|fork|forkpty)\s*\()",
     "Process control calls are not allowed"},
    {"environment_access", category::kProcessNetwork,
     R"(\b(environ|environb|getenv|putenv|unsetenv)\b)",
     "Reading or changing the process environment is not allowed"},
    {"filesystem_calls", category::kFileAccess,
     R"(\.\s*(listdir|scandir|unlink|rmdir|removedirs|makedirs|mkdir|chmod|chown|chdir|chroot|symlink)\s*\()",
     "Filesystem calls are not allowed"},
    {"http_client", category::kProcessNetwork,
     R"(\brequests\s*\.\s*(get|post|put|delete|patch|head|options|request|session)\b|\bhttp\s*\.\s*(client|server)\b|\burlopen\s*\()",
     "Network requests are not allowed"},

    // Framework and interpreter internals
    {"dangerous_dunder", category::kFrameworkTampering,
     R"(__(builtins|globals|subclasses|code|class|bases|base|mro|dict|getattribute|loader|spec|closure|reduce|reduce_ex|func|self|traceback|frame)__)",
     "Access to interpreter internals is not allowed"},
    {"frame_attrs", category::kFrameworkTampering,
     R"(\b(f_globals|f_locals|f_back|f_builtins|gi_frame|gi_code|cr_frame|tb_frame|co_code|func_globals)\b)",
     "Access to frames and code objects is not allowed"},
    {"reflection_calls", category::kFrameworkTampering,
     R"((^|[^\w.])(getattr|setattr|delattr|vars|globals|breakpoint|memoryview)\s*\()",
     "Reflection builtins are not available"},
    {"serialization_modules", category::kFrameworkTampering,
     R"(\b(gc|pickle|marshal|shelve|dill|copyreg|inspect|builtins)\s*\.)",
     "Interpreter and serialization modules are not available"},
    {"sandbox_internals", category::kFrameworkTampering, R"(\b_assay\w*)",
     "Sandbox internals are not accessible"},
    {"module_reexports", category::kFrameworkTampering,
     R"(\.\s*_*(os|sys|posix|nt|subprocess|builtins)\b)",
     "Reaching system modules through another module is not allowed"},
    {"interpreter_limits", category::kFrameworkTampering,
     R"(\b(setrecursionlimit|setswitchinterval|settrace|setprofile)\b)",
     "Changing interpreter limits is not allowed"},

    // Obfuscation
    {"chr_chain", category::kObfuscation,
     R"(\bchr\s*\(\s*(0x[0-9a-f]+|\d+)\s*\)\s*\+|\+\s*chr\s*\(|\.join\s*\(\s*(map\s*\(\s*chr|\[\s*chr\s*\())",
     "Building text from character codes is not allowed"},
    {"decoders", category::kObfuscation,
     R"(\bbytes\s*\.\s*fromhex\b|\b(b64decode|b32decode|b16decode|a85decode|b85decode|decodebytes|unhexlify|rot13|rot_13)\b|\bcodecs\s*\.)",
     "Decoding hidden payloads is not allowed"},
    {"reversed_literal", category::kObfuscation, R"(['"]\s*\[\s*::\s*-1\s*\])",
     "Reversed string literals are not allowed"},
};
// clang-format on

/**
 * Names that must not appear as the whole content of a string literal;
 * such strings only serve to reach a callable by name.
 */
const std::unordered_set<std::string> kRestrictedNames = {
    "eval",         "exec",        "compile",        "__import__",
    "importlib",    "subprocess",  "getattr",        "setattr",
    "delattr",      "globals",     "__builtins__",   "__globals__",
    "__subclasses__", "__code__",  "builtins",       "popen",
    "os",           "sys",         "__class__",      "__bases__",
    "__mro__",      "__dict__"};

/// Substrings that must not appear in an escape-decoded literal
const std::vector<std::string> kEncodedMarkers = {
    "eval",  "exec",    "__import__", "compile", "getattr", "setattr",
    "builtins", "globals", "subclasses", "import", "open", "system",
    "popen", "subprocess"};

auto categoryHint(const std::string& cat) -> std::string {
    if (cat == category::kFileAccess) {
        return "Files are not available; load data with fetch_records, "
               "run_report or db.query";
    }
    if (cat == category::kProcessNetwork) {
        return "Processes, threads and the network are not available; use "
               "the provided tools for platform data";
    }
    if (cat == category::kFrameworkTampering) {
        return "Interpreter internals are not accessible; use ordinary "
               "attribute access and the provided helpers";
    }
    if (cat == category::kDataMutation) {
        return "Data access is read-only; only SELECT, WITH, SHOW, DESCRIBE "
               "and EXPLAIN statements are allowed, one per call";
    }
    if (cat == category::kObfuscation) {
        return "Write code plainly; identifiers assembled from strings or "
               "character codes are rejected";
    }
    return "Remove the flagged construct and resubmit";
}

auto lineOfOffset(const std::string& text, size_t offset) -> int {
    return 1 + static_cast<int>(std::count(
                   text.begin(),
                   text.begin() + static_cast<std::ptrdiff_t>(
                                      std::min(offset, text.size())),
                   '\n'));
}

auto isSkippableLine(const std::string& line) -> bool {
    auto pos = line.find_first_not_of(" \t\r");
    return pos == std::string::npos || line[pos] == '#';
}

auto toLower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

auto trim(const std::string& text) -> std::string {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

struct StringLiteral {
    std::string body;
    size_t offset{0};
    bool raw{false};
};

/**
 * Collect string literals, honouring comments, prefixes, escapes and
 * triple quotes.
 */
auto extractLiterals(const std::string& code) -> std::vector<StringLiteral> {
    std::vector<StringLiteral> literals;
    size_t i = 0;
    const size_t n = code.size();
    while (i < n) {
        char c = code[i];
        if (c == '#') {
            while (i < n && code[i] != '\n') {
                ++i;
            }
            continue;
        }
        if (c != '\'' && c != '"') {
            ++i;
            continue;
        }

        bool raw = false;
        for (size_t back = i; back > 0 && back + 2 >= i; --back) {
            char p = static_cast<char>(
                std::tolower(static_cast<unsigned char>(code[back - 1])));
            if (p == 'r') {
                raw = true;
            } else if (p != 'b' && p != 'f' && p != 'u') {
                break;
            }
        }

        const bool triple = i + 2 < n && code[i + 1] == c && code[i + 2] == c;
        const size_t quoteLen = triple ? 3 : 1;
        const size_t start = i + quoteLen;
        size_t j = start;
        bool closed = false;
        while (j < n) {
            if (code[j] == '\\') {
                j += 2;
                continue;
            }
            if (!triple && code[j] == '\n') {
                break;
            }
            if (code[j] == c &&
                (!triple || (j + 2 < n && code[j + 1] == c && code[j + 2] == c))) {
                closed = true;
                break;
            }
            ++j;
        }
        const size_t end = std::min(j, n);
        literals.push_back({code.substr(start, end - start), i, raw});
        i = closed ? end + quoteLen : end + 1;
    }
    return literals;
}

auto hexValue(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

/**
 * Decode \xNN, \uNNNN, \UNNNNNNNN and octal escapes to ASCII. Code
 * points outside ASCII become '?', which is enough for identifier
 * matching.
 */
auto decodeEscapes(const std::string& body) -> std::string {
    std::string out;
    out.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] != '\\' || i + 1 >= body.size()) {
            out += body[i];
            continue;
        }
        char kind = body[i + 1];
        if (kind == '\\') {
            out += "\\\\";
            ++i;
            continue;
        }
        size_t digits = kind == 'x' ? 2 : kind == 'u' ? 4 : kind == 'U' ? 8 : 0;
        if (digits > 0) {
            long value = 0;
            size_t k = 0;
            for (; k < digits && i + 2 + k < body.size(); ++k) {
                int h = hexValue(body[i + 2 + k]);
                if (h < 0) {
                    break;
                }
                value = value * 16 + h;
            }
            if (k == digits) {
                out += value < 128 ? static_cast<char>(value) : '?';
                i += 1 + digits;
                continue;
            }
        } else if (kind >= '0' && kind <= '7') {
            long value = 0;
            size_t k = 0;
            for (; k < 3 && i + 1 + k < body.size() && body[i + 1 + k] >= '0' &&
                   body[i + 1 + k] <= '7';
                 ++k) {
                value = value * 8 + (body[i + 1 + k] - '0');
            }
            out += value < 128 ? static_cast<char>(value) : '?';
            i += k;
            continue;
        }
        out += body[i];
    }
    return out;
}

/**
 * Fold adjacent literals joined by '+' or juxtaposition into one
 * literal. Only same-quote pairs on one line are folded so line numbers
 * stay stable.
 */
auto foldConcatenation(const std::string& code) -> std::string {
    static const std::regex doubleJoin(R"("([ \t]*\+[ \t]*|[ \t]+)")");
    static const std::regex singleJoin(R"('([ \t]*\+[ \t]*|[ \t]+)')");
    std::string folded = std::regex_replace(code, doubleJoin, "");
    return std::regex_replace(folded, singleJoin, "");
}

}  // namespace

class SecurityScannerImpl {
public:
    SecurityScannerImpl() {
        for (const auto& rule : kBuiltinRules) {
            rules_.push_back(compile(rule));
        }
    }

    void addRule(const DenyRule& rule) {
        if (rule.pattern.empty() || rule.category.empty()) {
            THROW_INVALID_RULE("Pattern and category cannot be empty");
        }
        auto compiled = compile(rule);
        std::unique_lock lock(mutex_);
        rules_.push_back(std::move(compiled));
    }

    void loadRules(const std::filesystem::path& rulesFile) {
        std::ifstream file(rulesFile);
        if (!file.is_open()) {
            THROW_INVALID_RULE("Unable to open deny-list file: " +
                               rulesFile.string());
        }
        json config;
        try {
            file >> config;
        } catch (const json::parse_error& e) {
            THROW_INVALID_RULE("Invalid JSON format in deny-list file " +
                               rulesFile.string() + ": " + e.what());
        }

        const auto& patterns = config.contains("python_danger_patterns")
                                   ? config["python_danger_patterns"]
                                   : config;
        if (!patterns.is_array()) {
            THROW_INVALID_RULE("Deny-list file must hold an array of rules: " +
                               rulesFile.string());
        }

        size_t index = 0;
        for (const auto& item : patterns) {
            DenyRule rule;
            rule.pattern = item.value("pattern", "");
            rule.reason = item.value("reason", "Custom pattern match");
            rule.category = item.value("category", "custom");
            rule.id = item.value("id", "custom_" + std::to_string(index++));
            addRule(rule);
        }
        spdlog::info("Loaded {} deny-list rules from {}", patterns.size(),
                     rulesFile.string());
    }

    auto rules() const -> std::vector<DenyRule> {
        std::shared_lock lock(mutex_);
        std::vector<DenyRule> out;
        out.reserve(rules_.size());
        for (const auto& compiled : rules_) {
            out.push_back(compiled.rule);
        }
        return out;
    }

    auto scan(const std::string& code, bool firstOnly) const
        -> std::vector<SecurityViolation> {
        std::shared_lock lock(mutex_);
        std::vector<SecurityViolation> found;
        std::unordered_set<std::string> seen;

        scanText(code, false, firstOnly, found, seen);
        if (firstOnly && !found.empty()) {
            return found;
        }

        const std::string folded = foldConcatenation(code);
        if (folded != code) {
            scanText(folded, true, firstOnly, found, seen);
        }
        return found;
    }

private:
    struct CompiledRule {
        DenyRule rule;
        std::regex regex;
    };

    static auto compile(const DenyRule& rule) -> CompiledRule {
        try {
            return {rule, std::regex(rule.pattern, std::regex::ECMAScript |
                                                       std::regex::icase)};
        } catch (const std::regex_error& e) {
            THROW_INVALID_RULE("Invalid regex pattern for rule '" + rule.id +
                               "': " + e.what());
        }
    }

    static void report(std::vector<SecurityViolation>& found,
                       std::unordered_set<std::string>& seen,
                       const std::string& matched, const std::string& cat,
                       std::string reason, int line, bool assembled) {
        std::string key = std::to_string(line) + ":" + reason;
        if (seen.contains(key)) {
            return;
        }
        seen.insert(key);

        std::string effectiveCategory = cat;
        if (assembled) {
            reason = "Forbidden construct assembled by string concatenation: " +
                     reason;
            effectiveCategory = category::kObfuscation;
        }

        SecurityViolation violation;
        violation.matchedPattern = matched;
        violation.category = effectiveCategory;
        violation.message = std::move(reason);
        violation.line = line;
        violation.hints.push_back(categoryHint(effectiveCategory));
        for (auto& hint : hintsFor(ErrorKind::SecurityViolation)) {
            violation.hints.push_back(std::move(hint));
        }
        found.push_back(std::move(violation));
    }

    void scanText(const std::string& text, bool assembled, bool firstOnly,
                  std::vector<SecurityViolation>& found,
                  std::unordered_set<std::string>& seen) const {
        std::istringstream stream(text);
        std::string line;
        int lineNum = 0;
        while (std::getline(stream, line)) {
            lineNum++;
            if (isSkippableLine(line)) {
                continue;
            }
            for (const auto& compiled : rules_) {
                std::smatch match;
                if (std::regex_search(line, match, compiled.regex)) {
                    report(found, seen, trim(match.str()),
                           compiled.rule.category, compiled.rule.reason,
                           lineNum, assembled);
                    if (firstOnly) {
                        return;
                    }
                }
            }
        }

        for (const auto& literal : extractLiterals(text)) {
            const int lineNum = lineOfOffset(text, literal.offset);
            if (checkLiteral(literal, lineNum, assembled, found, seen) &&
                firstOnly) {
                return;
            }
        }
    }

    static auto checkLiteral(const StringLiteral& literal, int line,
                             bool assembled,
                             std::vector<SecurityViolation>& found,
                             std::unordered_set<std::string>& seen) -> bool {
        const std::string name = toLower(trim(literal.body));
        if (kRestrictedNames.contains(name)) {
            report(found, seen, literal.body, category::kDynamicEvaluation,
                   "String literal names a restricted callable or attribute",
                   line, assembled);
            return true;
        }

        std::string decoded = literal.body;
        if (!literal.raw && literal.body.find('\\') != std::string::npos) {
            decoded = decodeEscapes(literal.body);
            const std::string lowered = toLower(decoded);
            if (lowered != toLower(literal.body)) {
                for (const auto& marker : kEncodedMarkers) {
                    if (lowered.find(marker) != std::string::npos) {
                        report(found, seen, literal.body,
                               category::kObfuscation,
                               "Escape-encoded identifier in string literal",
                               line, assembled);
                        return true;
                    }
                }
            }
        }

        if (!bridge::sql::looksLikeQuery(decoded)) {
            return false;
        }
        if (auto keyword =
                bridge::sql::findKeyword(decoded, bridge::sql::kMutatingKeywords)) {
            report(found, seen, *keyword, category::kDataMutation,
                   "Mutating keyword " + *keyword + " in embedded data query",
                   line, assembled);
            return true;
        }
        if (bridge::sql::hasStatementSeparator(decoded)) {
            report(found, seen, ";", category::kDataMutation,
                   "Statement separator in embedded data query", line,
                   assembled);
            return true;
        }
        return false;
    }

    std::vector<CompiledRule> rules_;
    mutable std::shared_mutex mutex_;
};

SecurityScanner::SecurityScanner()
    : impl_(std::make_unique<SecurityScannerImpl>()) {}

SecurityScanner::SecurityScanner(const std::filesystem::path& rulesFile)
    : impl_(std::make_unique<SecurityScannerImpl>()) {
    impl_->loadRules(rulesFile);
}

SecurityScanner::~SecurityScanner() = default;

auto SecurityScanner::scan(const std::string& code) const
    -> std::expected<void, SecurityViolation> {
    auto found = impl_->scan(code, true);
    if (found.empty()) {
        return {};
    }
    const auto& violation = found.front();
    spdlog::warn("Security scan rejected code at line {}: {} [{}] '{}'",
                 violation.line, violation.message, violation.category,
                 violation.matchedPattern);
    return std::unexpected(violation);
}

auto SecurityScanner::scanAll(const std::string& code) const
    -> std::vector<SecurityViolation> {
    return impl_->scan(code, false);
}

void SecurityScanner::addRule(const DenyRule& rule) { impl_->addRule(rule); }

void SecurityScanner::loadRules(const std::filesystem::path& rulesFile) {
    impl_->loadRules(rulesFile);
}

auto SecurityScanner::rules() const -> std::vector<DenyRule> {
    return impl_->rules();
}

}  // namespace assay::sandbox
