#include "output_filter.hpp"
#include <core/utils.hpp>
#include <regex>
#include <sstream>
#include <vector>

// Substrings that mark a line as login/exit/pager noise (case-insensitive).
static const std::vector<std::string> SHELL_ARTIFACTS = {
    "exit", "logout", "connection to", "last login:",
    "welcome to", "match except:", "---(more)---",
    "no next tag", "press return", "invalid command:", "xit",
    "connection closed",
};

static const std::vector<std::regex>& prompt_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(^.*[$#>]\s*$)"),                 // generic prompt
        std::regex(R"(^.*@.*:.*[$#>]\s*$)"),           // user@host:path$
        std::regex(R"(^\{master:\d+\})"),              // Juniper RE banner
        std::regex(R"(^:+.*\[.*\d+;\d+.*H.*)"),        // cursor positioning junk
        std::regex(R"(^:.*press RETURN.*)"),           // pager
        std::regex(R"(^.*Connection to .* closed\.$)"),
        std::regex(R"(^Invalid command: \[xit\]$)"),
        std::regex(R"(^\s*xit\s*$)"),
    };
    return patterns;
}

// Applied to a line after control sequences are gone.
static const std::vector<std::regex>& cleanup_noise() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(^\s*xit\s*$)"),
        std::regex(R"(^Invalid command: \[xit\]$)"),
        std::regex(R"(^[^@\s]+@[^:\s]*:~\$)"),
        std::regex(R"(^Connection.*closed\.$)"),
    };
    return patterns;
}

static const std::vector<std::string> ERROR_PATTERNS = {
    "command not found", "syntax error",
    "permission denied", "authentication failed",
    "connection refused", "host unreachable", "network unreachable",
    "no such file or directory",
};

// A line matching one of these is the shell reacting to our "exit", not
// an error in the command's output.
static const std::vector<std::regex>& cleanup_indicators() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(invalid command: \[xit\])"),
        std::regex(R"(unknown command: xit)"),
        std::regex(R"(invalid command: exit)"),
        std::regex(R"(connection to .* closed)"),
    };
    return patterns;
}

static bool matches_any(const std::string& line, const std::vector<std::regex>& patterns) {
    for (const auto& re : patterns) {
        if (std::regex_search(line, re)) return true;
    }
    return false;
}

std::string strip_ansi(const std::string& text) {
    static const std::regex csi(R"(\x1b\[[0-9;?]*[A-Za-z])");
    std::string out = std::regex_replace(text, csi, "");

    std::string result;
    result.reserve(out.size());
    for (char c : out) {
        if (c == '\r' || c == '\b') continue;
        result += c;
    }
    return result;
}

std::string clean_shell_output(const std::string& raw, const std::string& command) {
    static const std::regex trailing_colon(R"(:\s*$)");

    std::string needle = command;
    trim(needle);

    std::vector<std::string> kept;
    bool echo_found = needle.empty();

    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty()) continue;

        if (!echo_found && line.find(needle) != std::string::npos) {
            echo_found = true;
            continue;
        }

        std::string lower = to_lower(line);
        bool artifact = false;
        for (const auto& a : SHELL_ARTIFACTS) {
            if (lower.find(a) != std::string::npos) {
                artifact = true;
                break;
            }
        }
        if (artifact) continue;
        if (matches_any(line, prompt_patterns())) continue;

        std::string clean = strip_ansi(line);
        clean = std::regex_replace(clean, trailing_colon, "");
        trim(clean);

        if (clean.empty() || matches_any(clean, cleanup_noise())) continue;
        kept.push_back(std::move(clean));
    }

    std::string out;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) out += '\n';
        out += kept[i];
    }
    return out;
}

OutputVerdict evaluate_output(const std::string& cleaned) {
    OutputVerdict verdict;
    verdict.success = !cleaned.empty();

    std::istringstream in(cleaned);
    std::string line;
    while (std::getline(in, line)) {
        std::string lower = to_lower(line);
        if (matches_any(lower, cleanup_indicators())) continue;
        for (const auto& pattern : ERROR_PATTERNS) {
            if (lower.find(pattern) != std::string::npos) {
                verdict.success = false;
                verdict.error_pattern = pattern;
                return verdict;
            }
        }
    }
    return verdict;
}
