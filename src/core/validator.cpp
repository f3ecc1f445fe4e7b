#include "validator.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <thread>
#include <arpa/inet.h>

// ── Hostnames ────────────────────────────────────────────────

static bool is_ip_literal(const std::string& s) {
    unsigned char buf[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, s.c_str(), buf) == 1) return true;
    if (inet_pton(AF_INET6, s.c_str(), buf) == 1) return true;
    return false;
}

static bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// One DNS label: 1..63 chars, alphanumeric at both ends, hyphens inside.
static bool valid_label(const std::string& s, size_t begin, size_t end) {
    size_t len = end - begin;
    if (len == 0 || len > MAX_LABEL_LEN) return false;
    if (!is_alnum(s[begin]) || !is_alnum(s[end - 1])) return false;
    for (size_t i = begin; i < end; ++i) {
        if (!is_alnum(s[i]) && s[i] != '-') return false;
    }
    return true;
}

bool validate_hostname(const std::string& hostname) {
    if (hostname.empty() || hostname.size() > MAX_HOSTNAME_LEN) {
        return false;
    }
    if (hostname.find('\0') != std::string::npos) {
        return false;
    }

    if (is_ip_literal(hostname)) {
        return true;
    }

    // A fully-qualified name may carry trailing dots
    std::string name = hostname;
    while (!name.empty() && name.back() == '.') name.pop_back();
    if (name.empty()) return false;

    size_t begin = 0;
    while (true) {
        size_t dot = name.find('.', begin);
        size_t end = (dot == std::string::npos) ? name.size() : dot;
        if (!valid_label(name, begin, end)) return false;
        if (dot == std::string::npos) break;
        begin = dot + 1;
    }
    return true;
}

// ── Scalars ──────────────────────────────────────────────────

bool validate_port(int port) {
    return port >= MIN_PORT && port <= MAX_PORT;
}

bool validate_timeout(int timeout_secs) {
    return timeout_secs >= MIN_TIMEOUT_SECS && timeout_secs <= MAX_TIMEOUT_SECS;
}

bool validate_username(const std::string& username) {
    if (username.empty() || username.size() > MAX_USERNAME_LEN) {
        return false;
    }
    return std::all_of(username.begin(), username.end(), [](char c) {
        return is_alnum(c) || c == '.' || c == '_' || c == '-';
    });
}

bool validate_command(const std::string& command) {
    if (command.empty() || command.size() > MAX_COMMAND_LEN) {
        return false;
    }
    return command.find('\0') == std::string::npos;
}

// ── Filenames ────────────────────────────────────────────────

static void strip_dots_dashes(std::string& s) {
    auto start = s.find_first_not_of(".-");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(".-") + 1);
}

static bool is_reserved_device_name(const std::string& s) {
    static const std::array<const char*, 4> base{"CON", "PRN", "AUX", "NUL"};
    std::string upper = s;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    for (const char* name : base) {
        if (upper == name) return true;
    }
    if (upper.size() == 4 && (upper.compare(0, 3, "COM") == 0 || upper.compare(0, 3, "LPT") == 0)) {
        return upper[3] >= '1' && upper[3] <= '9';
    }
    return false;
}

std::string sanitize_filename(const std::string& name) {
    if (name.empty()) {
        return "unknown";
    }

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool keep = is_alnum(c) || c == '_' || c == '-' || c == '.';
        out += keep ? c : '_';
    }

    strip_dots_dashes(out);
    if (out.empty()) {
        out = "sanitized_host";
    }

    // Cutting can expose a trailing '.' or '-'; strip again so a second
    // pass is a no-op. The first char survives, so this never empties.
    if (out.size() > MAX_FILENAME_LEN) {
        out.resize(MAX_FILENAME_LEN);
        strip_dots_dashes(out);
    }

    if (is_reserved_device_name(out)) {
        out = "host_" + out;
    }
    return out;
}

// ── Lists ────────────────────────────────────────────────────

static std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (true) {
        size_t comma = s.find(',', begin);
        parts.push_back(s.substr(begin, comma == std::string::npos ? std::string::npos : comma - begin));
        if (comma == std::string::npos) break;
        begin = comma + 1;
    }
    return parts;
}

static void strip_quotes(std::string& s) {
    auto start = s.find_first_not_of("'\"");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of("'\"") + 1);
}

static void cap_list(ParsedList& list, std::size_t limit) {
    if (list.items.size() > limit) {
        list.dropped_over_limit = list.items.size() - limit;
        list.items.resize(limit);
    }
}

ParsedList filter_hosts(const std::vector<std::string>& hosts) {
    ParsedList out;
    for (auto host : hosts) {
        trim(host);
        if (host.empty()) continue;
        if (validate_hostname(host)) {
            out.items.push_back(host);
        } else {
            out.rejected.push_back(host);
        }
    }
    cap_list(out, MAX_HOSTS);
    return out;
}

ParsedList filter_commands(const std::vector<std::string>& commands) {
    ParsedList out;
    for (auto cmd : commands) {
        trim(cmd);
        if (cmd.empty()) continue;
        if (validate_command(cmd)) {
            out.items.push_back(cmd);
        } else {
            out.rejected.push_back(cmd.size() > 50 ? cmd.substr(0, 50) + "..." : cmd);
        }
    }
    cap_list(out, MAX_COMMANDS);
    return out;
}

ParsedList parse_host_list(const std::string& hosts) {
    std::string input = hosts;
    bool truncated = false;
    if (input.size() > MAX_HOST_LIST_CHARS) {
        input.resize(MAX_HOST_LIST_CHARS);
        truncated = true;
    }

    auto out = filter_hosts(split_commas(input));
    out.input_truncated = truncated;
    return out;
}

ParsedList parse_command_list(const std::string& commands) {
    std::string input = commands;
    bool truncated = false;
    if (input.size() > MAX_COMMAND_LIST_CHARS) {
        input.resize(MAX_COMMAND_LIST_CHARS);
        truncated = true;
    }

    // The whole value may be wrapped in quotes as well as each entry
    trim(input);
    strip_quotes(input);

    std::vector<std::string> parts;
    for (auto part : split_commas(input)) {
        trim(part);
        strip_quotes(part);
        trim(part);
        parts.push_back(part);
    }

    auto out = filter_commands(parts);
    out.input_truncated = truncated;
    return out;
}

// ── Worker pool sizing ───────────────────────────────────────

int effective_worker_count(int requested, std::size_t host_count) {
    int hosts = static_cast<int>(std::min<std::size_t>(host_count, MAX_HOSTS));
    if (hosts <= 0) return 1;

    if (requested <= 0) {
        int hw = static_cast<int>(std::thread::hardware_concurrency());
        if (hw <= 0) hw = 1;
        return std::max(1, std::min(hosts, hw));
    }

    int n = std::min({requested, 2 * hosts, MAX_WORKER_THREADS, hosts});
    return std::max(1, n);
}
