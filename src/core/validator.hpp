#pragma once

#include <string>
#include <vector>
#include <cstddef>

// Input validation for everything that reaches a remote device or the
// filesystem. All checks fail closed: malformed input yields false, never an
// exception.

// IPv4/IPv6 literal, or an RFC 1123 name of at most 253 characters.
bool validate_hostname(const std::string& hostname);

// 1..65535
bool validate_port(int port);

// 1..3600 seconds
bool validate_timeout(int timeout_secs);

// 1..32 characters from [A-Za-z0-9._-]
bool validate_username(const std::string& username);

// Non-empty, at most 1000 characters, no NUL byte.
bool validate_command(const std::string& command);

// Map arbitrary host text to a filesystem-safe token. Idempotent and never
// returns an empty string.
std::string sanitize_filename(const std::string& name);

// Outcome of parsing a comma-separated list. `items` keeps input order and is
// capped; `rejected` lists entries that failed validation.
struct ParsedList {
    std::vector<std::string> items;
    std::vector<std::string> rejected;
    std::size_t dropped_over_limit = 0;
    bool input_truncated = false;
};

// "10.0.0.1, r1.example.net,..." -> validated hosts, capped at MAX_HOSTS.
ParsedList parse_host_list(const std::string& hosts);

// "show ver,show route" or "\"show ver\",\"show route\"" -> validated
// commands, capped at MAX_COMMANDS.
ParsedList parse_command_list(const std::string& commands);

// Validate a list that did not come from a delimited string (CLI, YAML,
// CSV). Same drop/cap policy as the parsers.
ParsedList filter_hosts(const std::vector<std::string>& hosts);
ParsedList filter_commands(const std::vector<std::string>& commands);

// Pool size for `host_count` hosts. requested <= 0 means "auto"
// (min(hosts, hardware threads)); otherwise
// min(requested, 2*hosts, MAX_WORKER_THREADS, hosts). Always >= 1.
int effective_worker_count(int requested, std::size_t host_count);
