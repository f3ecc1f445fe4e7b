#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <set>
#include <functional>
#include <chrono>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Error taxonomy ──────────────────────────────────────────

enum class ErrorKind {
    NONE,
    VALIDATION,    // bad input, rejected before any I/O
    DNS,           // hostname did not resolve
    TIMEOUT,       // TCP connect or SSH handshake exceeded the timeout
    AUTH,          // server rejected the credentials
    PROTOCOL,      // SSH-level failure (handshake, channel setup)
    UNKNOWN,
    STATE,         // operation not allowed in the current session state
    CHANNEL,       // channel open/read/write failure during a command
    EXEC_TIMEOUT,  // direct-mode command did not finish within the timeout
    HANG,          // shell-mode hard ceiling hit, output force-completed
    INTERRUPTED,   // user interrupt observed
    CLEANUP,       // shell exit/drain/close failed (never fatal)
};

const char* error_kind_name(ErrorKind kind);

// Outcome of a step that produces no value. Mirrors Result<void> but keeps
// the error class so callers can report DNS vs auth vs timeout separately.
struct Status {
    ErrorKind kind = ErrorKind::NONE;
    std::string error;

    static Status Ok() { return {}; }
    static Status Err(ErrorKind kind, const std::string& err) {
        return {kind, err};
    }

    bool is_ok() const { return kind == ErrorKind::NONE; }
    bool is_err() const { return kind != ErrorKind::NONE; }
};

// ── Run inputs ──────────────────────────────────────────────

enum class ExecMode {
    DIRECT,  // one exec channel per command
    SHELL,   // one interactive shell reused across commands
};

// Shared read-only by every host task of a run. Never log `password`.
struct Credentials {
    std::string username;
    std::string password;
    int port = 22;
    int timeout = 30;  // seconds
};

// ── Results ─────────────────────────────────────────────────

struct ExecutionResult {
    bool success = false;
    std::string stdout_data;
    std::string stderr_data;
    std::chrono::milliseconds duration{0};
    int exit_status = -1;  // -1 when the mode has no exit status (shell)
    ErrorKind error = ErrorKind::NONE;

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

struct HostReport {
    std::string hostname;
    bool success = false;
    std::string summary;
};

struct RunReport {
    int total = 0;
    int successful = 0;
    int failed = 0;
    std::set<std::string> successful_hosts;
    std::set<std::string> failed_hosts;
    std::map<std::string, HostReport> per_host;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
