#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/clock.hpp>
#include <core/interrupt.hpp>
#include <core/run_log.hpp>
#include "transport.hpp"
#include "harvester.hpp"

enum class SessionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    EXECUTING,
    CLOSED,   // after disconnect(); terminal
    FAILED,   // connect failed; terminal
};

const char* session_state_name(SessionState state);

// One connection to one host. Owned by a single orchestrator task and never
// shared across threads.
//
//   DISCONNECTED -> CONNECTING -> CONNECTED <-> EXECUTING
//                        |              |
//                      FAILED  ---->  CLOSED (disconnect)
//
// Shell mode opens one interactive shell lazily and reuses it across
// commands. A forced completion (hang, interrupt, overflow, dead channel)
// closes it; the next shell-mode command opens a fresh one.
class HostSession {
public:
    HostSession(std::unique_ptr<Transport> transport, RunLog& log,
                Clock& clock = steady_clock(), HarvestPolicy policy = {},
                const InterruptFlag* interrupt = nullptr);
    ~HostSession();

    HostSession(const HostSession&) = delete;
    HostSession& operator=(const HostSession&) = delete;

    // Inputs are validated before any I/O (VALIDATION). Transport failures
    // leave the session FAILED.
    Status connect(const std::string& host, const std::string& user,
                   const std::string& password, int port, int timeout);
    Status connect(const std::string& host, const Credentials& creds);

    ExecutionResult execute(const std::string& command, ExecMode mode);

    // Idempotent, safe from any state.
    void disconnect();

    SessionState state() const { return state_; }
    const std::string& host() const { return host_; }
    bool shell_open() const { return shell_ != nullptr; }

private:
    std::unique_ptr<Transport> transport_;
    RunLog& log_;
    Clock& clock_;
    HarvestPolicy policy_;
    const InterruptFlag* interrupt_;

    SessionState state_ = SessionState::DISCONNECTED;
    std::string host_;
    int timeout_ = DEFAULT_TIMEOUT_SECS;
    std::unique_ptr<ShellStream> shell_;

    ExecutionResult execute_direct(const std::string& command);
    ExecutionResult execute_shell(const std::string& command);

    Status ensure_shell();
    void release_shell();
};
