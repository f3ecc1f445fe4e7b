#include "session.hpp"
#include "output_filter.hpp"
#include <core/validator.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED: return "disconnected";
        case SessionState::CONNECTING:   return "connecting";
        case SessionState::CONNECTED:    return "connected";
        case SessionState::EXECUTING:    return "executing";
        case SessionState::CLOSED:       return "closed";
        case SessionState::FAILED:       return "failed";
    }
    return "unknown";
}

static ExecutionResult failed_result(ErrorKind kind, const std::string& msg) {
    ExecutionResult r;
    r.success = false;
    r.stderr_data = msg;
    r.error = kind;
    return r;
}

HostSession::HostSession(std::unique_ptr<Transport> transport, RunLog& log,
                         Clock& clock, HarvestPolicy policy,
                         const InterruptFlag* interrupt)
    : transport_(std::move(transport)), log_(log), clock_(clock),
      policy_(policy), interrupt_(interrupt) {}

HostSession::~HostSession() {
    disconnect();
}

// ── Connect ──────────────────────────────────────────────────

Status HostSession::connect(const std::string& host, const Credentials& creds) {
    return connect(host, creds.username, creds.password, creds.port, creds.timeout);
}

Status HostSession::connect(const std::string& host, const std::string& user,
                            const std::string& password, int port, int timeout) {
    if (state_ != SessionState::DISCONNECTED) {
        return Status::Err(ErrorKind::STATE,
                           fmt::format("Cannot connect from state '{}'", session_state_name(state_)));
    }

    if (!validate_hostname(host)) {
        return Status::Err(ErrorKind::VALIDATION, fmt::format("Invalid hostname: {}", host));
    }
    if (!validate_username(user)) {
        return Status::Err(ErrorKind::VALIDATION, fmt::format("Invalid username: {}", user));
    }
    if (!validate_port(port)) {
        return Status::Err(ErrorKind::VALIDATION, fmt::format("Invalid port: {}", port));
    }
    if (!validate_timeout(timeout)) {
        return Status::Err(ErrorKind::VALIDATION, fmt::format("Invalid timeout: {}", timeout));
    }
    if (password.empty()) {
        return Status::Err(ErrorKind::VALIDATION, "Password must not be empty");
    }

    host_ = host;
    timeout_ = timeout;
    state_ = SessionState::CONNECTING;
    log_.info(fmt::format("[{}] Connecting to {}@{}:{} (timeout {}s)", host, user, host, port, timeout));

    auto start = clock_.now();
    ConnectParams params{host, user, password, port, timeout};
    Status st = transport_->connect(params);

    if (st.is_err()) {
        state_ = SessionState::FAILED;
        log_.error(fmt::format("[{}] {}: {}", host, error_kind_name(st.kind), st.error));
        transport_->disconnect();
        return st;
    }

    state_ = SessionState::CONNECTED;
    log_.info(fmt::format("[{}] Connected in {:.2f}s", host,
                          elapsed_ms(start, clock_.now()) / 1000.0));
    return st;
}

// ── Execute ──────────────────────────────────────────────────

ExecutionResult HostSession::execute(const std::string& command, ExecMode mode) {
    if (state_ != SessionState::CONNECTED) {
        return failed_result(ErrorKind::STATE,
                             fmt::format("No active SSH connection (state '{}')", session_state_name(state_)));
    }
    if (!validate_command(command)) {
        return failed_result(ErrorKind::VALIDATION, "Invalid command");
    }

    log_.debug(fmt::format("[{}] Executing command: '{}' (mode={})", host_, command,
                           mode == ExecMode::SHELL ? "shell" : "direct"));

    state_ = SessionState::EXECUTING;
    auto start = clock_.now();
    ExecutionResult result = mode == ExecMode::SHELL ? execute_shell(command)
                                                     : execute_direct(command);
    result.duration = std::chrono::milliseconds(elapsed_ms(start, clock_.now()));
    state_ = SessionState::CONNECTED;
    return result;
}

ExecutionResult HostSession::execute_direct(const std::string& command) {
    std::chrono::seconds timeout(timeout_);

    ExecOutcome out = transport_->exec(command, true, timeout);
    if (out.status.is_err() && out.status.kind != ErrorKind::EXEC_TIMEOUT) {
        log_.warn(fmt::format("[{}] exec with PTY failed: {}, trying without PTY", host_, out.status.error));
        out = transport_->exec(command, false, timeout);
        if (out.status.is_err()) {
            log_.error(fmt::format("[{}] Both PTY and non-PTY exec failed: {}", host_, out.status.error));
        }
    }

    ExecutionResult r;
    r.stdout_data = std::move(out.stdout_data);
    r.stderr_data = std::move(out.stderr_data);
    r.exit_status = out.exit_status;

    if (out.status.is_err()) {
        r.success = false;
        r.error = out.status.kind;
        if (r.stderr_data.empty()) r.stderr_data = out.status.error;
        return r;
    }

    r.success = r.exit_status == 0;
    log_.debug(fmt::format("[{}] Command completed with exit status: {}", host_, r.exit_status));
    log_.debug(fmt::format("[{}] STDOUT ({} chars): {}", host_, r.stdout_data.size(),
                           log_sample(r.stdout_data, LOG_SAMPLE_CHARS)));
    if (!r.stderr_data.empty()) {
        log_.warn(fmt::format("[{}] STDERR ({} chars): {}", host_, r.stderr_data.size(),
                              log_sample(r.stderr_data, LOG_SAMPLE_CHARS)));
    }
    return r;
}

Status HostSession::ensure_shell() {
    if (shell_) return Status::Ok();

    ShellOpen opened = transport_->open_shell(SHELL_TERM, SHELL_WIDTH, SHELL_HEIGHT);
    if (opened.status.is_err()) {
        return opened.status;
    }
    if (!opened.stream) {
        return Status::Err(ErrorKind::CHANNEL, "Transport returned no shell stream");
    }
    shell_ = std::move(opened.stream);
    log_.debug(fmt::format("[{}] Interactive shell opened ({} {}x{})", host_,
                           SHELL_TERM, SHELL_WIDTH, SHELL_HEIGHT));
    consume_banner(*shell_, policy_, clock_, log_, host_);
    return Status::Ok();
}

void HostSession::release_shell() {
    if (!shell_) return;
    Status st = close_shell(*shell_, policy_, clock_, log_, host_);
    if (st.is_err()) {
        log_.warn(fmt::format("[{}] {}: {}", host_, error_kind_name(st.kind), st.error));
    }
    shell_.reset();
}

ExecutionResult HostSession::execute_shell(const std::string& command) {
    Status st = ensure_shell();
    if (st.is_err()) {
        log_.error(fmt::format("[{}] Shell open failed: {}", host_, st.error));
        return failed_result(st.kind, st.error);
    }

    HarvestOutput out = harvest(*shell_, command, policy_, clock_, interrupt_, log_, host_);

    if (out.send_failed) {
        release_shell();
        return failed_result(ErrorKind::CHANNEL, "Failed to send command to shell");
    }

    std::string cleaned = clean_shell_output(out.raw, command);
    OutputVerdict verdict = evaluate_output(cleaned);
    if (!verdict.error_pattern.empty()) {
        log_.warn(fmt::format("[{}] Command error detected: {}", host_, verdict.error_pattern));
    }

    std::string markers = harvest_markers(out, policy_);
    if (!markers.empty()) {
        cleaned = cleaned.empty() ? markers : cleaned + "\n\n" + markers;
    }

    ExecutionResult r;
    r.stdout_data = std::move(cleaned);
    r.success = verdict.success;
    if (out.timed_out) {
        r.success = false;
        r.error = ErrorKind::HANG;
    } else if (out.interrupted) {
        r.success = false;
        r.error = ErrorKind::INTERRUPTED;
    }

    if (out.forced()) {
        release_shell();
    }

    log_.debug(fmt::format("[{}] Command success determination: success={}, output_length={}",
                           host_, r.success, r.stdout_data.size()));
    return r;
}

// ── Disconnect ───────────────────────────────────────────────

void HostSession::disconnect() {
    if (state_ == SessionState::CLOSED) return;

    release_shell();
    if (transport_) {
        transport_->disconnect();
    }
    if (state_ != SessionState::DISCONNECTED) {
        log_.debug(fmt::format("[{}] SSH connection closed", host_));
    }
    state_ = SessionState::CLOSED;
}
