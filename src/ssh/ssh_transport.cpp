#include "ssh_transport.hpp"
#include "shell_channel.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>

using Deadline = std::chrono::steady_clock::time_point;

static bool expired(Deadline deadline) {
    return std::chrono::steady_clock::now() >= deadline;
}

static void init_libssh2_once() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

// Data passed to the keyboard-interactive callback via the session abstract
// pointer. Every prompt is answered with the password.
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

SSHTransport::SSHTransport()
    : session_(nullptr), sock_(-1), io_mutex_(std::make_shared<std::mutex>()) {
}

SSHTransport::~SSHTransport() {
    disconnect();
}

void SSHTransport::wait_socket(int ms) {
    short events = 0;
    int dir = session_ ? libssh2_session_block_directions(session_) : 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock_, events, ms);
}

// ── Connect ──────────────────────────────────────────────────

Status SSHTransport::open_socket(const ConnectParams& params, Deadline deadline) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port = std::to_string(params.port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(params.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) {
        return Status::Err(ErrorKind::DNS,
                           fmt::format("Failed to resolve host {}: {}", params.host, gai_strerror(gai)));
    }

    std::string last_error = "no usable address";
    bool timed_out = false;

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        platform::set_nonblocking(s);

        int ret = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            platform::close_socket(s);
            continue;
        }

        if (ret < 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            int revents = remaining > 0
                ? platform::poll_socket(s, POLLOUT, static_cast<int>(remaining)) : 0;
            if (revents == 0) {
                timed_out = true;
                last_error = "no response";
                platform::close_socket(s);
                break;
            }
            int sock_err = platform::socket_error(s);
            if (sock_err != 0) {
                last_error = sock_err > 0 ? std::strerror(sock_err) : "connect failed";
                platform::close_socket(s);
                if (sock_err == ETIMEDOUT) timed_out = true;
                continue;
            }
        }

        sock_ = s;
        break;
    }
    freeaddrinfo(res);

    if (sock_ < 0) {
        if (timed_out) {
            return Status::Err(ErrorKind::TIMEOUT,
                               fmt::format("Connection timeout to {}:{} after {} seconds",
                                           params.host, params.port, params.timeout));
        }
        return Status::Err(ErrorKind::UNKNOWN,
                           fmt::format("Failed to connect to {}:{}: {}",
                                       params.host, params.port, last_error));
    }

    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
    return Status::Ok();
}

Status SSHTransport::handshake(Deadline deadline) {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Status::Err(ErrorKind::PROTOCOL, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) {
            return Status::Err(ErrorKind::TIMEOUT, "SSH handshake timed out");
        }
        wait_socket(100);
    }
    if (ret != 0) {
        char* msg = nullptr;
        libssh2_session_last_error(session_, &msg, nullptr, 0);
        return Status::Err(ErrorKind::PROTOCOL,
                           fmt::format("SSH handshake failed: {}", msg ? msg : "unknown"));
    }

    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);
    return Status::Ok();
}

Status SSHTransport::authenticate(const std::string& user, Deadline deadline) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            return Status::Ok();  // "none" auth accepted
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        if (expired(deadline)) {
            return Status::Err(ErrorKind::TIMEOUT, "Timed out listing auth methods");
        }
        wait_socket(100);
    }
    std::string methods = auth_list ? auth_list : "";

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session_, user.c_str(),
                                                password_.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                return Status::Err(ErrorKind::TIMEOUT, "Timed out during password authentication");
            }
            wait_socket(100);
        }
        if (ret == 0) return Status::Ok();
    }

    // Network OSes often only offer keyboard-interactive with a password prompt
    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{password_, 0};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                            kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                *libssh2_session_abstract(session_) = nullptr;
                return Status::Err(ErrorKind::TIMEOUT, "Timed out during keyboard-interactive authentication");
            }
            wait_socket(100);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return Status::Ok();
    }

    return Status::Err(ErrorKind::AUTH,
                       fmt::format("Authentication failed for {}@{} (offered: {})",
                                   user, host_, methods.empty() ? "none" : methods));
}

Status SSHTransport::connect(const ConnectParams& params) {
    disconnect();
    init_libssh2_once();
    platform::init_networking();

    host_ = params.host;
    password_ = params.password;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(params.timeout);

    Status st = open_socket(params, deadline);
    if (st.is_ok()) st = handshake(deadline);
    if (st.is_ok()) st = authenticate(params.user, deadline);

    password_.clear();
    if (st.is_err()) {
        disconnect();
    }
    return st;
}

// ── Channels ─────────────────────────────────────────────────

LIBSSH2_CHANNEL* SSHTransport::open_channel(Deadline deadline) {
    if (!session_) return nullptr;

    while (true) {
        LIBSSH2_CHANNEL* ch;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return nullptr;
            }
        }
        if (ch) return ch;
        if (expired(deadline)) return nullptr;
        wait_socket(SSH_EAGAIN_SLEEP_MS);
    }
}

void SSHTransport::free_channel(LIBSSH2_CHANNEL* ch) {
    if (!ch) return;
    int rc;
    int tries = 0;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(ch);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) wait_socket(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN && ++tries < 100);
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_free(ch);
}

ExecOutcome SSHTransport::exec(const std::string& command, bool pty,
                               std::chrono::seconds timeout) {
    ExecOutcome out;
    if (!session_) {
        out.status = Status::Err(ErrorKind::STATE, "No SSH session");
        return out;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    LIBSSH2_CHANNEL* ch = open_channel(deadline);
    if (!ch) {
        out.status = Status::Err(ErrorKind::CHANNEL, "Failed to open exec channel");
        return out;
    }

    int rc;
    if (pty) {
        while ((rc = libssh2_channel_request_pty_ex(ch, SHELL_TERM, 5, nullptr, 0,
                                                    SHELL_WIDTH, SHELL_HEIGHT, 0, 0))
               == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) break;
            wait_socket(SSH_EAGAIN_SLEEP_MS);
        }
        if (rc != 0) {
            free_channel(ch);
            out.status = Status::Err(ErrorKind::CHANNEL, "PTY request rejected");
            return out;
        }
    }

    while ((rc = libssh2_channel_exec(ch, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) break;
        wait_socket(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        free_channel(ch);
        out.status = Status::Err(ErrorKind::CHANNEL, "Failed to exec command on channel");
        return out;
    }

    // Drain stdout and stderr together until EOF so neither window fills up
    char buf[SSH_READ_BUF_SIZE];
    bool done = false;
    while (!done) {
        if (expired(deadline)) {
            free_channel(ch);
            out.status = Status::Err(ErrorKind::EXEC_TIMEOUT,
                                     fmt::format("Command timed out after {}s", timeout.count()));
            return out;
        }

        bool progressed = false;
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(ch, buf, sizeof(buf));
        }
        if (n > 0) {
            out.stdout_data.append(buf, static_cast<size_t>(n));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            free_channel(ch);
            out.status = Status::Err(ErrorKind::CHANNEL, "SSH channel read error");
            return out;
        }

        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
        }
        if (n > 0) {
            out.stderr_data.append(buf, static_cast<size_t>(n));
            progressed = true;
        }

        if (!progressed) {
            bool eof;
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                eof = libssh2_channel_eof(ch) != 0;
            }
            if (eof) {
                done = true;
            } else {
                wait_socket(SSH_EAGAIN_SLEEP_MS);
            }
        }
    }

    int tries = 0;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(ch);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) wait_socket(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN && ++tries < 100);

    // exit-status arrives before the server's close; wait for it within
    // the command deadline but read it whatever the close result was
    if (rc == 0) {
        do {
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                rc = libssh2_channel_wait_closed(ch);
            }
            if (rc == LIBSSH2_ERROR_EAGAIN) wait_socket(SSH_EAGAIN_SLEEP_MS);
        } while (rc == LIBSSH2_ERROR_EAGAIN && !expired(deadline));
    }

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        out.exit_status = libssh2_channel_get_exit_status(ch);
        libssh2_channel_free(ch);
    }
    return out;
}

ShellOpen SSHTransport::open_shell(const std::string& term, int width, int height) {
    ShellOpen out;
    if (!session_) {
        out.status = Status::Err(ErrorKind::STATE, "No SSH session");
        return out;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(DEFAULT_TIMEOUT_SECS);
    LIBSSH2_CHANNEL* ch = open_channel(deadline);
    if (!ch) {
        out.status = Status::Err(ErrorKind::CHANNEL, "Failed to open shell channel");
        return out;
    }

    int rc;
    while ((rc = libssh2_channel_request_pty_ex(ch, term.c_str(),
                                                static_cast<unsigned int>(term.size()),
                                                nullptr, 0, width, height, 0, 0))
           == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) break;
        wait_socket(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        free_channel(ch);
        out.status = Status::Err(ErrorKind::CHANNEL, "PTY request rejected for shell");
        return out;
    }

    while ((rc = libssh2_channel_shell(ch)) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) break;
        wait_socket(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        free_channel(ch);
        out.status = Status::Err(ErrorKind::CHANNEL, "Failed to request shell");
        return out;
    }

    out.stream = std::make_unique<ShellChannel>(ch, io_mutex_, sock_);
    return out;
}

void SSHTransport::disconnect() {
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

TransportFactory ssh_transport_factory() {
    return [] { return std::make_unique<SSHTransport>(); };
}
