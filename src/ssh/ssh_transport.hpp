#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <chrono>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// libssh2-backed Transport. The session runs in non-blocking mode; every
// wait is a bounded EAGAIN loop paced by poll() on the socket.
class SSHTransport : public Transport {
public:
    SSHTransport();
    ~SSHTransport() override;

    Status connect(const ConnectParams& params) override;
    ExecOutcome exec(const std::string& command, bool pty,
                     std::chrono::seconds timeout) override;
    ShellOpen open_shell(const std::string& term, int width, int height) override;
    void disconnect() override;

    SSHTransport(const SSHTransport&) = delete;
    SSHTransport& operator=(const SSHTransport&) = delete;

private:
    LIBSSH2_SESSION* session_;
    int sock_;
    std::string host_;
    std::string password_;
    std::shared_ptr<std::mutex> io_mutex_;

    using Deadline = std::chrono::steady_clock::time_point;

    Status open_socket(const ConnectParams& params, Deadline deadline);
    Status handshake(Deadline deadline);
    Status authenticate(const std::string& user, Deadline deadline);

    // Open a session channel, retrying on EAGAIN until `deadline`.
    LIBSSH2_CHANNEL* open_channel(Deadline deadline);
    void free_channel(LIBSSH2_CHANNEL* ch);

    // Wait for the socket to be readable/writable in the direction libssh2
    // is blocked on, for at most `ms`.
    void wait_socket(int ms);
};

// Factory used by the orchestrator for real runs.
TransportFactory ssh_transport_factory();
