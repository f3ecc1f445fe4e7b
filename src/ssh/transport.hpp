#pragma once

#include <memory>
#include <string>
#include <chrono>
#include <functional>
#include <core/types.hpp>

// Interactive shell channel on a connected transport. One stream is owned by
// one HostSession at a time; implementations need not be thread-safe.
class ShellStream {
public:
    virtual ~ShellStream() = default;

    // Write all of `data`. False on channel error.
    virtual bool send(const std::string& data) = 0;

    // True if at least one byte can be read without waiting.
    virtual bool recv_ready() = 0;

    // Up to `max_len` bytes of what is currently available; empty if none.
    virtual std::string recv(std::size_t max_len) = 0;

    // Remote end closed the channel and nothing is left to read.
    virtual bool at_eof() = 0;

    // Close and release the channel. Idempotent.
    virtual void close() = 0;
};

struct ConnectParams {
    std::string host;
    std::string user;
    std::string password;
    int port = 22;
    int timeout = 30;  // seconds, applies to TCP connect + handshake + auth
};

// Result of one exec-channel command.
struct ExecOutcome {
    Status status;
    std::string stdout_data;
    std::string stderr_data;
    int exit_status = -1;
};

struct ShellOpen {
    Status status;
    std::unique_ptr<ShellStream> stream;
};

// Secure-transport primitives a HostSession is built on. The SSH
// implementation is SSHTransport; tests plug in simulated devices.
class Transport {
public:
    virtual ~Transport() = default;

    // TCP connect + handshake + authentication. Failures are classified as
    // DNS, TIMEOUT, AUTH, PROTOCOL or UNKNOWN.
    virtual Status connect(const ConnectParams& params) = 0;

    // Run `command` on a fresh exec channel, optionally with a PTY, reading
    // stdout/stderr to EOF within `timeout`.
    virtual ExecOutcome exec(const std::string& command, bool pty,
                             std::chrono::seconds timeout) = 0;

    virtual ShellOpen open_shell(const std::string& term, int width, int height) = 0;

    // Release everything. Idempotent.
    virtual void disconnect() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;
