#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "transport.hpp"

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RAII handle for an interactive shell channel on a non-blocking libssh2
// session. Owns the channel and closes+frees it on destruction. Every libssh2
// call is made under a brief io_mutex_ hold shared with the owning transport.
class ShellChannel : public ShellStream {
public:
    ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex, int sock);
    ~ShellChannel() override;

    bool send(const std::string& data) override;
    bool recv_ready() override;
    std::string recv(std::size_t max_len) override;
    bool at_eof() override;
    void close() override;

    // Non-copyable, non-movable (handed out as unique_ptr<ShellStream>)
    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<std::mutex> io_mutex_;
    int sock_;
    std::string pending_;
    bool read_error_ = false;

    // Pull whatever libssh2 has buffered into pending_ without waiting.
    void fill();
};
