#include "shell_channel.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>

// Upper bound on one fill() so a flooding device cannot grow pending_
// without the harvester getting a look in.
static constexpr std::size_t FILL_LIMIT = 512u * 1024;
static constexpr int WRITE_MAX_EAGAIN = 500;   // x 10ms
static constexpr int CLOSE_MAX_EAGAIN = 100;

ShellChannel::ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex, int sock)
    : ch_(ch), io_mutex_(std::move(io_mutex)), sock_(sock) {}

ShellChannel::~ShellChannel() {
    close();
}

void ShellChannel::close() {
    if (!ch_ || !io_mutex_) return;

    int rc;
    int tries = 0;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(ch_);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN && ++tries < CLOSE_MAX_EAGAIN);

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(ch_);
    }
    ch_ = nullptr;
    pending_.clear();
}

bool ShellChannel::send(const std::string& data) {
    if (!ch_) return false;

    size_t sent = 0;
    int write_retries = 0;
    while (sent < data.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(ch_, data.c_str() + sent, data.size() - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > WRITE_MAX_EAGAIN) {
                return false;
            }
            platform::poll_socket(sock_, POLLOUT, SSH_EAGAIN_SLEEP_MS);
            continue;
        }
        if (w < 0) {
            return false;
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return true;
}

void ShellChannel::fill() {
    if (!ch_ || read_error_) return;

    char buf[SSH_READ_BUF_SIZE * 8];
    while (pending_.size() < FILL_LIMIT) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(ch_, buf, sizeof(buf));
        }
        if (n > 0) {
            pending_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            // A hard read error is reported as EOF
            read_error_ = true;
        }
        break;
    }
}

bool ShellChannel::recv_ready() {
    if (pending_.empty()) fill();
    return !pending_.empty();
}

std::string ShellChannel::recv(std::size_t max_len) {
    if (pending_.empty()) fill();
    if (pending_.empty() || max_len == 0) return "";

    if (pending_.size() <= max_len) {
        std::string out;
        out.swap(pending_);
        return out;
    }
    std::string out = pending_.substr(0, max_len);
    pending_.erase(0, max_len);
    return out;
}

bool ShellChannel::at_eof() {
    if (!pending_.empty()) return false;
    if (!ch_ || read_error_) return true;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return libssh2_channel_eof(ch_) != 0;
}
