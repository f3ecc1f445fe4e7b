#include "host_log.hpp"
#include <core/validator.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

static bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t extra;
        if (c < 0x80) { i++; continue; }
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
        else return false;

        if (i + extra >= s.size()) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string sanitize_log_message(const std::string& msg) {
    std::string out;
    out.reserve(msg.size());
    for (size_t i = 0; i < msg.size(); ++i) {
        char c = msg[i];
        if (c == '\0') continue;
        if (c == '\r' && i + 1 < msg.size() && msg[i + 1] == '\n') continue;
        out += c;
    }

    if (!is_valid_utf8(out)) {
        for (auto& c : out) {
            if (static_cast<unsigned char>(c) >= 0x80) c = '?';
        }
    }
    return out;
}

HostLogSink::HostLogSink(const fs::path& dir, const std::string& hostname,
                         const std::string& run_stamp, RunLog& log)
    : hostname_(hostname), log_(&log) {
    std::string token = sanitize_filename(hostname);
    fs::path target = dir;

    std::string err;
    if (!platform::secure_directory(dir, &err)) {
        log_->error(fmt::format("Failed to create log directory {}: {}", dir.string(), err));
        target = ".";
        token = "fallback_" + token;
        fallback_ = true;
    }

    path_ = target / fmt::format("ssh_output_{}_{}.log", token, run_stamp);
}

void HostLogSink::write(const std::string& msg) {
    if (msg.empty()) return;

    std::ofstream f(path_, std::ios::app | std::ios::binary);
    if (!f) {
        ok_ = false;
        log_->error(fmt::format("IO error writing to host log {}", path_.string()));
        return;
    }
    f << sanitize_log_message(msg) << "\n";
    f.flush();
    if (!f) {
        ok_ = false;
        log_->error(fmt::format("IO error writing to host log {}", path_.string()));
    }
}

// ── Blocks ──

void HostLogSink::write_header(std::size_t command_count) {
    std::string rule(80, '=');
    write(fmt::format("\n{}\nSSH Session Log for Host: {}\nStarted: {}\nCommands to execute: {}\n{}",
                      rule, hostname_, now_display(), command_count, rule));
}

void HostLogSink::write_command(std::size_t index, std::size_t total,
                                const std::string& command, const ExecutionResult& result) {
    std::string rule(60, '=');
    write("\n" + rule);
    write(fmt::format("Command {}/{}: {}", index, total, command));
    write(rule);

    if (!result.stdout_data.empty()) {
        write("OUTPUT:");
        write(result.stdout_data);
    }
    if (!result.stderr_data.empty()) {
        write("ERRORS:");
        write(result.stderr_data);
    }

    if (result.exit_status >= 0) {
        write(fmt::format("Exit status: {}", result.exit_status));
    }
    if (result.success) {
        write(fmt::format("Command {} executed successfully ({:.2f}s)", index,
                          result.duration.count() / 1000.0));
    } else if (result.error != ErrorKind::NONE) {
        write(fmt::format("Command {} failed: {}", index, error_kind_name(result.error)));
    } else {
        write(fmt::format("Command {} failed", index));
    }
}

void HostLogSink::write_footer(bool success) {
    std::string rule(80, '=');
    write(fmt::format("\n{}\nSSH Session Completed: {}\nStatus: {}\nLog file: {}\n{}",
                      rule, now_display(), success ? "SUCCESS" : "FAILED",
                      path_.string(), rule));
}
