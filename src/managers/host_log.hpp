#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/run_log.hpp>

// Append-only output log for one host in one run:
//   <dir>/ssh_output_<sanitized host>_<YYYYmmdd_HHMMSS>.log
// Every write is flushed immediately. Failures go to the run log and never
// stop execution.
class HostLogSink {
public:
    HostLogSink(const std::filesystem::path& dir, const std::string& hostname,
                const std::string& run_stamp, RunLog& log);

    // Ignores empty messages; strips NUL, converts CRLF to LF, appends '\n'.
    void write(const std::string& msg);

    void write_header(std::size_t command_count);
    void write_command(std::size_t index, std::size_t total, const std::string& command,
                       const ExecutionResult& result);
    void write_footer(bool success);

    const std::filesystem::path& path() const { return path_; }
    const std::string& hostname() const { return hostname_; }

    // True when the log directory could not be created and the file went
    // to the working directory instead.
    bool is_fallback() const { return fallback_; }

    // False once any write has failed.
    bool ok() const { return ok_; }

private:
    std::filesystem::path path_;
    std::string hostname_;
    RunLog* log_;
    bool fallback_ = false;
    bool ok_ = true;
};

// Message text safe to write: NUL stripped, CRLF -> LF, and when the bytes
// are not valid UTF-8 every non-ASCII byte replaced with '?'.
std::string sanitize_log_message(const std::string& msg);
