#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <filesystem>
#include <cstdint>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

const char* log_level_name(LogLevel level);

// "debug", "INFO", "warn", ... -> level; unknown names give `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

// Run-wide diagnostic log. One instance is built per run and handed to the
// orchestrator and every host session; it is not a global.
//
// File lines:    [2025-01-09 14:02:11.512] WARNING [t3] message
// Console lines: 14:02:11 WARNING: message   (WARNING and above, or
//                                             everything in debug mode)
// The file rotates at RUN_LOG_MAX_BYTES keeping RUN_LOG_BACKUPS copies.
class RunLog {
public:
    // Discards everything. Used by tests and callers that want no output.
    RunLog();

    RunLog(const std::filesystem::path& file, LogLevel level, bool console = true);

    RunLog(const RunLog&) = delete;
    RunLog& operator=(const RunLog&) = delete;

    void log(LogLevel level, const std::string& msg);
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARNING, msg); }
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }

    bool enabled(LogLevel level) const { return level >= level_; }
    LogLevel level() const { return level_; }
    const std::filesystem::path& path() const { return path_; }

    // False when the log file could not be opened (console still works).
    bool file_ok() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return file_.is_open();
    }

private:
    std::filesystem::path path_;
    LogLevel level_ = LogLevel::INFO;
    bool console_ = false;
    std::ofstream file_;
    std::uintmax_t bytes_written_ = 0;
    mutable std::mutex mutex_;

    void open_file();
    void rotate();
};
