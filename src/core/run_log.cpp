#include "run_log.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:   return "DEBUG";
    case LogLevel::INFO:    return "INFO";
    case LogLevel::WARNING: return "WARNING";
    case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string n = to_lower(name);
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warning" || n == "warn") return LogLevel::WARNING;
    if (n == "error") return LogLevel::ERROR;
    return fallback;
}

RunLog::RunLog() : level_(LogLevel::ERROR), console_(false) {
}

RunLog::RunLog(const fs::path& file, LogLevel level, bool console)
    : path_(file), level_(level), console_(console) {
    open_file();
}

void RunLog::open_file() {
    if (path_.empty()) return;

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
    }
    file_.open(path_, std::ios::app);
    bytes_written_ = fs::exists(path_, ec) ? fs::file_size(path_, ec) : 0;
    if (ec) bytes_written_ = 0;
}

// netrun.log -> netrun.log.1 -> ... -> netrun.log.N (oldest dropped)
void RunLog::rotate() {
    file_.close();
    std::error_code ec;
    for (int i = RUN_LOG_BACKUPS - 1; i >= 1; --i) {
        fs::path from = path_.string() + "." + std::to_string(i);
        fs::path to = path_.string() + "." + std::to_string(i + 1);
        if (fs::exists(from, ec)) {
            fs::rename(from, to, ec);
        }
    }
    fs::rename(path_, path_.string() + ".1", ec);
    file_.open(path_, std::ios::trunc);
    bytes_written_ = 0;
}

static std::string thread_tag() {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    std::string id = ss.str();
    // Long native ids are noise; the tail is enough to tell threads apart
    return id.size() > 6 ? id.substr(id.size() - 6) : id;
}

void RunLog::log(LogLevel level, const std::string& msg) {
    if (level < level_) return;
    bool to_console = console_ && (level >= LogLevel::WARNING || level_ == LogLevel::DEBUG);

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);

    // rotate() reopens file_ under this lock
    if (file_.is_open()) {
        std::string line = fmt::format(
            "[{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}] {} [t{}] {}\n",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
            static_cast<int>(ms.count()), log_level_name(level), thread_tag(), msg);

        if (bytes_written_ + line.size() > RUN_LOG_MAX_BYTES) {
            rotate();
        }
        file_ << line;
        file_.flush();
        bytes_written_ += line.size();
    }

    if (to_console) {
        std::cout << fmt::format("{:02d}:{:02d}:{:02d} {}: {}\n",
                                 tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                 log_level_name(level), msg);
        std::cout.flush();
    }
}
