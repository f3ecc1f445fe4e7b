#include "utils.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <cctype>
#include <stdexcept>

static std::string format_now(const char* pattern) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf);
}

std::string now_display() {
    return format_now("%Y-%m-%d %H:%M:%S");
}

std::string now_file_stamp() {
    return format_now("%Y%m%d_%H%M%S");
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int value = std::stoi(s, &used);
        if (used != s.size()) return fallback;
        return value;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string log_sample(const std::string& text, std::size_t max_chars) {
    std::string out;
    out.reserve(std::min(text.size(), max_chars) + 8);
    std::size_t n = std::min(text.size(), max_chars);
    for (std::size_t i = 0; i < n; ++i) {
        char c = text[i];
        if (c == '\n')      out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '\t') out += "\\t";
        else                out += c;
    }
    if (text.size() > max_chars) out += "...";
    return out;
}

std::string to_lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}
