#pragma once

#include <string>
#include <ctime>

// "YYYY-MM-DD HH:MM:SS" for log headers.
std::string now_display();

// "YYYYMMDD_HHMMSS", used to stamp per-host log file names.
std::string now_file_stamp();

// Safe integer parse: returns fallback on failure (no exceptions).
// Trailing garbage ("22abc") counts as failure.
int safe_stoi(const std::string& s, int fallback = 0);

// Escape newlines/tabs and cut to `max_chars` so output fits on one log line.
std::string log_sample(const std::string& text, std::size_t max_chars);

// ASCII lower-case copy.
std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
