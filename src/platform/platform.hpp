#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Create `dir` (and parents) and restrict it to the owner (0700 where the
// filesystem supports permissions). False if the directory is unusable.
bool secure_directory(const std::filesystem::path& dir, std::string* error = nullptr);

} // namespace platform
