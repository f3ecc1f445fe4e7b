#pragma once

#include <string>

// Remove ANSI CSI sequences, carriage returns and backspaces.
std::string strip_ansi(const std::string& text);

// Turn raw shell bytes into the command's output: drops the echoed command,
// prompts, pager noise and shell-exit artifacts. Lines are trimmed and joined
// with '\n'; the result has no leading or trailing blank lines.
std::string clean_shell_output(const std::string& raw, const std::string& command);

struct OutputVerdict {
    bool success = false;
    std::string error_pattern;  // first error substring found, if any
};

// Shell-mode success: something was produced and no line carries a known
// error phrase (lines that are themselves exit artifacts are ignored).
OutputVerdict evaluate_output(const std::string& cleaned);
