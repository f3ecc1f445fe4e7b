#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// Parsed command line. Unset optionals fall back to config/environment.
struct CliArgs {
    std::optional<std::string> hostname;
    std::optional<std::string> username;
    std::optional<std::string> command;

    std::optional<std::string> config_path;
    std::optional<int> port;
    std::optional<int> timeout;
    std::optional<int> max_threads;
    std::optional<ExecMode> mode;
    std::optional<std::string> log_level;
    std::optional<std::string> commands_file;
    std::optional<std::string> log_dir;

    bool no_env = false;
    bool debug = false;
    bool secure = false;
    bool interactive = false;
    bool show_help = false;
    bool show_version = false;
};

// netrun [options] [hostname] [username] [command]
//
// A single positional that is not a valid hostname is taken as the command.
// Passwords are never accepted as arguments.
Result<CliArgs> parse_args(const std::vector<std::string>& args);

std::string usage_text();
