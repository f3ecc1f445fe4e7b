#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"
#include "validator.hpp"

namespace fs = std::filesystem;

// Overrides for the shell-output harvester. Unset fields keep the defaults.
struct HarvestSettings {
    std::optional<int> silence_ms;
    std::optional<int> hard_ceiling_s;
    std::optional<int> max_output_mb;
    std::optional<int> drain_timeout_s;
    std::optional<int> cleanup_timeout_ms;
};

// Everything a run needs before the command line is applied. Hosts and
// commands here are already validated; entries that failed validation are
// listed in `warnings`.
struct RunConfig {
    std::vector<std::string> hosts;
    std::string username;
    std::string password;
    int port = DEFAULT_SSH_PORT;
    int timeout = DEFAULT_TIMEOUT_SECS;
    std::vector<std::string> commands;
    std::string commands_file;
    std::optional<ExecMode> mode;
    int max_threads = 0;
    std::string log_dir = DEFAULT_LOG_DIR;
    std::string log_level = "INFO";
    HarvestSettings harvest;

    std::vector<std::string> warnings;
};

// Parse a YAML run file. Missing keys keep their defaults; out-of-range
// numbers are errors.
Result<RunConfig> parse_run_config(const std::string& yaml_text);
Result<RunConfig> load_run_config(const fs::path& path);

// ./netrun.yaml
fs::path get_default_config_path(const fs::path& dir = fs::current_path());
bool default_config_exists(const fs::path& dir = fs::current_path());

// Environment lookup; returns nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

// Apply SSH_HOST, SSH_USER, SSH_PASSWORD and SSH_COMMANDS. Variables missing
// from the process environment are looked up in `dotenv` (KEY=VALUE lines)
// when that file exists.
void apply_env_overrides(RunConfig& config, const EnvLookup& getenv_fn,
                         const fs::path& dotenv = ".env");
void apply_env_overrides(RunConfig& config);

// Commands from a CSV file: first column only, '#' lines and blank lines
// skipped, quoted cells unwrapped. Err when the file cannot be read.
Result<ParsedList> load_commands_file(const fs::path& path);
