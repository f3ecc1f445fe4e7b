#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/config.hpp>
#include <core/interrupt.hpp>
#include <core/run_log.hpp>
#include <ssh/transport.hpp>
#include "args.hpp"

// Exit codes for the netrun binary.
constexpr int EXIT_OK          = 0;
constexpr int EXIT_FAILED      = 1;   // at least one host failed
constexpr int EXIT_USAGE       = 2;   // bad arguments or missing inputs
constexpr int EXIT_INTERRUPTED = 130;

// Front end of a run: merges config file, environment and command line,
// prompts for whatever is still missing, then hands off to the orchestrator.
class RunnerCLI {
public:
    explicit RunnerCLI(InterruptFlag& interrupt,
                       TransportFactory factory = nullptr);

    int run(const CliArgs& args);

private:
    InterruptFlag& interrupt_;
    TransportFactory factory_;
    std::unique_ptr<RunLog> log_;

    // Config file + environment + CLI, in increasing precedence.
    Result<RunConfig> resolve_config(const CliArgs& args);

    // Prompt for every connection setting (--interactive).
    bool prompt_interactive(RunConfig& config);

    // Command list from the first non-empty source: CLI, config/env, CSV
    // file, then a prompt on a terminal.
    std::vector<std::string> resolve_commands(const CliArgs& args, RunConfig& config);

    void print_header(const RunConfig& config, ExecMode mode, size_t command_count) const;
};
