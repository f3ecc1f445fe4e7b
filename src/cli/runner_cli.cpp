#include "runner_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/validator.hpp>
#include <core/utils.hpp>
#include <managers/orchestrator.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <ssh/ssh_transport.hpp>
#include <fmt/format.h>
#include <readline/readline.h>
#include <readline/history.h>
#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

// ── Prompt helpers ──────────────────────────────────────

// One line from readline. nullopt on EOF (Ctrl-D).
static std::optional<std::string> prompt_line(const std::string& label,
                                              const std::string& default_val = "") {
    std::string prompt = "    " + label
        + (default_val.empty() ? ": " : " [" + default_val + "]: ");
    char* raw = readline(prompt.c_str());
    if (!raw) return std::nullopt;

    std::string answer = raw;
    free(raw);
    trim(answer);
    if (answer.empty()) return default_val;
    return answer;
}

static std::string read_password(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    std::string password;
    if (!platform::stdin_is_tty()) {
        std::getline(std::cin, password);
        return password;
    }

    platform::NoEchoGuard guard;
    while (true) {
        if (!platform::poll_stdin(120000)) break;
        char c;
        if (read(STDIN_FILENO, &c, 1) != 1) break;
        if (c == '\n' || c == '\r') break;
        if (c == 127 || c == 8) {
            if (!password.empty()) password.pop_back();
            continue;
        }
        if (static_cast<unsigned char>(c) >= 32) password += c;
    }

    std::cout << "\n";
    return password;
}

static void print_rejects(const std::string& what, const ParsedList& list) {
    for (const auto& r : list.rejected) {
        std::cout << theme::warn(fmt::format("Skipping invalid {}: {}", what, log_sample(r, 50)));
    }
    if (list.dropped_over_limit > 0) {
        std::cout << theme::warn(fmt::format("Too many {}s, {} dropped", what, list.dropped_over_limit));
    }
}

static HarvestPolicy build_harvest_policy(const HarvestSettings& s) {
    HarvestPolicy p;
    if (s.silence_ms) p.silence_threshold = std::chrono::milliseconds(*s.silence_ms);
    if (s.hard_ceiling_s) p.hard_ceiling = std::chrono::seconds(*s.hard_ceiling_s);
    if (s.max_output_mb) p.max_buffer = static_cast<std::size_t>(*s.max_output_mb) * 1024 * 1024;
    if (s.drain_timeout_s) p.drain_timeout = std::chrono::seconds(*s.drain_timeout_s);
    if (s.cleanup_timeout_ms) p.cleanup_timeout = std::chrono::milliseconds(*s.cleanup_timeout_ms);
    return p;
}

// ── RunnerCLI ───────────────────────────────────────────

RunnerCLI::RunnerCLI(InterruptFlag& interrupt, TransportFactory factory)
    : interrupt_(interrupt),
      factory_(factory ? std::move(factory) : ssh_transport_factory()) {}

Result<RunConfig> RunnerCLI::resolve_config(const CliArgs& args) {
    RunConfig config;

    if (args.config_path) {
        auto loaded = load_run_config(*args.config_path);
        if (loaded.is_err()) return loaded;
        config = std::move(loaded.value);
    } else if (default_config_exists()) {
        auto loaded = load_run_config(get_default_config_path());
        if (loaded.is_err()) return loaded;
        config = std::move(loaded.value);
    }

    if (!args.no_env) {
        apply_env_overrides(config);
    }

    if (args.hostname) {
        ParsedList list = parse_host_list(*args.hostname);
        print_rejects("host", list);
        config.hosts = list.items;
    }
    if (args.username) {
        if (!validate_username(*args.username)) {
            return Result<RunConfig>::Err("Invalid username format: " + *args.username);
        }
        config.username = *args.username;
    }
    if (args.port) config.port = *args.port;
    if (args.timeout) config.timeout = *args.timeout;
    if (args.mode) config.mode = *args.mode;
    if (args.max_threads) config.max_threads = *args.max_threads;
    if (args.log_dir) config.log_dir = *args.log_dir;
    if (args.commands_file) config.commands_file = *args.commands_file;
    if (args.log_level) config.log_level = *args.log_level;

    // --secure: never use a stored password
    if (args.secure) config.password.clear();

    return Result<RunConfig>::Ok(std::move(config));
}

bool RunnerCLI::prompt_interactive(RunConfig& config) {
    std::cout << theme::section("Connection");

    std::string host_default = config.hosts.empty() ? "" : config.hosts.front();
    while (true) {
        auto answer = prompt_line("Host(s)", host_default);
        if (!answer) return false;
        ParsedList list = parse_host_list(*answer);
        print_rejects("host", list);
        if (!list.items.empty()) {
            config.hosts = list.items;
            break;
        }
        std::cout << theme::fail("Enter at least one valid hostname or IP address");
    }

    while (true) {
        auto answer = prompt_line("Username", config.username);
        if (!answer) return false;
        if (validate_username(*answer)) {
            config.username = *answer;
            break;
        }
        std::cout << theme::fail("Username must be 1-32 characters of letters, digits, '.', '_' or '-'");
    }

    while (config.password.empty()) {
        config.password = read_password("    Password: ");
        if (config.password.empty()) {
            std::cout << theme::fail("Password cannot be empty");
            if (!platform::stdin_is_tty()) return false;
        }
    }

    while (true) {
        auto answer = prompt_line("Port", std::to_string(config.port));
        if (!answer) return false;
        int port = safe_stoi(*answer, -1);
        if (validate_port(port)) {
            config.port = port;
            break;
        }
        std::cout << theme::fail("Port must be between 1 and 65535");
    }

    while (true) {
        auto answer = prompt_line("Timeout (seconds)", std::to_string(config.timeout));
        if (!answer) return false;
        int timeout = safe_stoi(*answer, -1);
        if (validate_timeout(timeout)) {
            config.timeout = timeout;
            break;
        }
        std::cout << theme::fail("Timeout must be between 1 and 3600 seconds");
    }

    bool shell_default = config.mode.value_or(ExecMode::SHELL) == ExecMode::SHELL;
    auto answer = prompt_line("Use interactive shell (y/n)", shell_default ? "y" : "n");
    if (!answer) return false;
    std::string yn = to_lower(*answer);
    config.mode = (yn == "y" || yn == "yes") ? ExecMode::SHELL : ExecMode::DIRECT;

    return true;
}

std::vector<std::string> RunnerCLI::resolve_commands(const CliArgs& args, RunConfig& config) {
    if (args.command) {
        if (validate_command(*args.command)) return {*args.command};
        std::cout << theme::warn("Skipping invalid command: " + log_sample(*args.command, 50));
    }

    if (!config.commands.empty()) return config.commands;

    fs::path csv = config.commands_file.empty() ? fs::path(DEFAULT_COMMANDS_CSV)
                                                : fs::path(config.commands_file);
    if (!config.commands_file.empty() || fs::exists(csv)) {
        auto loaded = load_commands_file(csv);
        if (loaded.is_err()) {
            std::cout << theme::warn(loaded.error);
            log_->warn(loaded.error);
        } else {
            print_rejects("command", loaded.value);
            if (!loaded.value.items.empty()) {
                log_->info(fmt::format("Loaded {} commands from {}",
                                       loaded.value.items.size(), csv.string()));
                return loaded.value.items;
            }
        }
    }

    if (platform::stdin_is_tty()) {
        while (true) {
            auto answer = prompt_line("Command to execute");
            if (!answer) break;
            if (validate_command(*answer)) {
                add_history(answer->c_str());
                return {*answer};
            }
            std::cout << theme::fail("Command must be 1-1000 characters");
        }
    }
    return {};
}

void RunnerCLI::print_header(const RunConfig& config, ExecMode mode, size_t command_count) const {
    std::cout << theme::banner();
    std::string hosts = config.hosts.size() == 1
        ? config.hosts.front()
        : fmt::format("{} hosts", config.hosts.size());
    std::cout << theme::kv("Hosts", hosts);
    std::cout << theme::kv("User", config.username);
    std::cout << theme::kv("Port", std::to_string(config.port));
    std::cout << theme::kv("Mode", mode == ExecMode::SHELL ? "shell" : "direct");
    std::cout << theme::kv("Commands", std::to_string(command_count));
    std::cout << theme::kv("Logs", config.log_dir);
    std::cout << "\n";
}

int RunnerCLI::run(const CliArgs& args) {
    auto resolved = resolve_config(args);
    if (resolved.is_err()) {
        std::cout << theme::fail(resolved.error);
        return EXIT_USAGE;
    }
    RunConfig config = std::move(resolved.value);

    for (const auto& w : config.warnings) {
        std::cout << theme::warn(w);
    }

    LogLevel level = args.debug ? LogLevel::DEBUG : parse_log_level(config.log_level);

    std::string dir_error;
    if (!platform::secure_directory(config.log_dir, &dir_error)) {
        std::cout << theme::warn(fmt::format("Cannot use log directory {}: {}",
                                             config.log_dir, dir_error));
        config.log_dir = ".";
    }
    log_ = std::make_unique<RunLog>(fs::path(config.log_dir) / RUN_LOG_NAME, level, true);
    log_->info(fmt::format("netrun {} starting", NETRUN_VERSION));

    if (args.interactive) {
        if (!prompt_interactive(config)) {
            std::cout << theme::fail("Input aborted");
            return EXIT_USAGE;
        }
    } else if (config.password.empty() && !config.hosts.empty() && !config.username.empty()) {
        config.password = read_password(
            fmt::format("    Password for {}@{}: ", config.username,
                        config.hosts.size() == 1 ? config.hosts.front() : "all hosts"));
    }

    std::vector<std::string> missing;
    if (config.hosts.empty()) missing.push_back("hostname (SSH_HOST or argument)");
    if (config.username.empty()) missing.push_back("username (SSH_USER or argument)");
    if (config.password.empty()) missing.push_back("password (SSH_PASSWORD or prompt)");
    if (!missing.empty()) {
        std::cout << theme::fail("Missing required settings:");
        for (const auto& m : missing) std::cout << theme::step(m);
        log_->error("Missing required settings");
        return EXIT_USAGE;
    }

    std::vector<std::string> commands = resolve_commands(args, config);
    if (commands.empty()) {
        std::cout << theme::fail("No commands to execute");
        log_->error("No valid commands provided");
        return EXIT_USAGE;
    }

    RunOptions options;
    options.credentials.username = config.username;
    options.credentials.password = config.password;
    options.credentials.port = config.port;
    options.credentials.timeout = config.timeout;
    options.commands = commands;
    options.mode = config.mode.value_or(ExecMode::SHELL);
    options.max_threads = config.max_threads;
    options.log_dir = config.log_dir;
    options.harvest = build_harvest_policy(config.harvest);

    config.password.clear();

    print_header(config, options.mode, commands.size());

    HostOrchestrator orchestrator(std::move(options), factory_, *log_,
                                  steady_clock(), &interrupt_);
    orchestrator.set_status_callback([](const std::string& msg) {
        std::cout << theme::info(msg);
        std::cout.flush();
    });

    RunReport report = orchestrator.run(config.hosts);

    std::cout << "\n" << format_summary(report, orchestrator.options().log_dir);

    if (interrupt_.is_set()) {
        std::cout << theme::warn("Run interrupted by user");
        log_->warn("Run interrupted by user");
        return EXIT_INTERRUPTED;
    }
    if (report.failed > 0) {
        log_->info(fmt::format("Run finished: {}/{} hosts failed", report.failed, report.total));
        return EXIT_FAILED;
    }
    log_->info(fmt::format("Run finished: all {} hosts succeeded", report.total));
    return EXIT_OK;
}
