#include "args.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/validator.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static Result<int> parse_ranged(const std::string& opt, const std::string& value, int lo, int hi) {
    int v = safe_stoi(value, lo - 1);
    if (v < lo || v > hi) {
        return Result<int>::Err(fmt::format("{} must be between {} and {}, got '{}'", opt, lo, hi, value));
    }
    return Result<int>::Ok(v);
}

static bool takes_value(const std::string& opt) {
    return opt == "--config" || opt == "-p" || opt == "--port" ||
           opt == "-t" || opt == "--timeout" || opt == "--max-threads" ||
           opt == "--log-level" || opt == "--commands-file" || opt == "--log-dir";
}

static Result<void> apply_option(CliArgs& out, const std::string& opt, const std::string& value) {
    if (opt == "--config") {
        out.config_path = value;
    } else if (opt == "-p" || opt == "--port") {
        auto r = parse_ranged("Port", value, MIN_PORT, MAX_PORT);
        if (r.is_err()) return Result<void>::Err(r.error);
        out.port = r.value;
    } else if (opt == "-t" || opt == "--timeout") {
        auto r = parse_ranged("Timeout", value, MIN_TIMEOUT_SECS, MAX_TIMEOUT_SECS);
        if (r.is_err()) return Result<void>::Err(r.error);
        out.timeout = r.value;
    } else if (opt == "--max-threads") {
        auto r = parse_ranged("Thread count", value, 1, MAX_REQUESTED_THREADS);
        if (r.is_err()) return Result<void>::Err(r.error);
        out.max_threads = r.value;
    } else if (opt == "--log-level") {
        std::string lvl = to_lower(value);
        if (lvl != "debug" && lvl != "info" && lvl != "warning" && lvl != "error") {
            return Result<void>::Err("Log level must be one of DEBUG, INFO, WARNING, ERROR");
        }
        out.log_level = lvl;
    } else if (opt == "--commands-file") {
        out.commands_file = value;
    } else if (opt == "--log-dir") {
        out.log_dir = value;
    }
    return Result<void>::Ok();
}

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    CliArgs out;
    std::vector<std::string> positional;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string opt = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            opt = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        if (takes_value(opt)) {
            std::string value;
            if (inline_value) {
                value = *inline_value;
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                return Result<CliArgs>::Err("Missing value for " + opt);
            }
            auto r = apply_option(out, opt, value);
            if (r.is_err()) return Result<CliArgs>::Err(r.error);
            continue;
        }

        if (inline_value) {
            return Result<CliArgs>::Err("Option " + opt + " does not take a value");
        }

        if (opt == "--no-env") out.no_env = true;
        else if (opt == "--shell") out.mode = ExecMode::SHELL;
        else if (opt == "--no-shell") out.mode = ExecMode::DIRECT;
        else if (opt == "-d" || opt == "--debug") out.debug = true;
        else if (opt == "-s" || opt == "--secure") out.secure = true;
        else if (opt == "-i" || opt == "--interactive") out.interactive = true;
        else if (opt == "-h" || opt == "--help") out.show_help = true;
        else if (opt == "-V" || opt == "--version") out.show_version = true;
        else if (opt == "--password") {
            return Result<CliArgs>::Err("Passwords are not accepted on the command line; "
                                        "use SSH_PASSWORD, the config file or the prompt");
        } else {
            return Result<CliArgs>::Err("Unknown option: " + opt);
        }
    }

    switch (positional.size()) {
    case 0:
        break;
    case 1:
        if (validate_hostname(positional[0]) || positional[0].find(',') != std::string::npos) {
            out.hostname = positional[0];
        } else {
            out.command = positional[0];
        }
        break;
    case 2:
        out.hostname = positional[0];
        out.username = positional[1];
        break;
    case 3:
        out.hostname = positional[0];
        out.username = positional[1];
        out.command = positional[2];
        break;
    default:
        return Result<CliArgs>::Err("Too many arguments (passwords are not accepted on the command line)");
    }

    return Result<CliArgs>::Ok(out);
}

static std::string option_row(const std::string& flags, const std::string& desc) {
    return fmt::format("    {:<26}", flags) + theme::dim(desc) + "\n";
}

std::string usage_text() {
    std::string s = theme::banner();
    s += theme::section("Usage");
    s += "    netrun [options] [hostname] [username] [command]\n";
    s += theme::section("Options");
    s += option_row("--config FILE", "YAML run file (default ./netrun.yaml)");
    s += option_row("--no-env", "ignore SSH_* variables and .env");
    s += option_row("-p, --port N", "SSH port (default 22)");
    s += option_row("-t, --timeout N", "connect/exec timeout, 1-3600s (default 30)");
    s += option_row("--shell", "interactive shell mode (default)");
    s += option_row("--no-shell", "one exec channel per command");
    s += option_row("--max-threads N", "concurrent hosts, 1-100");
    s += option_row("--log-level L", "DEBUG, INFO, WARNING or ERROR");
    s += option_row("-d, --debug", "same as --log-level DEBUG");
    s += option_row("-s, --secure", "always prompt for the password");
    s += option_row("-i, --interactive", "prompt for every setting");
    s += option_row("--commands-file F", "CSV of commands (default SSH_COMMANDS.CSV)");
    s += option_row("--log-dir D", "per-host log directory (default per-host-logs)");
    s += option_row("-V, --version", "show version");
    s += option_row("-h, --help", "show this help");
    s += theme::section("Environment");
    s += "    SSH_HOST=r1,r2  SSH_USER=admin  SSH_PASSWORD=...\n";
    s += "    SSH_COMMANDS=\"show ver\",\"show route\"\n\n";
    return s;
}
