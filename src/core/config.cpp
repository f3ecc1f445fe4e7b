#include "config.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <cstdlib>
#include <map>
#include <cstdint>

namespace fs = std::filesystem;

static constexpr std::uintmax_t MAX_DOTENV_BYTES = 1024 * 1024;
static constexpr int MAX_DOTENV_LINES = 1000;

fs::path get_default_config_path(const fs::path& dir) {
    return dir / DEFAULT_CONFIG_FILE;
}

bool default_config_exists(const fs::path& dir) {
    return fs::exists(get_default_config_path(dir));
}

static void note_rejects(RunConfig& config, const std::string& what, const ParsedList& list) {
    for (const auto& r : list.rejected) {
        config.warnings.push_back(fmt::format("Skipping invalid {}: {}", what, log_sample(r, 50)));
    }
    if (list.dropped_over_limit > 0) {
        config.warnings.push_back(fmt::format("Too many {}s, {} dropped", what, list.dropped_over_limit));
    }
    if (list.input_truncated) {
        config.warnings.push_back(fmt::format("{} list too long, input truncated", what));
    }
}

// Accept either a YAML sequence or one comma-separated string.
static ParsedList read_list(const YAML::Node& node, bool hosts) {
    if (node.IsSequence()) {
        auto items = node.as<std::vector<std::string>>(std::vector<std::string>());
        return hosts ? filter_hosts(items) : filter_commands(items);
    }
    std::string s = node.as<std::string>("");
    return hosts ? parse_host_list(s) : parse_command_list(s);
}

static Result<int> read_int(const YAML::Node& node, const char* key, int lo, int hi) {
    int v = node.as<int>();
    if (v < lo || v > hi) {
        return Result<int>::Err(fmt::format("{} must be between {} and {} (got {})", key, lo, hi, v));
    }
    return Result<int>::Ok(v);
}

static Result<void> parse_harvest(const YAML::Node& node, HarvestSettings& h) {
    struct Field { const char* key; std::optional<int>* out; int lo; int hi; };
    Field fields[] = {
        {"silence_ms", &h.silence_ms, 100, 600000},
        {"hard_ceiling_s", &h.hard_ceiling_s, 1, 3600},
        {"max_output_mb", &h.max_output_mb, 1, 1024},
        {"drain_timeout_s", &h.drain_timeout_s, 1, 3600},
        {"cleanup_timeout_ms", &h.cleanup_timeout_ms, 0, 60000},
    };
    for (auto& f : fields) {
        if (!node[f.key]) continue;
        auto r = read_int(node[f.key], f.key, f.lo, f.hi);
        if (r.is_err()) return Result<void>::Err("harvest." + r.error);
        *f.out = r.value;
    }
    return Result<void>::Ok();
}

static Result<RunConfig> parse_root(const YAML::Node& root) {
    RunConfig config;
    if (!root || root.IsNull()) {
        return Result<RunConfig>::Ok(config);
    }
    if (!root.IsMap()) {
        return Result<RunConfig>::Err("Config root must be a mapping");
    }

    if (root["hosts"]) {
        ParsedList hosts = read_list(root["hosts"], true);
        note_rejects(config, "host", hosts);
        config.hosts = hosts.items;
    }

    config.username = root["username"].as<std::string>("");
    if (!config.username.empty() && !validate_username(config.username)) {
        return Result<RunConfig>::Err("Invalid username format: " + config.username);
    }
    config.password = root["password"].as<std::string>("");

    if (root["port"]) {
        auto r = read_int(root["port"], "port", MIN_PORT, MAX_PORT);
        if (r.is_err()) return Result<RunConfig>::Err(r.error);
        config.port = r.value;
    }
    if (root["timeout"]) {
        auto r = read_int(root["timeout"], "timeout", MIN_TIMEOUT_SECS, MAX_TIMEOUT_SECS);
        if (r.is_err()) return Result<RunConfig>::Err(r.error);
        config.timeout = r.value;
    }
    if (root["max_threads"]) {
        auto r = read_int(root["max_threads"], "max_threads", 0, MAX_REQUESTED_THREADS);
        if (r.is_err()) return Result<RunConfig>::Err(r.error);
        config.max_threads = r.value;
    }

    if (root["commands"]) {
        ParsedList cmds = read_list(root["commands"], false);
        note_rejects(config, "command", cmds);
        config.commands = cmds.items;
    }
    config.commands_file = root["commands_file"].as<std::string>("");

    if (root["mode"]) {
        std::string mode = to_lower(root["mode"].as<std::string>(""));
        if (mode == "shell") {
            config.mode = ExecMode::SHELL;
        } else if (mode == "direct" || mode == "exec") {
            config.mode = ExecMode::DIRECT;
        } else {
            return Result<RunConfig>::Err("mode must be 'shell' or 'direct' (got '" + mode + "')");
        }
    }

    config.log_dir = root["log_dir"].as<std::string>(DEFAULT_LOG_DIR);
    config.log_level = root["log_level"].as<std::string>("INFO");

    if (root["harvest"]) {
        if (!root["harvest"].IsMap()) {
            return Result<RunConfig>::Err("harvest must be a mapping");
        }
        auto r = parse_harvest(root["harvest"], config.harvest);
        if (r.is_err()) return Result<RunConfig>::Err(r.error);
    }

    return Result<RunConfig>::Ok(config);
}

Result<RunConfig> parse_run_config(const std::string& yaml_text) {
    try {
        return parse_root(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        return Result<RunConfig>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<RunConfig> load_run_config(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<RunConfig>::Err("Config not found at " + path.string());
    }
    try {
        return parse_root(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        return Result<RunConfig>::Err(std::string("Failed to parse config ") + path.string() + ": " + e.what());
    }
}

// ── Environment ──────────────────────────────────────────────

static std::map<std::string, std::string> read_dotenv(const fs::path& path) {
    std::map<std::string, std::string> values;
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) return values;
    if (fs::file_size(path, ec) > MAX_DOTENV_BYTES || ec) return values;

    std::ifstream in(path);
    std::string line;
    int count = 0;
    while (std::getline(in, line) && ++count <= MAX_DOTENV_LINES) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        values[key] = value;
    }
    return values;
}

void apply_env_overrides(RunConfig& config, const EnvLookup& getenv_fn, const fs::path& dotenv) {
    auto file_values = read_dotenv(dotenv);
    auto lookup = [&](const char* key) -> std::optional<std::string> {
        if (const char* v = getenv_fn(key)) return std::string(v);
        auto it = file_values.find(key);
        if (it != file_values.end()) return it->second;
        return std::nullopt;
    };

    if (auto hosts = lookup("SSH_HOST"); hosts && !hosts->empty()) {
        ParsedList list = parse_host_list(*hosts);
        note_rejects(config, "host", list);
        config.hosts = list.items;
    }
    if (auto user = lookup("SSH_USER"); user && !user->empty()) {
        if (validate_username(*user)) {
            config.username = *user;
        } else {
            config.warnings.push_back("Invalid username format in environment: " + *user);
        }
    }
    if (auto pass = lookup("SSH_PASSWORD"); pass && !pass->empty()) {
        config.password = *pass;
    }
    if (auto cmds = lookup("SSH_COMMANDS"); cmds && !cmds->empty()) {
        ParsedList list = parse_command_list(*cmds);
        note_rejects(config, "command", list);
        config.commands = list.items;
    }
}

void apply_env_overrides(RunConfig& config) {
    apply_env_overrides(config, [](const char* key) { return std::getenv(key); });
}

// ── Command CSV ──────────────────────────────────────────────

// First cell of a CSV row. A quoted cell may contain commas and "" escapes.
static std::string first_cell(const std::string& line) {
    std::string cell;
    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) i++;

    if (i < line.size() && line[i] == '"') {
        for (++i; i < line.size(); ++i) {
            if (line[i] == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                    continue;
                }
                break;
            }
            cell += line[i];
        }
    } else {
        auto comma = line.find(',', i);
        cell = line.substr(i, comma == std::string::npos ? std::string::npos : comma - i);
    }
    trim(cell);
    return cell;
}

Result<ParsedList> load_commands_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<ParsedList>::Err("Could not read " + path.string());
    }

    std::vector<std::string> commands;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string cell = first_cell(line);
        if (cell.empty() || cell[0] == '#') continue;
        commands.push_back(cell);
    }
    return Result<ParsedList>::Ok(filter_commands(commands));
}
