#include "orchestrator.hpp"
#include "host_log.hpp"
#include "worker_pool.hpp"
#include <core/validator.hpp>
#include <core/utils.hpp>
#include <ssh/session.hpp>
#include <fmt/format.h>
#include <future>
#include <set>
#include <stdexcept>
#include <utility>

// ── ReportCollector ──────────────────────────────────────────

void ReportCollector::add(const HostReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);

    report_.successful_hosts.erase(report.hostname);
    report_.failed_hosts.erase(report.hostname);
    if (report.success) {
        report_.successful_hosts.insert(report.hostname);
    } else {
        report_.failed_hosts.insert(report.hostname);
    }
    report_.per_host[report.hostname] = report;

    report_.successful = static_cast<int>(report_.successful_hosts.size());
    report_.failed = static_cast<int>(report_.failed_hosts.size());
    report_.total = report_.successful + report_.failed;
}

RunReport ReportCollector::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_;
}

// ── HostOrchestrator ─────────────────────────────────────────

HostOrchestrator::HostOrchestrator(RunOptions options, TransportFactory factory, RunLog& log,
                                   Clock& clock, const InterruptFlag* interrupt)
    : options_(std::move(options)), factory_(std::move(factory)), log_(log),
      clock_(clock), interrupt_(interrupt), run_stamp_(now_file_stamp()) {}

void HostOrchestrator::status(const std::string& msg) {
    if (!status_cb_) return;
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_cb_(msg);
}

HostReport HostOrchestrator::run_host(const std::string& host) {
    try {
        return execute_on_host(host);
    } catch (const std::exception& e) {
        log_.error(fmt::format("[{}] Unexpected error: {}", host, e.what()));
        return HostReport{host, false, fmt::format("Error: {}", e.what())};
    }
}

HostReport HostOrchestrator::execute_on_host(const std::string& host) {
    const auto& commands = options_.commands;
    const std::size_t n = commands.size();

    HostLogSink sink(options_.log_dir, host, run_stamp_, log_);
    status(fmt::format("[{}] Logging to: {}", host, sink.path().string()));
    log_.debug(fmt::format("[{}] Starting SSH session: {} commands (mode={})", host, n,
                           options_.mode == ExecMode::SHELL ? "shell" : "direct"));
    sink.write_header(n);

    if (interrupted(interrupt_)) {
        sink.write("Skipped: interrupted by user before connecting");
        sink.write_footer(false);
        return HostReport{host, false, fmt::format("Interrupted after command 0/{}", n)};
    }

    if (!factory_) {
        throw std::runtime_error("no transport factory configured");
    }
    HostSession session(factory_(), log_, clock_, options_.harvest, interrupt_);

    Status st = session.connect(host, options_.credentials);
    if (st.is_err()) {
        std::string summary = fmt::format("Connection failed ({}): {}",
                                          error_kind_name(st.kind), st.error);
        status(fmt::format("[{}] {}", host, summary));
        sink.write(summary);
        session.disconnect();
        sink.write_footer(false);
        return HostReport{host, false, summary};
    }

    sink.write(fmt::format("\nExecuting {} commands sequentially...", n));

    bool all_ok = true;
    std::size_t interrupted_after = 0;
    bool was_interrupted = false;

    for (std::size_t i = 0; i < n; ++i) {
        if (interrupted(interrupt_)) {
            was_interrupted = true;
            interrupted_after = i;
            break;
        }

        const std::string& cmd = commands[i];
        status(fmt::format("[{}] Executing command: {}", host, cmd));
        ExecutionResult result = session.execute(cmd, options_.mode);
        sink.write_command(i + 1, n, cmd, result);

        if (result.success) {
            log_.debug(fmt::format("[{}] Command {}/{} completed: {}", host, i + 1, n, cmd));
        } else {
            all_ok = false;
            log_.warn(fmt::format("[{}] Command {}/{} failed ({}): {}", host, i + 1, n,
                                  error_kind_name(result.error), log_sample(cmd, 50)));
        }

        if (result.error == ErrorKind::INTERRUPTED) {
            was_interrupted = true;
            interrupted_after = i + 1;
            break;
        }

        if (i + 1 < n) {
            clock_.sleep_for(options_.command_pacing);
        }
    }

    session.disconnect();

    HostReport report{host, false, ""};
    if (was_interrupted) {
        sink.write(fmt::format("\nInterrupted by user, skipping remaining {} commands",
                               n - interrupted_after));
        log_.warn(fmt::format("[{}] Command execution interrupted by user at command {}/{}",
                              host, interrupted_after, n));
        report.summary = fmt::format("Interrupted after command {}/{}", interrupted_after, n);
    } else {
        report.success = all_ok;
        report.summary = n == 1 ? fmt::format("Single command: {}", commands[0])
                                : fmt::format("{} commands executed", n);
        if (all_ok) {
            log_.info(fmt::format("[{}] All {} commands completed successfully", host, n));
            sink.write("All commands executed successfully");
        } else {
            log_.warn(fmt::format("[{}] Some commands failed during execution", host));
            sink.write("Some commands failed - check output above");
        }
    }

    sink.write_footer(report.success);
    return report;
}

RunReport HostOrchestrator::run(const std::vector<std::string>& hosts) {
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& h : hosts) {
        if (seen.insert(h).second) {
            unique.push_back(h);
        } else {
            log_.debug(fmt::format("Duplicate host ignored: {}", h));
        }
    }

    ReportCollector collector;
    if (unique.empty()) {
        last_worker_count_ = 0;
        return collector.snapshot();
    }

    if (unique.size() == 1) {
        last_worker_count_ = 1;
        collector.add(run_host(unique.front()));
        return collector.snapshot();
    }

    int workers = effective_worker_count(options_.max_threads, unique.size());
    last_worker_count_ = workers;
    log_.info(fmt::format("Multi-host SSH execution: {} hosts, {} commands, {} threads",
                          unique.size(), options_.commands.size(), workers));
    status(fmt::format("Starting SSH execution on {} hosts ({} threads)", unique.size(), workers));

    WorkerPool pool(static_cast<std::size_t>(workers));
    std::vector<std::pair<std::string, std::future<HostReport>>> pending;
    pending.reserve(unique.size());
    for (const auto& host : unique) {
        pending.emplace_back(host, pool.submit([this, host]() { return run_host(host); }));
    }

    for (auto& [host, fut] : pending) {
        HostReport report;
        try {
            report = fut.get();
        } catch (const std::exception& e) {
            log_.error(fmt::format("[{}] Host task failed: {}", host, e.what()));
            report = HostReport{host, false, fmt::format("Error: {}", e.what())};
        }
        if (report.success) {
            log_.debug(fmt::format("[{}] Completed successfully: {}", host, report.summary));
        } else {
            log_.error(fmt::format("[{}] Failed: {}", host, report.summary));
        }
        collector.add(report);
    }
    pool.shutdown();

    RunReport result = collector.snapshot();
    log_.info(fmt::format("Multi-host execution completed: {}/{} successful",
                          result.successful, result.total));
    return result;
}

// ── Summary ──────────────────────────────────────────────────

static std::string join(const std::set<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

std::string format_summary(const RunReport& report, const std::filesystem::path& log_dir) {
    std::string rule(60, '=');
    std::string out = fmt::format("\n{}\nEXECUTION SUMMARY\n{}\n", rule, rule);
    out += fmt::format("Total hosts: {}\n", report.total);
    out += fmt::format("Successful: {}\n", report.successful);
    out += fmt::format("Failed: {}\n", report.failed);
    out += fmt::format("Per-host logs: {}/ssh_output_<hostname>_<timestamp>.log\n",
                       log_dir.string());

    if (!report.successful_hosts.empty()) {
        out += fmt::format("\nSuccessful hosts: {}\n", join(report.successful_hosts));
    }
    if (!report.failed_hosts.empty()) {
        out += fmt::format("\nFailed hosts: {}\n", join(report.failed_hosts));
        for (const auto& host : report.failed_hosts) {
            auto it = report.per_host.find(host);
            if (it != report.per_host.end()) {
                out += fmt::format("  {}: {}\n", host, it->second.summary);
            }
        }
    }
    return out;
}
