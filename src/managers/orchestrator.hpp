#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/clock.hpp>
#include <core/interrupt.hpp>
#include <core/run_log.hpp>
#include <ssh/transport.hpp>
#include <ssh/harvester.hpp>

struct RunOptions {
    Credentials credentials;
    std::vector<std::string> commands;
    ExecMode mode = ExecMode::SHELL;
    int max_threads = 0;  // <= 0: one per host up to hardware concurrency
    std::filesystem::path log_dir = DEFAULT_LOG_DIR;
    HarvestPolicy harvest;
    std::chrono::milliseconds command_pacing{COMMAND_PACING_MS};
};

// The single place host outcomes are merged into a RunReport. Counts are
// derived from the host sets, so successful + failed == total always holds.
class ReportCollector {
public:
    void add(const HostReport& report);
    RunReport snapshot() const;

private:
    mutable std::mutex mutex_;
    RunReport report_;
};

// Runs the command list on every host, one HostSession per host, at most
// effective_worker_count() hosts at a time.
class HostOrchestrator {
public:
    HostOrchestrator(RunOptions options, TransportFactory factory, RunLog& log,
                     Clock& clock = steady_clock(), const InterruptFlag* interrupt = nullptr);

    // Progress lines for the user ("[host] Executing command: ...").
    // Calls are serialized; may come from any worker thread.
    void set_status_callback(StatusCallback cb) { status_cb_ = std::move(cb); }

    // Full lifecycle for one host. Never throws for per-host failures.
    HostReport run_host(const std::string& host);

    // Duplicate hosts are run once. One host runs on the calling thread.
    RunReport run(const std::vector<std::string>& hosts);

    const RunOptions& options() const { return options_; }
    const std::string& run_stamp() const { return run_stamp_; }
    int last_worker_count() const { return last_worker_count_; }

private:
    RunOptions options_;
    TransportFactory factory_;
    RunLog& log_;
    Clock& clock_;
    const InterruptFlag* interrupt_;
    std::string run_stamp_;
    int last_worker_count_ = 0;

    StatusCallback status_cb_;
    std::mutex status_mutex_;

    void status(const std::string& msg);
    HostReport execute_on_host(const std::string& host);
};

// Human-readable end-of-run summary.
std::string format_summary(const RunReport& report, const std::filesystem::path& log_dir);
