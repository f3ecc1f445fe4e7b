#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/clock.hpp>
#include <core/interrupt.hpp>
#include <core/run_log.hpp>
#include "transport.hpp"

// Timing and size limits for draining an interactive shell. Devices give no
// completion signal, so a command is considered finished after
// `silence_threshold` without new bytes.
struct HarvestPolicy {
    std::chrono::milliseconds settle_delay{HARVEST_SETTLE_MS};
    std::chrono::milliseconds first_data_wait{HARVEST_FIRST_DATA_MS};
    std::chrono::milliseconds poll_interval{HARVEST_POLL_MS};
    std::chrono::milliseconds busy_interval{HARVEST_BUSY_MS};
    std::chrono::milliseconds silence_threshold{HARVEST_SILENCE_MS};
    std::chrono::seconds hard_ceiling{HARVEST_HARD_CEILING_SECS};
    std::size_t max_buffer = HARVEST_MAX_BUFFER;
    std::chrono::seconds drain_timeout{HARVEST_DRAIN_TIMEOUT_SECS};
    std::size_t read_chunk = HARVEST_READ_CHUNK;
    std::size_t drain_chunk = HARVEST_DRAIN_CHUNK;
    std::chrono::milliseconds cleanup_timeout{SHELL_CLEANUP_TIMEOUT_MS};
    std::chrono::milliseconds banner_wait{SHELL_PROMPT_SETTLE_MS};
    std::chrono::milliseconds banner_poll{SHELL_PROMPT_POLL_MS};
    std::size_t banner_max = SHELL_BANNER_MAX_BYTES;
};

struct HarvestOutput {
    std::string raw;             // never longer than policy.max_buffer
    bool send_failed = false;
    bool truncated = false;      // buffer cap hit, remainder drained
    bool timed_out = false;      // hard ceiling hit
    bool interrupted = false;
    bool eof = false;            // remote closed the channel
    std::size_t bytes_received = 0;
    std::size_t bytes_discarded = 0;
    int chunks = 0;
    std::chrono::milliseconds elapsed{0};

    // Collection ended by something other than silence; the shell can no
    // longer be trusted to sit at a clean prompt.
    bool forced() const {
        return send_failed || truncated || timed_out || interrupted || eof;
    }
};

// Read the login banner/prompt once after the shell opens. Returns whatever
// arrived within policy.banner_wait, at most policy.banner_max bytes.
std::string consume_banner(ShellStream& stream, const HarvestPolicy& policy,
                           Clock& clock, RunLog& log, const std::string& host = "");

// Send `command` and collect its output until silence, EOF, the hard
// ceiling, the buffer cap or an interrupt.
HarvestOutput harvest(ShellStream& stream, const std::string& command,
                      const HarvestPolicy& policy, Clock& clock,
                      const InterruptFlag* interrupt, RunLog& log,
                      const std::string& host = "");

// Send "exit", drain briefly and close the stream. Bounded by
// policy.cleanup_timeout. Failures come back as CLEANUP and are not fatal.
Status close_shell(ShellStream& stream, const HarvestPolicy& policy,
                   Clock& clock, RunLog& log, const std::string& host = "");

// ── Completion markers ──

std::string truncation_marker(std::size_t max_buffer);
std::string timeout_marker(long long seconds);
std::string interrupted_marker();

// Markers for every forced-completion condition in `out`, in the order
// truncation, timeout, interrupt. Empty when collection ended normally.
std::string harvest_markers(const HarvestOutput& out, const HarvestPolicy& policy);
