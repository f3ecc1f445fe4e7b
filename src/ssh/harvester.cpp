#include "harvester.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

static std::string tag(const std::string& host) {
    return host.empty() ? "" : fmt::format("[{}] ", host);
}

// ── Banner ──

std::string consume_banner(ShellStream& stream, const HarvestPolicy& policy,
                           Clock& clock, RunLog& log, const std::string& host) {
    std::string banner;
    std::size_t discarded = 0;
    auto start = clock.now();

    while (elapsed_ms(start, clock.now()) < policy.banner_wait.count()) {
        clock.sleep_for(policy.banner_poll);
        if (!stream.recv_ready()) {
            if (!banner.empty() || stream.at_eof()) break;
            continue;
        }
        while (stream.recv_ready()
               && elapsed_ms(start, clock.now()) < policy.banner_wait.count()) {
            std::string chunk = stream.recv(SSH_READ_BUF_SIZE);
            if (banner.size() < policy.banner_max) {
                banner += chunk.substr(0, policy.banner_max - banner.size());
            } else {
                discarded += chunk.size();
            }
        }
    }

    if (discarded > 0) {
        log.debug(fmt::format("{}Discarded {} bytes of shell output past the banner cap",
                              tag(host), discarded));
    }

    log.debug(fmt::format("{}Initial shell output: {}", tag(host),
                          log_sample(banner, 100)));
    return banner;
}

// ── Collection ──

// Read and discard until silence, EOF, interrupt or the drain timeout.
static void drain(ShellStream& stream, const HarvestPolicy& policy, Clock& clock,
                  const InterruptFlag* interrupt, HarvestOutput& out,
                  Clock::time_point last_data, RunLog& log, const std::string& host) {
    auto drain_start = clock.now();
    int drained_chunks = 0;

    while (true) {
        auto now = clock.now();
        if (elapsed_ms(drain_start, now) >= std::chrono::milliseconds(policy.drain_timeout).count()) {
            log.warn(fmt::format("{}Drain timeout after {}s, abandoning remaining output",
                                 tag(host), policy.drain_timeout.count()));
            break;
        }
        if (interrupted(interrupt)) {
            out.interrupted = true;
            break;
        }
        if (stream.recv_ready()) {
            std::string junk = stream.recv(policy.drain_chunk);
            out.bytes_received += junk.size();
            out.bytes_discarded += junk.size();
            last_data = now;
            if (++drained_chunks % 100 == 0) {
                log.info(fmt::format("{}Draining excess data... {}s ({} chunks discarded)",
                                     tag(host), elapsed_ms(drain_start, now) / 1000, drained_chunks));
            }
            continue;
        }
        if (stream.at_eof()) {
            out.eof = true;
            break;
        }
        if (elapsed_ms(last_data, now) >= policy.silence_threshold.count()) {
            break;
        }
        clock.sleep_for(policy.poll_interval);
    }

    log.info(fmt::format("{}Data drain completed in {:.1f}s ({} chunks, {} bytes discarded)",
                         tag(host), elapsed_ms(drain_start, clock.now()) / 1000.0,
                         drained_chunks, out.bytes_discarded));
}

HarvestOutput harvest(ShellStream& stream, const std::string& command,
                      const HarvestPolicy& policy, Clock& clock,
                      const InterruptFlag* interrupt, RunLog& log,
                      const std::string& host) {
    HarvestOutput out;
    auto start = clock.now();

    if (!stream.send(command + "\n")) {
        log.warn(fmt::format("{}Error sending command to shell: {}", tag(host), command));
        out.send_failed = true;
        return out;
    }
    log.debug(fmt::format("{}Sent command to shell: {}", tag(host), command));
    clock.sleep_for(policy.settle_delay);

    const long long ceiling_ms = std::chrono::milliseconds(policy.hard_ceiling).count();

    // Give the device a window to start echoing before silence counts.
    // The hard ceiling still applies.
    auto wait_start = clock.now();
    while (elapsed_ms(wait_start, clock.now()) < policy.first_data_wait.count()
           && elapsed_ms(start, clock.now()) <= ceiling_ms) {
        if (interrupted(interrupt) || stream.recv_ready() || stream.at_eof()) break;
        clock.sleep_for(policy.poll_interval);
    }

    auto last_data = clock.now();

    while (true) {
        auto now = clock.now();

        if (interrupted(interrupt)) {
            log.warn(fmt::format("{}Command interrupted by user: {}", tag(host), command));
            out.interrupted = true;
            break;
        }

        long long running = elapsed_ms(start, now);
        if (running > ceiling_ms) {
            log.warn(fmt::format("{}Command hang detected after {}s, forcing completion: {}",
                                 tag(host), running / 1000, command));
            out.timed_out = true;
            break;
        }

        if (stream.recv_ready()) {
            std::string chunk = stream.recv(policy.read_chunk);
            out.bytes_received += chunk.size();
            out.chunks++;
            last_data = now;

            if (out.chunks % 100 == 0) {
                log.debug(fmt::format("{}Receiving data... {} chunks, {:.1f}MB", tag(host),
                                      out.chunks, out.raw.size() / (1024.0 * 1024.0)));
            }

            std::size_t room = policy.max_buffer - out.raw.size();
            if (chunk.size() > room) {
                out.raw.append(chunk, 0, room);
                out.bytes_discarded += chunk.size() - room;
                out.truncated = true;
                log.warn(fmt::format("{}Output size limit ({}MB) reached, draining remaining data...",
                                     tag(host), policy.max_buffer / (1024 * 1024)));
                drain(stream, policy, clock, interrupt, out, last_data, log, host);
                break;
            }
            out.raw += chunk;
            clock.sleep_for(policy.busy_interval);
            continue;
        }

        if (stream.at_eof()) {
            log.debug(fmt::format("{}Shell channel closed by remote", tag(host)));
            out.eof = true;
            break;
        }
        if (elapsed_ms(last_data, now) >= policy.silence_threshold.count()) {
            break;
        }
        clock.sleep_for(policy.poll_interval);
    }

    out.elapsed = std::chrono::milliseconds(elapsed_ms(start, clock.now()));
    double secs = out.elapsed.count() / 1000.0;
    if (out.raw.size() > 1024 * 1024) {
        log.info(fmt::format("{}Command data collection completed after {:.2f}s, output size: {:.2f}MB ({} chunks)",
                             tag(host), secs, out.raw.size() / (1024.0 * 1024.0), out.chunks));
    } else {
        log.debug(fmt::format("{}Command data collection completed after {:.2f}s, output size: {} bytes ({} chunks)",
                              tag(host), secs, out.raw.size(), out.chunks));
    }
    return out;
}

// ── Cleanup ──

Status close_shell(ShellStream& stream, const HarvestPolicy& policy,
                   Clock& clock, RunLog& log, const std::string& host) {
    Status status = Status::Ok();
    auto start = clock.now();

    if (!stream.send("exit\n") || !stream.send("\n")) {
        status = Status::Err(ErrorKind::CLEANUP, "Failed to send exit to shell");
    } else {
        const std::chrono::milliseconds poll(SHELL_CLEANUP_POLL_MS);
        while (elapsed_ms(start, clock.now()) < policy.cleanup_timeout.count()) {
            if (!stream.recv_ready()) {
                clock.sleep_for(poll);
                break;
            }
            stream.recv(SSH_DRAIN_BUF_SIZE);
            clock.sleep_for(poll);
        }
    }

    stream.close();

    long long took = elapsed_ms(start, clock.now());
    if (took > 1000) {
        log.debug(fmt::format("{}Cleanup took {:.2f}s", tag(host), took / 1000.0));
    }
    if (status.is_err()) {
        log.debug(fmt::format("{}Warning during cleanup: {}", tag(host), status.error));
    }
    return status;
}

// ── Markers ──

std::string truncation_marker(std::size_t max_buffer) {
    return fmt::format("[OUTPUT TRUNCATED - Size limit of {}MB reached]",
                       max_buffer / (1024 * 1024));
}

std::string timeout_marker(long long seconds) {
    return fmt::format("[COMMAND TIMEOUT - Forced completion after {}s]", seconds);
}

std::string interrupted_marker() {
    return "[COMMAND INTERRUPTED BY USER - Ctrl+C pressed during data collection]";
}

std::string harvest_markers(const HarvestOutput& out, const HarvestPolicy& policy) {
    std::string markers;
    auto add = [&](const std::string& m) {
        if (!markers.empty()) markers += "\n";
        markers += m;
    };
    if (out.truncated) add(truncation_marker(policy.max_buffer));
    if (out.timed_out) add(timeout_marker(out.elapsed.count() / 1000));
    if (out.interrupted) add(interrupted_marker());
    return markers;
}
