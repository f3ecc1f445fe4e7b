#pragma once

#include <cstddef>

constexpr const char* NETRUN_VERSION = "1.0.0";

// ── Input limits ────────────────────────────────────────────
constexpr std::size_t MAX_HOSTNAME_LEN     = 253;   // RFC 1035
constexpr std::size_t MAX_LABEL_LEN        = 63;
constexpr std::size_t MAX_USERNAME_LEN     = 32;
constexpr std::size_t MAX_COMMAND_LEN      = 1000;
constexpr std::size_t MAX_FILENAME_LEN     = 100;
constexpr std::size_t MAX_HOSTS            = 100;
constexpr std::size_t MAX_COMMANDS         = 50;
constexpr std::size_t MAX_HOST_LIST_CHARS  = 10000;
constexpr std::size_t MAX_COMMAND_LIST_CHARS = 50000;
constexpr int MIN_PORT                     = 1;
constexpr int MAX_PORT                     = 65535;
constexpr int MIN_TIMEOUT_SECS             = 1;
constexpr int MAX_TIMEOUT_SECS             = 3600;
constexpr int MAX_WORKER_THREADS           = 50;    // hard cap on the host pool
constexpr int MAX_REQUESTED_THREADS        = 100;   // accepted on the command line

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT             = 22;
constexpr int DEFAULT_TIMEOUT_SECS         = 30;
constexpr int SSH_KEEPALIVE_SECS           = 30;
constexpr int SSH_EAGAIN_SLEEP_MS          = 10;

// ── Shell channel ───────────────────────────────────────────
constexpr const char* SHELL_TERM           = "vt100";
constexpr int SHELL_WIDTH                  = 120;
constexpr int SHELL_HEIGHT                 = 24;
constexpr int SHELL_PROMPT_SETTLE_MS       = 3000;  // max wait for the login banner
constexpr std::size_t SHELL_BANNER_MAX_BYTES = 64 * 1024;
constexpr int SHELL_PROMPT_POLL_MS         = 200;

// ── Harvester defaults ──────────────────────────────────────
constexpr int HARVEST_SETTLE_MS            = 100;
constexpr int HARVEST_FIRST_DATA_MS        = 6000;
constexpr int HARVEST_POLL_MS              = 50;
constexpr int HARVEST_BUSY_MS              = 10;
constexpr int HARVEST_SILENCE_MS           = 3000;
constexpr int HARVEST_HARD_CEILING_SECS    = 90;
constexpr std::size_t HARVEST_MAX_BUFFER   = 100u * 1024 * 1024;
constexpr int HARVEST_DRAIN_TIMEOUT_SECS   = 30;
constexpr std::size_t HARVEST_READ_CHUNK   = 128u * 1024;
constexpr std::size_t HARVEST_DRAIN_CHUNK  = 256u * 1024;
constexpr int SHELL_CLEANUP_TIMEOUT_MS     = 2000;
constexpr int SHELL_CLEANUP_POLL_MS        = 100;

// ── Orchestration ───────────────────────────────────────────
constexpr int COMMAND_PACING_MS            = 500;   // gap between commands on one host

// ── Logging ─────────────────────────────────────────────────
constexpr const char* DEFAULT_LOG_DIR      = "per-host-logs";
constexpr const char* RUN_LOG_NAME         = "netrun.log";
constexpr std::size_t RUN_LOG_MAX_BYTES    = 10u * 1024 * 1024;
constexpr int RUN_LOG_BACKUPS              = 5;
constexpr std::size_t LOG_SAMPLE_CHARS     = 200;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE            = 4096;
constexpr int SSH_DRAIN_BUF_SIZE           = 4096;

// ── Defaults for command sources ────────────────────────────
constexpr const char* DEFAULT_COMMANDS_CSV = "SSH_COMMANDS.CSV";
constexpr const char* DEFAULT_CONFIG_FILE  = "netrun.yaml";
