#pragma once

#include <cstdint>
#include <cstddef>

// ── Interactive terminal ────────────────────────────────────
constexpr int TERM_INITIAL_COLS          = 132;
constexpr int TERM_INITIAL_ROWS          = 43;
constexpr int TERM_MIN_COLS              = 80;
constexpr int TERM_MAX_COLS              = 500;
constexpr int TERM_MIN_ROWS              = 24;
constexpr int TERM_MAX_ROWS              = 200;
constexpr const char* TERM_TYPE          = "xterm-256color";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 30;    // TCP connect + handshake + auth
constexpr int TRANSPORT_KEEPALIVE_SECS   = 60;    // libssh2 keepalive interval
constexpr int PUMP_IDLE_KEEPALIVE_SECS   = 60;    // zero byte after this much silence
constexpr int PUMP_POLL_MS               = 100;   // sleep between empty polls
constexpr int PUMP_JOIN_TIMEOUT_MS       = 1000;  // bounded wait for pump exit on teardown
constexpr int CHANNEL_WRITE_STALL_MS     = 5000;  // give up on EAGAIN after this long
constexpr int RESOURCE_COMMAND_TIMEOUT_MS = 10000; // per top/free command

// ── Retry counts ────────────────────────────────────────────
constexpr int STAGING_DELETE_RETRIES     = 3;
constexpr int STAGING_DELETE_BACKOFF_MS  = 500;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PUMP_READ_QUANTUM          = 1024;
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr uint32_t SSH_MAX_WINDOW        = 2147483647u;  // 2^31 - 1
constexpr uint32_t SSH_MAX_PACKET        = 32768u;
constexpr size_t SFTP_NAME_BUFFER        = 4096;    // readdir name, NUL included
constexpr size_t SFTP_LONGENTRY_BUFFER   = 8192;

// ── Transfer sizing ─────────────────────────────────────────
constexpr uint64_t MiB                   = 1024ULL * 1024;
constexpr uint64_t GiB                   = 1024ULL * MiB;
constexpr uint64_t LARGE_FILE_THRESHOLD  = 1 * GiB;
constexpr uint64_t MEDIUM_FILE_THRESHOLD = 100 * MiB;
constexpr size_t PROGRESS_SPEED_SAMPLES  = 5;
constexpr uint64_t PREVIEW_MAX_BYTES     = 3 * MiB;

// ── Local paths ─────────────────────────────────────────────
constexpr const char* STAGING_SUBDIR     = "termbridge_staging";
constexpr const char* DEBUG_LOG_NAME     = "termbridge_debug.log";
