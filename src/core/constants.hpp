#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* REMOTEFS_VERSION = "0.1.0";

// ── Connection defaults ─────────────────────────────────────
constexpr int SSH_DEFAULT_PORT           = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Max wait to open one exec channel
constexpr int SSH_CHANNEL_CLOSE_SECS     = 10;    // Max wait to close and free one channel
constexpr int SSH_STREAM_STALL_SECS      = 300;   // Give up when no byte moves for this long

// OpenSSH allows MaxSessions=10 per connection by default
constexpr int DEFAULT_MAX_SESSIONS       = 10;

// ── Polling ─────────────────────────────────────────────────
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;    // Back-off between EAGAIN retries
constexpr int SSH_HANDSHAKE_SLEEP_MS     = 100;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;

// ── Remote protocol ─────────────────────────────────────────
constexpr const char* REMOTE_NOT_FOUND   = "No such file or directory";
constexpr const char* SUDO_PREFIX        = "sudo ";

// ── Local files ─────────────────────────────────────────────
constexpr const char* DEFAULT_STATE_FILE = "remotefs.state.yaml";
constexpr const char* LOG_ENV_VAR        = "REMOTEFS_LOG";
