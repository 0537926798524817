#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* SEACMD_VERSION = "1.1.0";

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int CONNECT_TIMEOUT_SECS       = 30;    // TCP connect + handshake
constexpr int KEEPALIVE_INTERVAL_SECS    = 30;    // libssh2 keepalive

// ── Timeouts ────────────────────────────────────────────────
constexpr int EXEC_TIMEOUT_SECS          = 60;    // One-shot remote command
constexpr int STREAM_TIMEOUT_SECS        = 300;   // Streaming remote command
constexpr int PENDING_LOGIN_TTL_SECS     = 120;   // Staged 'ssh' target lifetime
constexpr int CHANNEL_OPEN_TIMEOUT_SECS  = 30;    // Opening exec/shell/sftp channels
constexpr int SFTP_STALL_TIMEOUT_SECS    = 60;    // One SFTP request without progress
constexpr int PING_TIMEOUT_MS            = 3000;

// ── Terminal ────────────────────────────────────────────────
constexpr const char* DEFAULT_TERM_TYPE  = "xterm";
constexpr int DEFAULT_TERM_COLS          = 80;
constexpr int DEFAULT_TERM_ROWS          = 24;

// ── Polling ─────────────────────────────────────────────────
constexpr int EAGAIN_SLEEP_MS            = 10;
constexpr int SHELL_POLL_MS              = 20;    // Reader thread socket poll
constexpr int REPL_POLL_MS               = 50;    // Main loop stdin poll

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SFTP_BUF_SIZE              = 32768;

// ── Sentinels ───────────────────────────────────────────────
constexpr const char* NO_OUTPUT_MARKER   = "(no output)";
constexpr const char* EMPTY_DIR_MARKER   = "(empty directory)";
constexpr const char* CLEAR_MARKER       = "__CLEAR__";
