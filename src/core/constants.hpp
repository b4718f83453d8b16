#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* ISOJOB_VERSION = "0.4.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CHANNEL_POLL_MS            = 50;    // Tick between reader-attach attempts
constexpr int SERVICE_STOP_TIMEOUT_SECS  = 30;    // Max wait for systemctl stop
constexpr int PROCESS_TERM_GRACE_MS      = 2000;  // SIGTERM → SIGKILL grace period

// ── Limits ──────────────────────────────────────────────────
constexpr int MAX_JOB_ID_LENGTH          = 128;
constexpr int MAX_TIMEOUT_SECS           = 86400; // Keeps timeouts in ms within int
constexpr int ARCHIVE_BLOCK_SIZE         = 10240;
constexpr int ARCHIVE_COPY_BUF_SIZE      = 65536;

// ── Config locations ────────────────────────────────────────
constexpr const char* CONFIG_ENV_VAR     = "ISOJOB_CONFIG";
constexpr const char* CONFIG_DIR_NAME    = ".isojob";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";

// ── Log file names ──────────────────────────────────────────
constexpr const char* DEBUG_LOG_NAME     = "isojob.log";
