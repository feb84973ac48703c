#pragma once

#include <cstdint>

// ── SSH options ─────────────────────────────────────────────
// Automation-friendly: never prompt, never pin host keys (hosts are ephemeral).
constexpr const char* SSH_OPT_BATCH       = "BatchMode=yes";
constexpr const char* SSH_OPT_HOSTKEY     = "StrictHostKeyChecking=no";
constexpr const char* SSH_OPT_KNOWN_HOSTS = "UserKnownHostsFile=/dev/null";
constexpr const char* SSH_OPT_LOGLEVEL    = "LogLevel=ERROR";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DIAG_CONNECT_TIMEOUT_SECS  = 10;    // ConnectTimeout for connection tests
constexpr int PROBE_CONNECT_TIMEOUT_SECS = 5;     // TCP connect in the handshake probe
constexpr int FOLLOW_POLL_MS             = 200;   // Follow-stream read timeout (interrupt check)
constexpr int SIGINT_GRACE_MS            = 3000;  // Wait after SIGINT before SIGTERM

// ── Retry / mirroring defaults ──────────────────────────────
constexpr int DEFAULT_TRANSFER_RETRIES    = 3;
constexpr int DEFAULT_RETRY_BACKOFF_SECS  = 3;
constexpr int DEFAULT_MIRROR_INTERVAL_SECS = 3;
constexpr int DEFAULT_KEEP_LOG_BACKUPS    = 5;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_INTERRUPTED = 130;             // 128 + SIGINT
constexpr int EXIT_EXEC_FAILED = 127;             // child could not exec

// ── Names ───────────────────────────────────────────────────
constexpr const char* DEFAULT_MANIFEST_NAME = "_manifest.txt";
constexpr const char* DEFAULT_LOG_FILENAME  = "run.log";
constexpr const char* DEFAULT_SESSION_NAME  = "remora";
constexpr const char* REDACTED_VALUE        = "***";
constexpr const char* LOG_START_MARKER      = "[START]";
constexpr const char* LOG_END_MARKER        = "[END]";
constexpr const char* MIRROR_SUBDIR         = "mirror";
constexpr const char* REMORA_VERSION        = "0.4.0";

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PROC_READ_BUF_SIZE = 4096;
