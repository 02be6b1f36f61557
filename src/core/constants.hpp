#pragma once

#include <cstddef>
#include <cstdint>

// ── Transfer defaults ───────────────────────────────────────
constexpr int DEFAULT_TIMEOUT_MS         = 30000; // Per-request timeout for GET/PUT
constexpr int DEFAULT_MAX_RETRIES        = 2;     // Extra attempts after the first
constexpr int DEFAULT_RETRY_DELAY_MS     = 600;   // Backoff base: delay * (attempt + 1)
constexpr int DEFAULT_CONCURRENCY        = 4;     // Sync workers
constexpr int MAX_RETRY_DELAY_MS         = 10 * 60 * 1000; // Upper bound on a single backoff wait
constexpr int CONNECT_TIMEOUT_SECS       = 15;

// ── Buffer sizes ────────────────────────────────────────────
constexpr size_t FILE_READ_BUF_SIZE      = 64 * 1024;
constexpr size_t STREAM_PIPE_CAPACITY    = 1024 * 1024;   // upload-from-URL relay

// ── Obscured secrets ────────────────────────────────────────
// rclone's historical obscure key. Overridable via crypto.key_hex in config.
constexpr const char* DEFAULT_OBSCURE_KEY_HEX =
    "9c935b48730a554d6bfd7c63c886a92bd390198eb8128afbf4de162b8b95f638";
constexpr int OBSCURE_IV_SIZE            = 16;

// ── Identity ────────────────────────────────────────────────
constexpr const char* DAVSYNC_VERSION    = "0.4.0";
constexpr const char* DAVSYNC_USER_AGENT = "davsync/0.4.0";
