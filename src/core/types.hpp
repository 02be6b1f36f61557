#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote connection settings resolved from an rclone-style config section
struct RemoteConfig {
    std::string url;
    std::string user;
    std::string pass;                            // plaintext after reveal
    std::optional<std::string> type;             // e.g. "webdav"
};

// Result of a HEAD probe. Any field may be missing from the response.
struct RemoteMetadata {
    std::optional<int64_t> size;
    std::optional<std::string> etag;             // quotes stripped
    std::optional<std::string> last_modified;
};

struct SyncTask {
    std::string local_path;
    std::string remote_path;                     // forward slashes, not escaped
    int64_t size = 0;
};

struct SyncReport {
    int processed = 0;
    int uploaded = 0;
    int skipped = 0;
    int failed = 0;
    int64_t elapsed_ms = 0;
};

enum class ComparePolicy {
    Size,           // skip when sizes match
    SizeAndEtag,    // skip when sizes match and local MD5 equals remote ETag
};

struct TransferSettings {
    int timeout_ms = DEFAULT_TIMEOUT_MS;
    int max_retries = DEFAULT_MAX_RETRIES;
    int retry_delay_ms = DEFAULT_RETRY_DELAY_MS;
};

struct SyncSettings {
    ComparePolicy compare = ComparePolicy::SizeAndEtag;
    int concurrency = DEFAULT_CONCURRENCY;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
