#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>
#include "webdav_client.hpp"

namespace fs = std::filesystem;

// Drains a task list through a shared WebDavClient with a fixed pool of
// workers. A failing task is counted and logged; the others keep going.
class SyncEngine {
public:
    explicit SyncEngine(WebDavClient& client);

    SyncReport run(const std::vector<SyncTask>& tasks,
                   int concurrency,
                   ComparePolicy policy,
                   StatusCallback cb = nullptr);

    // True when the remote copy matches the local file under policy.
    // May hash the local file (SizeAndEtag with matching sizes and an etag).
    static bool is_up_to_date(const SyncTask& task,
                              const std::optional<RemoteMetadata>& meta,
                              ComparePolicy policy);

private:
    WebDavClient& client_;
    std::mutex status_mutex_;

    void emit(const StatusCallback& cb, const std::string& line);
};

// plan_sync_tasks() then SyncEngine::run() with the given settings.
SyncReport sync_directory(WebDavClient& client,
                          const fs::path& local_root,
                          const std::string& remote_root,
                          const SyncSettings& settings,
                          StatusCallback cb = nullptr);
