#pragma once

#include <string>
#include <optional>
#include <memory>
#include <mutex>
#include <future>
#include <set>
#include <map>
#include <filesystem>
#include <core/types.hpp>
#include <net/http_client.hpp>
#include "retry_policy.hpp"

namespace fs = std::filesystem;

// Authenticated WebDAV client. One instance is shared by all sync workers;
// every method is safe to call concurrently.
class WebDavClient {
public:
    WebDavClient(const RemoteConfig& remote,
                 const TransferSettings& settings,
                 std::shared_ptr<HttpTransport> http = nullptr,
                 RetryPolicy::SleepFn sleep = nullptr);

    // MKCOL, best effort. Each directory is requested at most once per client;
    // concurrent callers for the same path wait for the one in-flight request.
    // Never throws and never retries.
    void create_directory(const std::string& remote_path);

    // create_directory() on the parent of remote_path. A trailing '/' means
    // remote_path itself is the directory.
    void ensure_parent_directory(const std::string& remote_path);

    // HEAD. nullopt when the object is absent or the status is a
    // non-retryable failure; retryable statuses are retried then thrown.
    std::optional<RemoteMetadata> probe_metadata(const std::string& remote_path);

    // PUT a local file. A remote path ending in '/' gets the local file name.
    void upload(const fs::path& local_path, const std::string& remote_path);

    // GET source_url and stream its body straight into a PUT. Returns the
    // remote path actually written.
    std::string upload_from_url(const std::string& source_url, const std::string& remote_path);

    // GET into local_path (created or truncated on success only).
    void download(const std::string& remote_path, const fs::path& local_path);

    // Full request URL for a remote path
    std::string url_for(const std::string& remote_path) const;

    bool directory_known(const std::string& remote_path) const;

    // Filename for upload_from_url: RFC 6266 filename*, then filename=, then
    // the URL path's basename, else download-<epoch ms>.bin.
    static std::string pick_filename(const std::string& source_url,
                                     const std::optional<std::string>& content_disposition);

private:
    std::string base_url_;
    std::string auth_header_;
    TransferSettings settings_;
    std::shared_ptr<HttpTransport> http_;
    RetryPolicy retry_;

    mutable std::mutex dirs_mutex_;
    std::set<std::string> created_dirs_;     // confirmed to exist
    std::set<std::string> attempted_dirs_;   // MKCOL already issued (any outcome)
    std::map<std::string, std::shared_future<void>> pending_dirs_;

    bool issue_mkcol(const std::string& remote_path);
    void put_stream(const std::string& remote_path,
                    const std::function<size_t(char*, size_t)>& reader,
                    int64_t body_size,
                    const std::string& content_type);
};
