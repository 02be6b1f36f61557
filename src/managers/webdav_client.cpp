#include "webdav_client.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <net/stream_pipe.hpp>
#include <util/remote_path.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <regex>
#include <thread>

namespace fs = std::filesystem;

WebDavClient::WebDavClient(const RemoteConfig& remote,
                           const TransferSettings& settings,
                           std::shared_ptr<HttpTransport> http,
                           RetryPolicy::SleepFn sleep)
    : base_url_(remote.url),
      auth_header_("Authorization: Basic " + base64_encode(remote.user + ":" + remote.pass)),
      settings_(settings),
      http_(http ? std::move(http) : std::make_shared<CurlTransport>()),
      retry_(settings.max_retries, settings.retry_delay_ms, std::move(sleep)) {
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string WebDavClient::url_for(const std::string& remote_path) const {
    return base_url_ + "/" + RemotePath::encode(remote_path);
}

bool WebDavClient::directory_known(const std::string& remote_path) const {
    std::lock_guard<std::mutex> lock(dirs_mutex_);
    return created_dirs_.count(RemotePath::directory_key(remote_path)) > 0;
}

// ── Directories ────────────────────────────────────────────

bool WebDavClient::issue_mkcol(const std::string& remote_path) {
    HttpRequest req;
    req.method = "MKCOL";
    req.url = url_for(remote_path);
    req.headers = {auth_header_};
    req.timeout = std::chrono::milliseconds(settings_.timeout_ms);

    auto resp = http_->perform(req, nullptr, nullptr);
    switch (resp.status) {
        case 201: // created
        case 301: // exists (collection redirect)
        case 405: // exists
        case 409: // parent missing; the server may still accept PUT
            return true;
        default:
            davsync_log(fmt::format("MKCOL {} -> HTTP {}", remote_path, resp.status));
            return false;
    }
}

void WebDavClient::create_directory(const std::string& remote_path) {
    const std::string key = RemotePath::directory_key(remote_path);
    if (key.empty()) return;

    std::promise<void> done;
    {
        std::unique_lock<std::mutex> lock(dirs_mutex_);
        auto pending = pending_dirs_.find(key);
        if (pending != pending_dirs_.end()) {
            std::shared_future<void> in_flight = pending->second;
            lock.unlock();
            in_flight.wait();
            return;
        }
        if (created_dirs_.count(key) || attempted_dirs_.count(key)) return;

        attempted_dirs_.insert(key);
        pending_dirs_.emplace(key, done.get_future().share());
    }

    bool created = false;
    try {
        created = issue_mkcol(key);
    } catch (const std::exception& e) {
        davsync_log(fmt::format("MKCOL {} failed: {}", key, e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(dirs_mutex_);
        if (created) created_dirs_.insert(key);
        pending_dirs_.erase(key);
    }
    done.set_value();
}

void WebDavClient::ensure_parent_directory(const std::string& remote_path) {
    if (StringUtils::ends_with(remote_path, "/")) {
        create_directory(remote_path);
    } else {
        create_directory(RemotePath::parent(remote_path));
    }
}

// ── Metadata ───────────────────────────────────────────────

std::optional<RemoteMetadata> WebDavClient::probe_metadata(const std::string& remote_path) {
    return retry_.run("HEAD " + remote_path, [&]() -> std::optional<RemoteMetadata> {
        HttpRequest req;
        req.method = "HEAD";
        req.url = url_for(remote_path);
        req.headers = {auth_header_};
        req.timeout = std::chrono::milliseconds(settings_.timeout_ms);
        req.no_body = true;

        auto resp = http_->perform(req, nullptr, nullptr);
        if (resp.status == 404) return std::nullopt;
        if (!resp.ok()) {
            if (is_retryable_status(resp.status)) {
                throw RemoteError(fmt::format("HEAD {} failed: HTTP {}", remote_path, resp.status),
                                  resp.status, true);
            }
            return std::nullopt;
        }

        RemoteMetadata meta;
        if (auto length = resp.header("content-length")) {
            meta.size = parse_int64(*length);
        }
        if (auto etag = resp.header("etag")) {
            std::string tag = *etag;
            tag.erase(std::remove(tag.begin(), tag.end(), '"'), tag.end());
            trim(tag);
            if (!tag.empty()) meta.etag = tag;
        }
        meta.last_modified = resp.header("last-modified");
        return meta;
    });
}

// ── Upload ─────────────────────────────────────────────────

void WebDavClient::put_stream(const std::string& remote_path,
                              const std::function<size_t(char*, size_t)>& reader,
                              int64_t body_size,
                              const std::string& content_type) {
    HttpRequest req;
    req.method = "PUT";
    req.url = url_for(remote_path);
    req.headers = {auth_header_, "Content-Type: " + content_type};
    req.read_body = reader;
    req.body_size = body_size;
    req.stall_timeout = std::chrono::milliseconds(settings_.timeout_ms);

    auto resp = http_->perform(req, nullptr, nullptr);
    if (!resp.ok()) {
        throw RemoteError(fmt::format("PUT {} failed: HTTP {}", remote_path, resp.status),
                          resp.status, is_retryable_status(resp.status));
    }
}

void WebDavClient::upload(const fs::path& local_path, const std::string& remote_path) {
    const std::string target = StringUtils::ends_with(remote_path, "/")
        ? RemotePath::join({remote_path, local_path.filename().string()})
        : remote_path;

    retry_.run("PUT " + target, [&]() {
        std::ifstream in(local_path, std::ios::binary);
        if (!in) {
            throw LocalIOError("Cannot open " + local_path.string());
        }
        std::error_code ec;
        auto size = fs::file_size(local_path, ec);
        if (ec) {
            throw LocalIOError(fmt::format("Cannot stat {}: {}", local_path.string(), ec.message()));
        }

        put_stream(target, [&](char* buf, size_t len) -> size_t {
            in.read(buf, static_cast<std::streamsize>(len));
            if (in.bad()) {
                throw LocalIOError("Read error on " + local_path.string());
            }
            return static_cast<size_t>(in.gcount());
        }, static_cast<int64_t>(size), "application/octet-stream");
    });
}

// ── Upload from URL ────────────────────────────────────────

static std::string url_path_of(const std::string& url) {
    std::string rest = url;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
        auto slash = rest.find('/');
        rest = slash == std::string::npos ? "" : rest.substr(slash);
    }
    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos) rest = rest.substr(0, cut);
    return rest;
}

std::string WebDavClient::pick_filename(const std::string& source_url,
                                        const std::optional<std::string>& content_disposition) {
    if (content_disposition) {
        static const std::regex extended(R"(filename\*=UTF-8''([^;]+))", std::regex::icase);
        static const std::regex basic(R"rx(filename="?([^";]+)"?)rx", std::regex::icase);
        std::smatch m;
        if (std::regex_search(*content_disposition, m, extended) && m[1].length() > 0) {
            std::string raw = m[1].str();
            auto decoded = percent_decode(raw);
            return trimmed(decoded ? *decoded : raw);
        }
        if (std::regex_search(*content_disposition, m, basic) && m[1].length() > 0) {
            return trimmed(m[1].str());
        }
    }

    std::string path = url_path_of(source_url);
    auto decoded = percent_decode(path);
    std::string name = RemotePath::basename(decoded ? *decoded : path);
    if (!name.empty() && name != "/" && name != ".") return name;

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("download-{}.bin", ms);
}

std::string WebDavClient::upload_from_url(const std::string& source_url, const std::string& remote_path) {
    return retry_.run("FETCH " + source_url, [&]() -> std::string {
        StreamPipe pipe(STREAM_PIPE_CAPACITY);
        std::promise<HttpResponse> head_promise;
        auto head_future = head_promise.get_future();

        // Producer: GET the source and feed its body into the pipe
        std::thread producer([&]() {
            bool head_set = false;
            try {
                HttpRequest req;
                req.method = "GET";
                req.url = source_url;
                req.follow_redirects = true;
                req.stall_timeout = std::chrono::milliseconds(settings_.timeout_ms);

                http_->perform(req,
                    [&](const HttpResponse& head) {
                        head_promise.set_value(head);
                        head_set = true;
                        if (!head.ok()) {
                            throw RemoteError(fmt::format("GET {} failed: HTTP {}", source_url, head.status),
                                              head.status, is_retryable_status(head.status));
                        }
                    },
                    [&](const char* data, size_t len) { pipe.write(data, len); });
                pipe.close();
            } catch (const std::exception&) {
                if (!head_set) head_promise.set_exception(std::current_exception());
                pipe.set_writer_error(std::current_exception());
            }
        });

        // Unblock and join the producer on every exit path
        struct ProducerGuard {
            StreamPipe& pipe;
            std::thread& thread;
            ~ProducerGuard() {
                pipe.set_reader_error(std::make_exception_ptr(std::runtime_error("relay closed")));
                if (thread.joinable()) thread.join();
            }
        } guard{pipe, producer};

        HttpResponse head = head_future.get();
        if (!head.ok()) {
            throw RemoteError(fmt::format("GET {} failed: HTTP {}", source_url, head.status),
                              head.status, is_retryable_status(head.status));
        }

        std::string file_name = pick_filename(source_url, head.header("content-disposition"));
        std::string target = StringUtils::ends_with(remote_path, "/")
            ? RemotePath::join({remote_path, file_name})
            : remote_path;

        int64_t body_size = -1;
        if (auto length = head.header("content-length")) {
            body_size = parse_int64(*length).value_or(-1);
        }

        put_stream(target,
                   [&](char* buf, size_t len) { return pipe.read(buf, len); },
                   body_size,
                   head.header("content-type").value_or("application/octet-stream"));

        davsync_log(fmt::format("FETCH {} -> {}", source_url, target));
        return target;
    });
}

// ── Download ───────────────────────────────────────────────

void WebDavClient::download(const std::string& remote_path, const fs::path& local_path) {
    retry_.run("GET " + remote_path, [&]() {
        std::ofstream out;

        HttpRequest req;
        req.method = "GET";
        req.url = url_for(remote_path);
        req.headers = {auth_header_};
        req.follow_redirects = true;
        req.stall_timeout = std::chrono::milliseconds(settings_.timeout_ms);

        auto resp = http_->perform(req,
            [&](const HttpResponse& head) {
                if (!head.ok()) return;
                out.open(local_path, std::ios::binary | std::ios::trunc);
                if (!out) {
                    throw LocalIOError("Cannot open " + local_path.string() + " for writing");
                }
            },
            [&](const char* data, size_t len) {
                if (!out.is_open()) return; // error page body
                out.write(data, static_cast<std::streamsize>(len));
                if (!out) {
                    throw LocalIOError("Write error on " + local_path.string());
                }
            });

        if (!resp.ok()) {
            throw RemoteError(fmt::format("GET {} failed: HTTP {}", remote_path, resp.status),
                              resp.status, is_retryable_status(resp.status));
        }
        out.close();
        if (!out) {
            throw LocalIOError("Failed to finish writing " + local_path.string());
        }
    });
}
