#include "http_client.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <memory>

namespace {

// curl_global_init() is not thread-safe; run it once before any worker starts.
struct CurlGlobal {
    CURLcode rc;
    CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() { if (rc == CURLE_OK) curl_global_cleanup(); }
};

void ensure_curl_global() {
    static CurlGlobal global;
    if (global.rc != CURLE_OK) {
        throw TransportError(fmt::format("curl_global_init failed: {}",
                                         curl_easy_strerror(global.rc)), false);
    }
}

bool is_retryable_curl_code(CURLcode rc) {
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return true;
        default:
            return false;
    }
}

template <typename T>
void set_opt(CURL* h, CURLoption option, T value) {
    const CURLcode rc = curl_easy_setopt(h, option, value);
    if (rc != CURLE_OK) {
        throw TransportError(fmt::format("curl_easy_setopt({}) failed: {}",
                                         static_cast<int>(option), curl_easy_strerror(rc)), false);
    }
}

// State shared with the C callbacks for one transfer
struct TransferState {
    const HeadersCallback* on_headers = nullptr;
    const BodyCallback* on_body = nullptr;
    const std::function<size_t(char*, size_t)>* read_body = nullptr;

    HttpResponse head;
    bool headers_delivered = false;
    std::exception_ptr callback_error;

    void deliver_headers() {
        if (headers_delivered) return;
        headers_delivered = true;
        if (on_headers && *on_headers) (*on_headers)(head);
    }
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    const size_t len = size * nitems;
    std::string line(buffer, len);
    trim(line);
    if (line.empty()) return len;

    if (line.compare(0, 5, "HTTP/") == 0) {
        // New status line: 1xx interim or a redirect hop starts over
        st->head.headers.clear();
        auto sp = line.find(' ');
        st->head.status = sp == std::string::npos ? 0 : safe_stoi(line.substr(sp + 1, 3), 0);
        return len;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        st->head.headers[to_lower(trimmed(line.substr(0, colon)))] = trimmed(line.substr(colon + 1));
    }
    return len;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    const size_t len = size * nmemb;
    try {
        st->deliver_headers();
        if (st->on_body && *st->on_body) (*st->on_body)(ptr, len);
        return len;
    } catch (...) {
        st->callback_error = std::current_exception();
        return 0; // CURLE_WRITE_ERROR
    }
}

size_t read_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<TransferState*>(userdata);
    try {
        return (*st->read_body)(buffer, size * nitems);
    } catch (...) {
        st->callback_error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

} // namespace

CurlTransport::CurlTransport() {
    ensure_curl_global();
}

HttpResponse CurlTransport::perform(const HttpRequest& request,
                                    const HeadersCallback& on_headers,
                                    const BodyCallback& on_body) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw TransportError("curl_easy_init failed", false);
    }
    CURL* h = curl.get();

    TransferState st;
    st.on_headers = &on_headers;
    st.on_body = &on_body;
    st.read_body = &request.read_body;

    char error_buf[CURL_ERROR_SIZE] = {};
    set_opt(h, CURLOPT_ERRORBUFFER, error_buf);
    set_opt(h, CURLOPT_URL, request.url.c_str());
    set_opt(h, CURLOPT_USERAGENT, DAVSYNC_USER_AGENT);
    set_opt(h, CURLOPT_NOSIGNAL, 1L); // required for multi-threaded use
    set_opt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECT_TIMEOUT_SECS));
    if (request.timeout.count() > 0) {
        set_opt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    }
    if (request.stall_timeout.count() > 0) {
        long secs = std::max(1L, static_cast<long>(request.stall_timeout.count() / 1000));
        set_opt(h, CURLOPT_LOW_SPEED_TIME, secs);
        set_opt(h, CURLOPT_LOW_SPEED_LIMIT, 1L); // [bytes/s]; 0 would disable the check
    }
    if (request.follow_redirects) {
        set_opt(h, CURLOPT_FOLLOWLOCATION, 1L);
        set_opt(h, CURLOPT_MAXREDIRS, 10L);
    }

    set_opt(h, CURLOPT_HEADERFUNCTION, header_cb);
    set_opt(h, CURLOPT_HEADERDATA, &st);
    set_opt(h, CURLOPT_WRITEFUNCTION, write_cb);
    set_opt(h, CURLOPT_WRITEDATA, &st);

    if (request.method == "HEAD" || request.no_body) {
        set_opt(h, CURLOPT_NOBODY, 1L);
    }
    if (request.read_body) {
        set_opt(h, CURLOPT_UPLOAD, 1L); // PUT
        set_opt(h, CURLOPT_READFUNCTION, read_cb);
        set_opt(h, CURLOPT_READDATA, &st);
        if (request.body_size >= 0) {
            set_opt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.body_size));
        }
    }
    if (request.method != "GET" && request.method != "HEAD" &&
        !(request.method == "PUT" && request.read_body)) {
        set_opt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    // "libcurl will not copy the entire list so you must keep it!"
    curl_slist* headers = nullptr;
    for (const auto& line : request.headers) {
        headers = curl_slist_append(headers, line.c_str());
    }
    // Skip the 1s stall on servers that ignore "Expect: 100-continue"
    headers = curl_slist_append(headers, "Expect:");
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, curl_slist_free_all);
    set_opt(h, CURLOPT_HTTPHEADER, headers);

    const CURLcode rc = curl_easy_perform(h);

    if (st.callback_error) {
        std::rethrow_exception(st.callback_error);
    }
    if (rc != CURLE_OK) {
        std::string detail = error_buf[0] ? std::string(error_buf) : curl_easy_strerror(rc);
        throw TransportError(fmt::format("{} {}: {}", request.method, request.url, detail),
                             is_retryable_curl_code(rc));
    }

    long status = 0;
    if (curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
        throw TransportError(request.method + " " + request.url + ": no response code", false);
    }
    st.head.status = static_cast<int>(status);
    st.deliver_headers();
    return st.head;
}
