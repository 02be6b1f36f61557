#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;            // "Name: value"

    // Pull-style body source. Returns bytes written into buf, 0 at end of stream.
    std::function<size_t(char* buf, size_t len)> read_body;
    int64_t body_size = -1;                      // -1 = unknown (chunked)

    std::chrono::milliseconds timeout{0};        // 0 = no overall limit
    std::chrono::milliseconds stall_timeout{0};  // abort when no bytes move this long
    bool no_body = false;                        // HEAD: don't expect a response body
    bool follow_redirects = false;
};

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // names lower-cased

    bool ok() const { return status >= 200 && status < 300; }

    std::optional<std::string> header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        if (it == headers.end()) return std::nullopt;
        return it->second;
    }
};

using HeadersCallback = std::function<void(const HttpResponse& head)>;
using BodyCallback = std::function<void(const char* data, size_t len)>;

// Seam between the WebDAV client and the wire. Implementations must be safe to
// call from several threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Perform one request. on_headers fires once with the final status and
    // headers before any body bytes reach on_body. Throws TransportError when
    // no response could be obtained; exceptions thrown by callbacks propagate.
    virtual HttpResponse perform(const HttpRequest& request,
                                 const HeadersCallback& on_headers,
                                 const BodyCallback& on_body) = 0;
};

// libcurl-backed transport. One easy handle per request.
class CurlTransport : public HttpTransport {
public:
    CurlTransport();

    HttpResponse perform(const HttpRequest& request,
                         const HeadersCallback& on_headers,
                         const BodyCallback& on_body) override;
};
