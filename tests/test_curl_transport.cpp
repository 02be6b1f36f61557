#include <gtest/gtest.h>
#include <net/http_client.hpp>
#include <core/errors.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Single-threaded HTTP/1.1 server on 127.0.0.1. Answers each accepted
// connection with the next canned response, then closes it.
class LoopbackServer {
public:
    explicit LoopbackServer(std::vector<std::string> responses)
        : responses_(std::move(responses)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 4) != 0) {
            throw std::runtime_error("loopback bind failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackServer() {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        if (thread_.joinable()) thread_.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<std::string> request_lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_lines_;
    }

private:
    int fd_ = -1;
    int port_ = 0;
    std::vector<std::string> responses_;
    std::vector<std::string> request_lines_;
    mutable std::mutex mutex_;
    std::thread thread_;

    void serve() {
        for (const auto& response : responses_) {
            int conn = ::accept(fd_, nullptr, nullptr);
            if (conn < 0) return;

            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
                if (n <= 0) break;
                request.append(buf, static_cast<size_t>(n));
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                request_lines_.push_back(request.substr(0, request.find("\r\n")));
            }

            size_t sent = 0;
            while (sent < response.size()) {
                ssize_t n = ::send(conn, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) break;
                sent += static_cast<size_t>(n);
            }
            ::close(conn);
        }
    }
};

TEST(CurlTransportTest, HeadReportsLengthWithoutBody) {
    LoopbackServer server({
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 42\r\n"
        "ETag: \"abc\"\r\n"
        "Connection: close\r\n\r\n"});

    HttpRequest req;
    req.method = "HEAD";
    req.url = server.url("/file.txt");

    int body_calls = 0;
    CurlTransport transport;
    auto resp = transport.perform(req, nullptr, [&](const char*, size_t) { body_calls++; });

    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.header("content-length").value_or(""), "42");
    EXPECT_EQ(resp.header("etag").value_or(""), "\"abc\"");
    EXPECT_EQ(body_calls, 0);
    ASSERT_EQ(server.request_lines().size(), 1u);
    EXPECT_EQ(server.request_lines()[0], "HEAD /file.txt HTTP/1.1");
}

TEST(CurlTransportTest, RedirectDeliversFinalHeadersOnly) {
    LoopbackServer server({
        "HTTP/1.1 302 Found\r\n"
        "Location: /final\r\n"
        "X-Hop: first\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n\r\n",
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 5\r\n"
        "Content-Type: text/plain\r\n"
        "Connection: close\r\n\r\n"
        "hello"});

    HttpRequest req;
    req.url = server.url("/start");
    req.follow_redirects = true;

    std::vector<int> seen_status;
    std::string body;
    CurlTransport transport;
    auto resp = transport.perform(req,
        [&](const HttpResponse& head) { seen_status.push_back(head.status); },
        [&](const char* data, size_t len) { body.append(data, len); });

    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(seen_status, (std::vector<int>{200}));
    EXPECT_EQ(body, "hello");
    EXPECT_FALSE(resp.header("x-hop").has_value());
    EXPECT_EQ(resp.header("content-type").value_or(""), "text/plain");
    EXPECT_EQ(server.request_lines().size(), 2u);
}

TEST(CurlTransportTest, ErrorStatusIsReturnedNotThrown) {
    LoopbackServer server({
        "HTTP/1.1 404 Not Found\r\n"
        "Content-Length: 0\r\n"
        "Connection: close\r\n\r\n"});

    HttpRequest req;
    req.url = server.url("/missing");

    CurlTransport transport;
    auto resp = transport.perform(req, nullptr, nullptr);
    EXPECT_EQ(resp.status, 404);
    EXPECT_FALSE(resp.ok());
}

TEST(CurlTransportTest, BodyCallbackExceptionPropagates) {
    LoopbackServer server({
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 3\r\n"
        "Connection: close\r\n\r\n"
        "abc"});

    HttpRequest req;
    req.url = server.url("/data");

    CurlTransport transport;
    EXPECT_THROW(transport.perform(req, nullptr,
                     [](const char*, size_t) { throw LocalIOError("disk full"); }),
                 LocalIOError);
}

TEST(CurlTransportTest, RefusedConnectionIsRetryableTransportError) {
    int port = 0;
    {
        LoopbackServer closed({});
        port = std::stoi(closed.url("").substr(std::string("http://127.0.0.1:").size()));
    }

    HttpRequest req;
    req.url = "http://127.0.0.1:" + std::to_string(port) + "/";

    CurlTransport transport;
    try {
        transport.perform(req, nullptr, nullptr);
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.retryable());
    }
}
