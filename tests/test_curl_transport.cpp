#include <catch2/catch.hpp>

#include "rangefetch/curl_transport.hpp"
#include "rangefetch/errors.hpp"

#include <cerrno>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace rangefetch;
using namespace std::chrono_literals;

namespace {

const std::string kPlainBody = "hello from the loopback server\n";

// Minimal HTTP/1.1 server on 127.0.0.1 answering canned responses, one
// connection at a time, each closed after its response.
class LoopbackServer {
public:
    LoopbackServer() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "socket");
        }
        const int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 8) != 0) {
            const int err = errno;
            ::close(listen_fd_);
            throw std::system_error(err, std::generic_category(), "bind/listen");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        // Wakes the blocked accept().
        ::shutdown(listen_fd_, SHUT_RDWR);
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listen_fd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void serve() {
        while (true) {
            const int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return;
            }
            const auto request = readRequest(fd);
            if (!request.empty()) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(request);
                }
                sendAll(fd, respond(request));
            }
            ::close(fd);
        }
    }

    static std::string readRequest(int fd) {
        std::string data;
        char buffer[4096];
        while (data.find("\r\n\r\n") == std::string::npos) {
            const ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return {};
            }
            data.append(buffer, static_cast<std::size_t>(n));
        }
        return data;
    }

    static void sendAll(int fd, const std::string& data) {
        std::size_t sent = 0;
        while (sent < data.size()) {
            const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return;
            }
            sent += static_cast<std::size_t>(n);
        }
    }

    static std::string respond(const std::string& request) {
        const auto method_end = request.find(' ');
        const auto path_end = request.find(' ', method_end + 1);
        const auto method = request.substr(0, method_end);
        const auto path = request.substr(method_end + 1, path_end - method_end - 1);

        std::string head;
        std::string body;
        if (path == "/redirect") {
            head = "HTTP/1.1 302 Found\r\n"
                   "Location: /partial\r\n"
                   "X-Hop: first\r\n"
                   "Content-Length: 0\r\n";
        } else if (path == "/partial") {
            body = "0123456789";
            head = "HTTP/1.1 206 Partial Content\r\n"
                   "Content-Range: bytes 0-9/100\r\n"
                   "ETag: \"e1\"\r\n"
                   "Content-Length: 10\r\n";
        } else if (path == "/plain") {
            body = kPlainBody;
            head = "HTTP/1.1 200 OK\r\n"
                   "Accept-Ranges: bytes\r\n"
                   "Content-Length: " + std::to_string(body.size()) + "\r\n";
        } else {
            body = "not found";
            head = "HTTP/1.1 404 Not Found\r\n"
                   "Content-Length: " + std::to_string(body.size()) + "\r\n";
        }
        head += "Connection: close\r\n\r\n";
        return method == "HEAD" ? head : head + body;
    }

    int listen_fd_{-1};
    unsigned short port_{0};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
};

class RecordingHandler : public ResponseHandler {
public:
    bool onHeaders(const HttpResponse& response) override {
        ++header_calls;
        head = response;
        return accept_headers;
    }

    bool onBody(const char* data, std::size_t size) override {
        ++body_calls;
        body.append(data, size);
        return true;
    }

    bool accept_headers{true};
    int header_calls{0};
    int body_calls{0};
    HttpResponse head;
    std::string body;
};

class FailingWriteHandler : public RecordingHandler {
public:
    bool onBody(const char*, std::size_t) override {
        throw std::system_error(std::make_error_code(std::errc::no_space_on_device), "write");
    }
};

TransportOptions loopbackOptions() {
    TransportOptions options;
    options.proxy_mode = ProxyMode::Off;
    options.connect_timeout = 5s;
    return options;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TEST_CASE("Redirects deliver only the final response headers", "[curl]") {
    LoopbackServer server;
    CurlTransport transport(loopbackOptions());

    HttpRequest request;
    request.url = server.url("/redirect");
    request.headers.emplace_back("Range", "bytes=0-9");

    RecordingHandler handler;
    const auto response = transport.request(request, handler);

    REQUIRE(response.status == 206);
    REQUIRE(endsWith(response.effective_url, "/partial"));
    REQUIRE(response.header("Content-Range").value_or("") == "bytes 0-9/100");
    REQUIRE(response.header("etag").value_or("") == "\"e1\"");
    REQUIRE_FALSE(response.header("X-Hop"));
    REQUIRE_FALSE(response.header("Location"));

    REQUIRE(handler.header_calls == 1);
    REQUIRE(handler.head.status == 206);
    REQUIRE_FALSE(handler.head.header("X-Hop"));
    REQUIRE(handler.body == "0123456789");

    const auto requests = server.requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[1].rfind("GET /partial ", 0) == 0);
    REQUIRE(requests[1].find("Range: bytes=0-9\r\n") != std::string::npos);
    REQUIRE(requests[1].find("User-Agent: rangefetch/1.0\r\n") != std::string::npos);
}

TEST_CASE("A handler that declines the headers ends the request without an error", "[curl]") {
    LoopbackServer server;
    CurlTransport transport(loopbackOptions());

    HttpRequest request;
    request.url = server.url("/plain");

    RecordingHandler handler;
    handler.accept_headers = false;

    HttpResponse response;
    REQUIRE_NOTHROW(response = transport.request(request, handler));
    REQUIRE(response.status == 200);
    REQUIRE(handler.header_calls == 1);
    REQUIRE(handler.body_calls == 0);
}

TEST_CASE("Exceptions from the body handler reach the caller unchanged", "[curl]") {
    LoopbackServer server;
    CurlTransport transport(loopbackOptions());

    HttpRequest request;
    request.url = server.url("/plain");

    FailingWriteHandler handler;
    try {
        transport.request(request, handler);
        FAIL("request should have thrown");
    } catch (const TransportError&) {
        FAIL("handler failure was reported as a transport error");
    } catch (const std::system_error& e) {
        REQUIRE(e.code().value() == ENOSPC);
    }
    REQUIRE(handler.header_calls == 1);
}

TEST_CASE("A refused connection raises TransportError", "[curl]") {
    // Bind an ephemeral port and release it so nothing listens there.
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    ::close(fd);

    CurlTransport transport(loopbackOptions());
    HttpRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(ntohs(addr.sin_port)) + "/plain";

    RecordingHandler handler;
    REQUIRE_THROWS_AS(transport.request(request, handler), TransportError);
    REQUIRE(handler.header_calls == 0);
}

TEST_CASE("HEAD requests report headers without a body", "[curl]") {
    LoopbackServer server;
    CurlTransport transport(loopbackOptions());

    HttpRequest request;
    request.method = "HEAD";
    request.url = server.url("/plain");

    RecordingHandler handler;
    const auto response = transport.request(request, handler);

    REQUIRE(response.status == 200);
    REQUIRE(response.header("Content-Length").value_or("") == std::to_string(kPlainBody.size()));
    REQUIRE(response.header("Accept-Ranges").value_or("") == "bytes");
    REQUIRE(handler.header_calls == 1);
    REQUIRE(handler.body_calls == 0);

    const auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].rfind("HEAD /plain ", 0) == 0);
}

TEST_CASE("Non-success statuses are responses, not errors", "[curl]") {
    LoopbackServer server;
    CurlTransport transport(loopbackOptions());

    HttpRequest request;
    request.url = server.url("/missing");

    RecordingHandler handler;
    const auto response = transport.request(request, handler);
    REQUIRE(response.status == 404);
    REQUIRE_FALSE(response.isSuccess());
    REQUIRE(handler.body == "not found");
}
