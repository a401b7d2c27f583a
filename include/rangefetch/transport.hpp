#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rangefetch {

struct HeaderNameLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const noexcept;
};

// Header names compare case-insensitively. A repeated header keeps its last value.
using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpResponse {
    long status{0};
    HeaderMap headers;
    std::string effective_url;

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
    [[nodiscard]] bool isSuccess() const noexcept { return status >= 200 && status < 300; }
};

// Receives one response. onHeaders is called exactly once with the final
// (post-redirect) status line and headers, before any body bytes. Returning
// false from any callback ends the request early; that is not an error.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    virtual bool onHeaders(const HttpResponse& head) = 0;
    virtual bool onBody(const char* data, std::size_t size) = 0;

    // Polled while the connection is idle.
    [[nodiscard]] virtual bool keepGoing() const { return true; }
};

// The one capability the engine needs from HTTP. Implementations must be
// safe to call from several threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Throws TransportError when no response could be obtained. Exceptions
    // thrown by the handler propagate to the caller unchanged.
    virtual HttpResponse request(const HttpRequest& request, ResponseHandler& handler) = 0;
};

std::string rangeHeaderValue(std::uint64_t first, std::optional<std::uint64_t> last);

struct ContentRange {
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
    std::optional<std::uint64_t> total;
};

// Parses "bytes 0-99/1000", "bytes 0-99/*" and "bytes */1000".
std::optional<ContentRange> parseContentRange(const std::string& value);

std::optional<std::uint64_t> parseContentLength(const std::string& value);

} // namespace rangefetch
