#include "rangefetch/resource_probe.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace rangefetch {

namespace {

// Keeps the headers and drops the body; the probe never reads content.
class HeadersOnly final : public ResponseHandler {
public:
    bool onHeaders(const HttpResponse& head) override {
        head_ = head;
        return false;
    }

    bool onBody(const char*, std::size_t) override { return false; }

    [[nodiscard]] const HttpResponse& head() const noexcept { return head_; }

private:
    HttpResponse head_;
};

std::string identityOf(const HttpResponse& response) {
    if (auto etag = response.header("ETag"); etag && !etag->empty()) {
        return *etag;
    }
    if (auto modified = response.header("Last-Modified"); modified && !modified->empty()) {
        return *modified;
    }
    return {};
}

bool advertisesByteRanges(const HttpResponse& response) {
    auto value = response.header("Accept-Ranges");
    if (!value) {
        return false;
    }
    std::string lowered(*value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("bytes") != std::string::npos;
}

std::optional<std::uint64_t> contentLengthOf(const HttpResponse& response) {
    if (auto value = response.header("Content-Length")) {
        return parseContentLength(*value);
    }
    return std::nullopt;
}

std::optional<ResourceDescriptor> probeWithHead(Transport& transport, const std::string& url,
                                                std::string& failure) {
    HttpRequest request;
    request.method = "HEAD";
    request.url = url;

    HeadersOnly handler;
    HttpResponse response;
    try {
        response = transport.request(request, handler);
    } catch (const TransportError& e) {
        failure = e.what();
        logger()->debug("HEAD {} failed: {}", url, e.what());
        return std::nullopt;
    }

    logger()->debug("HEAD {} -> {}", url, response.status);
    if (!response.isSuccess()) {
        failure = fmt::format("HEAD answered {}", response.status);
        return std::nullopt;
    }

    const auto length = contentLengthOf(response);
    if (!length || *length == 0) {
        return std::nullopt;
    }

    ResourceDescriptor descriptor;
    descriptor.total_length = length;
    descriptor.accepts_ranges = advertisesByteRanges(response);
    descriptor.identity = identityOf(response);
    descriptor.effective_url = response.effective_url;
    return descriptor;
}

} // namespace

ResourceDescriptor probeResource(Transport& transport, const std::string& url,
                                 const ProbeOptions& options) {
    std::string head_failure;
    auto descriptor = probeWithHead(transport, url, head_failure);

    if (!descriptor) {
        logger()->debug("HEAD inconclusive for {}, trying ranged GET", url);

        HttpRequest request;
        request.url = url;
        request.headers.emplace_back("Range", rangeHeaderValue(0, 0));

        HeadersOnly handler;
        HttpResponse response;
        try {
            response = transport.request(request, handler);
        } catch (const TransportError& e) {
            std::string message = fmt::format("cannot reach {}: {}", url, e.what());
            if (!head_failure.empty()) {
                message += fmt::format(" (HEAD: {})", head_failure);
            }
            throw ProbeError(ProbeErrorKind::Unreachable, message);
        }

        logger()->debug("ranged GET {} -> {}", url, response.status);

        ResourceDescriptor probed;
        probed.identity = identityOf(response);
        probed.effective_url = response.effective_url;

        const auto content_range = response.header("Content-Range");
        if (response.status == 206) {
            probed.accepts_ranges = true;
            if (content_range) {
                if (auto parsed = parseContentRange(*content_range)) {
                    probed.total_length = parsed->total;
                }
            }
        } else if (response.status == 200) {
            probed.accepts_ranges = false;
            probed.total_length = contentLengthOf(response);
        } else if (response.status == 416 && content_range) {
            // "bytes */0": the resource exists and is empty.
            auto parsed = parseContentRange(*content_range);
            if (parsed && parsed->total && *parsed->total == 0) {
                probed.accepts_ranges = true;
                probed.total_length = 0;
            } else {
                throw ProbeError(ProbeErrorKind::ServerRejected,
                                 fmt::format("{} answered 416 ({})", url, *content_range), 416);
            }
        } else {
            throw ProbeError(ProbeErrorKind::ServerRejected,
                             fmt::format("{} answered {}", url, response.status), response.status);
        }

        descriptor = probed;
    }

    if (!descriptor->lengthKnown()) {
        if (!options.allow_unknown_length) {
            throw ProbeError(ProbeErrorKind::AmbiguousLength,
                             fmt::format("cannot determine the length of {} (no usable "
                                         "Content-Length or Content-Range)",
                                         url));
        }
        logger()->warn("length of {} is unknown; downloading as a single stream", url);
        descriptor->accepts_ranges = false;
    }

    logger()->info("probed {}: length {}, ranges {}, identity '{}'", url,
                   descriptor->total_length ? std::to_string(*descriptor->total_length) : "unknown",
                   descriptor->accepts_ranges ? "yes" : "no", descriptor->identity);
    return *descriptor;
}

} // namespace rangefetch
