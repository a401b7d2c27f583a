#include "rangefetch/curl_transport.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <cctype>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace rangefetch {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// curl_global_init is not thread-safe, so it runs once before the first handle.
void initCurlOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw TransportError(fmt::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
        }
        std::atexit([] { curl_global_cleanup(); });

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        logger()->debug("using libcurl {}", info && info->version ? info->version : "?");
    });
}

// State shared with the C callbacks of a single easy handle.
struct RequestContext {
    CURL* curl{nullptr};
    ResponseHandler* handler{nullptr};
    HttpResponse response;
    bool headers_delivered{false};
    bool aborted{false};
    std::exception_ptr error;

    bool deliverHeaders() {
        if (headers_delivered) {
            return !aborted;
        }
        headers_delivered = true;

        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.status = code;

        char* effective = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            response.effective_url = effective;
        }

        if (!handler->onHeaders(response)) {
            aborted = true;
        }
        return !aborted;
    }
};

std::string trimmed(const char* data, std::size_t size) {
    std::size_t begin = 0;
    std::size_t end = size;
    while (begin < end && std::isspace(static_cast<unsigned char>(data[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(data[end - 1]))) {
        --end;
    }
    return std::string(data + begin, end - begin);
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    const size_t total = size * nitems;

    // Every status line starts a new response in the redirect chain.
    if (total >= 5 && std::string(buffer, 5) == "HTTP/") {
        ctx->response.headers.clear();
        return total;
    }

    const std::string line(buffer, total);
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }

    auto name = trimmed(line.data(), colon);
    auto value = trimmed(line.data() + colon + 1, line.size() - colon - 1);
    if (!name.empty()) {
        ctx->response.headers[std::move(name)] = std::move(value);
    }
    return total;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    const size_t total = size * nmemb;

    try {
        if (!ctx->deliverHeaders()) {
            return 0;
        }
        if (total == 0) {
            return 0;
        }
        if (!ctx->handler->onBody(ptr, total)) {
            ctx->aborted = true;
            return 0;
        }
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
    return total;
}

int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<RequestContext*>(userdata);
    if (!ctx->handler->keepGoing()) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

void applyOptions(CURL* curl, const TransportOptions& options) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, options.low_speed_limit);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.low_speed_time.count()));

    switch (options.proxy_mode) {
    case ProxyMode::Auto:
        break;
    case ProxyMode::Off:
        // An empty proxy string overrides the environment.
        curl_easy_setopt(curl, CURLOPT_PROXY, "");
        break;
    case ProxyMode::Custom:
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy.c_str());
        break;
    }

    if (!options.ca_file.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.ca_file.c_str());
    }
    if (!options.verify_tls) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
}

} // namespace

CurlTransport::CurlTransport(TransportOptions options) : options_(std::move(options)) {
    if (options_.proxy_mode == ProxyMode::Custom && options_.proxy.empty()) {
        throw std::invalid_argument("proxy mode custom requires a proxy URL");
    }
    initCurlOnce();
    logger()->debug("curl transport ready (user agent '{}', proxy mode {})", options_.user_agent,
                    static_cast<int>(options_.proxy_mode));
}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::request(const HttpRequest& request, ResponseHandler& handler) {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        throw TransportError("Failed to allocate curl handle");
    }

    RequestContext ctx;
    ctx.curl = curl.get();
    ctx.handler = &handler;

    char error_buffer[CURL_ERROR_SIZE] = {0};
    applyOptions(curl.get(), options_);
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    if (request.method == "HEAD") {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    HeaderList headers{nullptr, &curl_slist_free_all};
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended) {
            throw TransportError("Failed to build request headers");
        }
        headers.release();
        headers.reset(appended);
    }
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    const CURLcode res = curl_easy_perform(curl.get());

    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }

    if (res != CURLE_OK && !ctx.aborted) {
        const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
        throw TransportError(fmt::format("{} {}: {}", request.method, request.url, detail));
    }

    // Responses without a body never reach the write callback.
    if (!ctx.headers_delivered) {
        ctx.deliverHeaders();
    }

    return std::move(ctx.response);
}

} // namespace rangefetch
