#pragma once

#include "transport.hpp"

#include <chrono>
#include <string>

namespace rangefetch {

enum class ProxyMode {
    Auto,   // honour the *_proxy environment variables
    Off,
    Custom,
};

struct TransportOptions {
    std::string user_agent{"rangefetch/1.0"};
    ProxyMode proxy_mode{ProxyMode::Auto};
    std::string proxy;
    std::chrono::seconds connect_timeout{15};
    // A connection slower than low_speed_limit bytes/s for low_speed_time is dropped.
    long low_speed_limit{1};
    std::chrono::seconds low_speed_time{30};
    std::string ca_file;
    bool verify_tls{true};
    long max_redirects{10};
};

class CurlTransport final : public Transport {
public:
    explicit CurlTransport(TransportOptions options = {});
    ~CurlTransport() override;

    HttpResponse request(const HttpRequest& request, ResponseHandler& handler) override;

private:
    TransportOptions options_;
};

} // namespace rangefetch
