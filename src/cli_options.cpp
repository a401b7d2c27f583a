#include "rangefetch/cli_options.hpp"

#include <limits>
#include <stdexcept>

namespace rangefetch {

std::uint64_t parseSize(const std::string& text) {
    if (text.empty() || text[0] == '-') {
        throw std::runtime_error("Invalid size: " + text);
    }

    std::size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid size: " + text);
    }

    std::uint64_t multiplier = 1;
    const std::string suffix = text.substr(consumed);
    if (suffix == "K" || suffix == "k") {
        multiplier = 1024;
    } else if (suffix == "M" || suffix == "m") {
        multiplier = 1024 * 1024;
    } else if (suffix == "G" || suffix == "g") {
        multiplier = 1024ULL * 1024 * 1024;
    } else if (!suffix.empty()) {
        throw std::runtime_error("Invalid size suffix: " + text);
    }

    if (value == 0) {
        throw std::runtime_error("Size must be positive: " + text);
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw std::runtime_error("Invalid size: " + text);
    }
    return static_cast<std::uint64_t>(value) * multiplier;
}

int parseInt(const std::string& option, const std::string& text, int min, int max) {
    int value = 0;
    try {
        value = std::stoi(text);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + text);
    }
    if (value < min || value > max) {
        throw std::runtime_error("Value for " + option + " must be between " +
                                 std::to_string(min) + " and " + std::to_string(max));
    }
    return value;
}

spdlog::level::level_enum parseLogLevel(const std::string& text) {
    if (text == "off") {
        return spdlog::level::off;
    } else if (text == "error") {
        return spdlog::level::err;
    } else if (text == "warn") {
        return spdlog::level::warn;
    } else if (text == "info") {
        return spdlog::level::info;
    } else if (text == "debug") {
        return spdlog::level::debug;
    } else if (text == "trace") {
        return spdlog::level::trace;
    }
    throw std::runtime_error("Invalid log level: " + text);
}

ProxyMode parseProxyMode(const std::string& text) {
    if (text == "auto") {
        return ProxyMode::Auto;
    } else if (text == "off") {
        return ProxyMode::Off;
    } else if (text == "custom") {
        return ProxyMode::Custom;
    }
    throw std::runtime_error("Invalid proxy mode: " + text);
}

} // namespace rangefetch
