#pragma once

#include "rangefetch/curl_transport.hpp"

#include <cstdint>
#include <string>

#include <spdlog/common.h>

namespace rangefetch {

// Parsers for command-line option values. All throw std::runtime_error with
// a message naming the offending text.

// Byte count with an optional K, M or G suffix (powers of 1024). Zero and
// values that do not fit in 64 bits are rejected.
std::uint64_t parseSize(const std::string& text);

int parseInt(const std::string& option, const std::string& text, int min, int max);

spdlog::level::level_enum parseLogLevel(const std::string& text);

ProxyMode parseProxyMode(const std::string& text);

} // namespace rangefetch
