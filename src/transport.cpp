#include "rangefetch/transport.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>

namespace rangefetch {

namespace {

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::uint64_t> parseNumber(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

} // namespace

bool HeaderNameLess::operator()(const std::string& lhs, const std::string& rhs) const noexcept {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) <
                   std::tolower(static_cast<unsigned char>(b));
        });
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string rangeHeaderValue(std::uint64_t first, std::optional<std::uint64_t> last) {
    std::string value = "bytes=" + std::to_string(first) + "-";
    if (last) {
        value += std::to_string(*last);
    }
    return value;
}

std::optional<ContentRange> parseContentRange(const std::string& value) {
    std::string_view text = trim(value);
    constexpr std::string_view unit = "bytes";
    if (text.size() <= unit.size() || text.substr(0, unit.size()) != unit) {
        return std::nullopt;
    }
    text = trim(text.substr(unit.size()));

    const auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return std::nullopt;
    }

    ContentRange range;
    const auto span = trim(text.substr(0, slash));
    const auto total = trim(text.substr(slash + 1));

    if (total != "*") {
        range.total = parseNumber(total);
        if (!range.total) {
            return std::nullopt;
        }
    }

    if (span != "*") {
        const auto dash = span.find('-');
        if (dash == std::string_view::npos) {
            return std::nullopt;
        }
        range.first = parseNumber(span.substr(0, dash));
        range.last = parseNumber(span.substr(dash + 1));
        if (!range.first || !range.last || *range.last < *range.first) {
            return std::nullopt;
        }
    }

    return range;
}

std::optional<std::uint64_t> parseContentLength(const std::string& value) {
    return parseNumber(value);
}

} // namespace rangefetch
