#pragma once

#include "transport.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rangefetch {

struct ResourceDescriptor {
    std::optional<std::uint64_t> total_length;
    bool accepts_ranges{false};
    // ETag, or Last-Modified when the server sends no ETag. Empty if neither.
    std::string identity;
    std::string effective_url;

    [[nodiscard]] bool lengthKnown() const noexcept { return total_length.has_value(); }
    [[nodiscard]] bool resumable() const noexcept { return lengthKnown() && accepts_ranges; }
};

struct ProbeOptions {
    // When false an unknown length is reported as ProbeErrorKind::AmbiguousLength
    // instead of degrading to a single open-ended stream.
    bool allow_unknown_length{true};
};

// Learns length, range support and identity of `url`. Tries HEAD first and
// falls back to a one byte ranged GET. Throws ProbeError.
ResourceDescriptor probeResource(Transport& transport, const std::string& url,
                                 const ProbeOptions& options = {});

} // namespace rangefetch
