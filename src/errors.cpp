#include "rangefetch/errors.hpp"

namespace rangefetch {

const char* toString(ProbeErrorKind kind) noexcept {
    switch (kind) {
    case ProbeErrorKind::Unreachable:
        return "unreachable";
    case ProbeErrorKind::ServerRejected:
        return "rejected by server";
    case ProbeErrorKind::AmbiguousLength:
        return "ambiguous length";
    }
    return "unknown";
}

} // namespace rangefetch
