#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rangefetch {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A request could not be carried out at all (DNS, connect, TLS, timeout...).
class TransportError : public Error {
public:
    using Error::Error;
};

enum class ProbeErrorKind {
    Unreachable,
    ServerRejected,
    AmbiguousLength,
};

class ProbeError : public Error {
public:
    ProbeError(ProbeErrorKind kind, const std::string& message, long status = 0)
        : Error(message), kind_(kind), status_(status) {}

    [[nodiscard]] ProbeErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] long status() const noexcept { return status_; }

private:
    ProbeErrorKind kind_;
    long status_;
};

// The chunk layout is inconsistent, typically a damaged resume manifest.
class PlanError : public Error {
public:
    using Error::Error;
};

class ChunkTransferError : public Error {
public:
    ChunkTransferError(std::size_t chunk, const std::string& message, long status = 0,
                       bool range_rejected = false)
        : Error(message), chunk_(chunk), status_(status), range_rejected_(range_rejected) {}

    [[nodiscard]] std::size_t chunk() const noexcept { return chunk_; }
    [[nodiscard]] long status() const noexcept { return status_; }
    [[nodiscard]] bool rangeRejected() const noexcept { return range_rejected_; }

private:
    std::size_t chunk_;
    long status_;
    bool range_rejected_;
};

class FinalizationError : public Error {
public:
    using Error::Error;
};

class PersistenceError : public Error {
public:
    using Error::Error;
};

const char* toString(ProbeErrorKind kind) noexcept;

} // namespace rangefetch
