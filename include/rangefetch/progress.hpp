#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace rangefetch {

struct ProgressSnapshot {
    std::uint64_t bytes_completed{0};
    std::optional<std::uint64_t> total_bytes;
    std::chrono::steady_clock::duration elapsed{};
};

// Observational only; called from the aggregator thread at a bounded rate.
using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

// What workers tell the aggregator. Workers never touch shared totals.
struct ProgressEvent {
    enum class Kind {
        ChunkStarted,
        BytesWritten,
        ChunkRestarted,   // the chunk's bytes are void, it starts over at offset 0
        ChunkCompleted,
        ChunkRetrying,
        ChunkFailed,
    };

    Kind kind{Kind::BytesWritten};
    std::size_t chunk{0};
    std::uint64_t bytes{0};
    unsigned attempts{0};
};

} // namespace rangefetch
