#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace rangefetch {

enum class ChunkState {
    Pending,
    InProgress,
    Complete,
    Failed,
};

// Half-open byte range [start, end) of the destination file plus its
// transfer state. The range is fixed once planned.
struct Chunk {
    // End marker of the single chunk used when the total length is unknown.
    static constexpr std::uint64_t kOpenEnd = std::numeric_limits<std::uint64_t>::max();

    std::size_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};
    ChunkState state{ChunkState::Pending};
    std::uint64_t bytes_written{0};
    unsigned attempts{0};

    [[nodiscard]] bool openEnded() const noexcept { return end == kOpenEnd; }
    [[nodiscard]] std::uint64_t size() const noexcept { return end - start; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return start + bytes_written; }
    [[nodiscard]] std::uint64_t remaining() const noexcept {
        return openEnded() ? kOpenEnd : size() - bytes_written;
    }
    [[nodiscard]] bool isComplete() const noexcept { return state == ChunkState::Complete; }
};

const char* toString(ChunkState state) noexcept;
std::optional<ChunkState> chunkStateFromString(std::string_view text) noexcept;

} // namespace rangefetch
