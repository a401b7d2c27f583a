#include "rangefetch/chunk.hpp"

namespace rangefetch {

const char* toString(ChunkState state) noexcept {
    switch (state) {
    case ChunkState::Pending:
        return "pending";
    case ChunkState::InProgress:
        return "in_progress";
    case ChunkState::Complete:
        return "complete";
    case ChunkState::Failed:
        return "failed";
    }
    return "pending";
}

std::optional<ChunkState> chunkStateFromString(std::string_view text) noexcept {
    if (text == "pending") {
        return ChunkState::Pending;
    }
    if (text == "in_progress") {
        return ChunkState::InProgress;
    }
    if (text == "complete") {
        return ChunkState::Complete;
    }
    if (text == "failed") {
        return ChunkState::Failed;
    }
    return std::nullopt;
}

} // namespace rangefetch
