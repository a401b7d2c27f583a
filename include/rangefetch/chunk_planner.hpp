#pragma once

#include "chunk.hpp"
#include "resource_probe.hpp"
#include "resume_store.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace rangefetch {

struct PlanOptions {
    static constexpr std::uint64_t kDefaultMinChunkSize = 64 * 1024;

    unsigned concurrency{8};
    // Explicit chunk size; empty means "divide the total by the worker count".
    std::optional<std::uint64_t> chunk_size;
    std::uint64_t min_chunk_size{kDefaultMinChunkSize};
};

struct ChunkPlan {
    std::vector<Chunk> chunks;
    // Number of workers worth starting for this plan.
    unsigned concurrency{1};
    bool resumed{false};
    std::size_t completed_at_start{0};
    // False when bytes must be fetched as one plain stream (no Range header).
    bool ranged{true};
};

// Splits the resource into chunks. A manifest passed in is trusted as-is;
// callers check it with manifestMatches() first.
ChunkPlan planChunks(const ResourceDescriptor& descriptor, const PlanOptions& options,
                     const std::optional<ResumeManifest>& existing = std::nullopt);

// Throws PlanError unless `chunks` are ordered, contiguous and cover
// [0, total_length) exactly.
void validatePartition(const std::vector<Chunk>& chunks, std::uint64_t total_length);

} // namespace rangefetch
