#include "rangefetch/chunk_planner.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace rangefetch {

namespace {

std::uint64_t ceilDiv(std::uint64_t value, std::uint64_t divisor) {
    return value / divisor + (value % divisor != 0 ? 1 : 0);
}

Chunk makeChunk(std::size_t index, std::uint64_t start, std::uint64_t end) {
    Chunk chunk;
    chunk.index = index;
    chunk.start = start;
    chunk.end = end;
    return chunk;
}

ChunkPlan resumePlan(const ResumeManifest& manifest, unsigned concurrency) {
    ChunkPlan plan;
    plan.resumed = true;
    plan.chunks = manifest.chunks;

    std::size_t pending = 0;
    for (std::size_t i = 0; i < plan.chunks.size(); ++i) {
        auto& chunk = plan.chunks[i];
        chunk.index = i;
        chunk.attempts = 0;
        if (chunk.isComplete()) {
            chunk.bytes_written = chunk.size();
            ++plan.completed_at_start;
            continue;
        }
        // Interrupted or failed chunks start over as pending, keeping their bytes.
        chunk.state = ChunkState::Pending;
        ++pending;
    }

    plan.concurrency = static_cast<unsigned>(
        std::max<std::size_t>(1, std::min<std::size_t>(concurrency, pending)));
    return plan;
}

} // namespace

ChunkPlan planChunks(const ResourceDescriptor& descriptor, const PlanOptions& options,
                     const std::optional<ResumeManifest>& existing) {
    const unsigned concurrency = std::max(1u, options.concurrency);

    if (existing && descriptor.resumable()) {
        auto plan = resumePlan(*existing, concurrency);
        logger()->debug("resuming {} chunks, {} already complete", plan.chunks.size(),
                        plan.completed_at_start);
        return plan;
    }

    ChunkPlan plan;

    if (!descriptor.lengthKnown()) {
        plan.ranged = false;
        plan.chunks.push_back(makeChunk(0, 0, Chunk::kOpenEnd));
        return plan;
    }

    const std::uint64_t total = *descriptor.total_length;
    if (total == 0) {
        plan.ranged = descriptor.accepts_ranges;
        return plan;
    }

    if (!descriptor.accepts_ranges) {
        plan.ranged = false;
        plan.chunks.push_back(makeChunk(0, 0, total));
        return plan;
    }

    if (options.chunk_size && *options.chunk_size > 0) {
        const std::uint64_t size = *options.chunk_size;
        const std::uint64_t count = ceilDiv(total, size);
        plan.chunks.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t i = 0; i < count; ++i) {
            const std::uint64_t start = i * size;
            plan.chunks.push_back(
                makeChunk(static_cast<std::size_t>(i), start, std::min(start + size, total)));
        }
        plan.concurrency = static_cast<unsigned>(std::min<std::uint64_t>(concurrency, count));
    } else {
        const std::uint64_t min_size = std::max<std::uint64_t>(1, options.min_chunk_size);
        const std::uint64_t count =
            std::max<std::uint64_t>(1, std::min<std::uint64_t>(concurrency, ceilDiv(total, min_size)));
        const std::uint64_t base = total / count;
        plan.chunks.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t i = 0; i < count; ++i) {
            const std::uint64_t start = i * base;
            const std::uint64_t end = (i + 1 == count) ? total : start + base;
            plan.chunks.push_back(makeChunk(static_cast<std::size_t>(i), start, end));
        }
        plan.concurrency = static_cast<unsigned>(count);
    }

    logger()->debug("planned {} chunks over {} bytes for {} workers", plan.chunks.size(), total,
                    plan.concurrency);
    return plan;
}

void validatePartition(const std::vector<Chunk>& chunks, std::uint64_t total_length) {
    std::uint64_t expected = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.start != expected) {
            throw PlanError(fmt::format("chunk {} starts at {} instead of {}", i, chunk.start,
                                        expected));
        }
        if (chunk.end <= chunk.start) {
            throw PlanError(fmt::format("chunk {} is empty or reversed", i));
        }
        if (chunk.bytes_written > chunk.size()) {
            throw PlanError(fmt::format("chunk {} reports {} bytes written for {} bytes", i,
                                        chunk.bytes_written, chunk.size()));
        }
        expected = chunk.end;
    }
    if (expected != total_length) {
        throw PlanError(fmt::format("chunks cover {} bytes of {}", expected, total_length));
    }
}

} // namespace rangefetch
