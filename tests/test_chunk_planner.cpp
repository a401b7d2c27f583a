#include <catch2/catch.hpp>

#include "rangefetch/chunk_planner.hpp"
#include "rangefetch/errors.hpp"

#include <cstdint>
#include <vector>

using namespace rangefetch;

namespace {

ResourceDescriptor rangedResource(std::uint64_t total) {
    ResourceDescriptor descriptor;
    descriptor.total_length = total;
    descriptor.accepts_ranges = true;
    descriptor.identity = "\"abc\"";
    return descriptor;
}

PlanOptions workers(unsigned count, std::uint64_t min_chunk_size = 1) {
    PlanOptions options;
    options.concurrency = count;
    options.min_chunk_size = min_chunk_size;
    return options;
}

} // namespace

TEST_CASE("Ten million bytes over four workers split evenly", "[planner]") {
    const auto plan = planChunks(rangedResource(10'000'000), workers(4, PlanOptions::kDefaultMinChunkSize));

    REQUIRE(plan.chunks.size() == 4);
    REQUIRE(plan.concurrency == 4);
    REQUIRE(plan.ranged);
    REQUIRE_FALSE(plan.resumed);

    const std::uint64_t bounds[] = {0, 2'500'000, 5'000'000, 7'500'000, 10'000'000};
    for (std::size_t i = 0; i < 4; ++i) {
        REQUIRE(plan.chunks[i].index == i);
        REQUIRE(plan.chunks[i].start == bounds[i]);
        REQUIRE(plan.chunks[i].end == bounds[i + 1]);
        REQUIRE(plan.chunks[i].size() == 2'500'000u);
        REQUIRE(plan.chunks[i].state == ChunkState::Pending);
    }
}

TEST_CASE("Chunks partition the resource for any length and worker count", "[planner]") {
    const std::uint64_t totals[] = {1, 2, 3, 7, 100, 4095, 65536, 1'000'003, 10'000'000};
    for (const auto total : totals) {
        for (unsigned concurrency = 1; concurrency <= 16; ++concurrency) {
            const auto plan = planChunks(rangedResource(total), workers(concurrency));
            REQUIRE_NOTHROW(validatePartition(plan.chunks, total));
            REQUIRE(plan.chunks.size() <= concurrency);

            std::uint64_t sum = 0;
            for (const auto& chunk : plan.chunks) {
                sum += chunk.size();
            }
            REQUIRE(sum == total);
        }
    }
}

TEST_CASE("The last chunk absorbs the remainder", "[planner]") {
    const auto plan = planChunks(rangedResource(10), workers(3));

    REQUIRE(plan.chunks.size() == 3);
    REQUIRE(plan.chunks[0].size() == 3u);
    REQUIRE(plan.chunks[1].size() == 3u);
    REQUIRE(plan.chunks[2].size() == 4u);
}

TEST_CASE("Minimum chunk size limits the number of chunks", "[planner]") {
    const auto plan = planChunks(rangedResource(100 * 1024), workers(8, 64 * 1024));

    REQUIRE(plan.chunks.size() == 2);
    REQUIRE(plan.concurrency == 2);
}

TEST_CASE("An explicit chunk size is honoured", "[planner]") {
    auto options = workers(2);
    options.chunk_size = 4;

    const auto plan = planChunks(rangedResource(10), options);

    REQUIRE(plan.chunks.size() == 3);
    REQUIRE(plan.chunks[0].start == 0u);
    REQUIRE(plan.chunks[0].end == 4u);
    REQUIRE(plan.chunks[1].end == 8u);
    REQUIRE(plan.chunks[2].end == 10u);
    REQUIRE(plan.concurrency == 2);
}

TEST_CASE("Without range support there is a single chunk", "[planner]") {
    auto descriptor = rangedResource(123456);
    descriptor.accepts_ranges = false;

    const auto plan = planChunks(descriptor, workers(8));

    REQUIRE(plan.chunks.size() == 1);
    REQUIRE(plan.chunks[0].start == 0u);
    REQUIRE(plan.chunks[0].end == 123456u);
    REQUIRE(plan.concurrency == 1);
    REQUIRE_FALSE(plan.ranged);
}

TEST_CASE("Unknown length gives one open-ended chunk", "[planner]") {
    ResourceDescriptor descriptor;

    const auto plan = planChunks(descriptor, workers(8));

    REQUIRE(plan.chunks.size() == 1);
    REQUIRE(plan.chunks[0].openEnded());
    REQUIRE(plan.concurrency == 1);
    REQUIRE_FALSE(plan.ranged);
}

TEST_CASE("An empty resource has no chunks", "[planner]") {
    const auto plan = planChunks(rangedResource(0), workers(4));

    REQUIRE(plan.chunks.empty());
}

TEST_CASE("A resume manifest is reused verbatim", "[planner]") {
    ResumeManifest manifest;
    manifest.destination = "out.bin";
    manifest.url = "http://example.test/out.bin";
    manifest.total_length = 300;
    manifest.identity = "\"abc\"";

    Chunk done;
    done.start = 0;
    done.end = 100;
    done.state = ChunkState::Complete;
    done.bytes_written = 100;

    Chunk interrupted;
    interrupted.start = 100;
    interrupted.end = 200;
    interrupted.state = ChunkState::InProgress;
    interrupted.bytes_written = 40;
    interrupted.attempts = 2;

    Chunk failed;
    failed.start = 200;
    failed.end = 300;
    failed.state = ChunkState::Failed;
    failed.attempts = 5;

    manifest.chunks = {done, interrupted, failed};

    const auto plan = planChunks(rangedResource(300), workers(8), manifest);

    REQUIRE(plan.resumed);
    REQUIRE(plan.completed_at_start == 1);
    REQUIRE(plan.concurrency == 2);
    REQUIRE(plan.chunks.size() == 3);
    REQUIRE(plan.chunks[0].state == ChunkState::Complete);
    REQUIRE(plan.chunks[1].state == ChunkState::Pending);
    REQUIRE(plan.chunks[1].bytes_written == 40u);
    REQUIRE(plan.chunks[1].attempts == 0u);
    REQUIRE(plan.chunks[2].state == ChunkState::Pending);
    REQUIRE(plan.chunks[2].index == 2);
}

TEST_CASE("validatePartition rejects broken layouts", "[planner]") {
    auto chunk = [](std::uint64_t start, std::uint64_t end) {
        Chunk c;
        c.start = start;
        c.end = end;
        return c;
    };

    REQUIRE_NOTHROW(validatePartition({chunk(0, 5), chunk(5, 10)}, 10));
    REQUIRE_THROWS_AS(validatePartition({chunk(0, 5), chunk(6, 10)}, 10), PlanError);
    REQUIRE_THROWS_AS(validatePartition({chunk(0, 6), chunk(5, 10)}, 10), PlanError);
    REQUIRE_THROWS_AS(validatePartition({chunk(0, 5), chunk(5, 9)}, 10), PlanError);
    REQUIRE_THROWS_AS(validatePartition({chunk(5, 10), chunk(0, 5)}, 10), PlanError);
    REQUIRE_THROWS_AS(validatePartition({}, 10), PlanError);
    REQUIRE_NOTHROW(validatePartition({}, 0));
}
