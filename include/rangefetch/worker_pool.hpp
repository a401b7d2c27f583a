#pragma once

#include "cancellation.hpp"
#include "channel.hpp"
#include "chunk.hpp"
#include "output_file.hpp"
#include "progress_aggregator.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace rangefetch {

class ChunkTransferError;

struct RetryPolicy {
    // Attempts per chunk, the first one included.
    unsigned max_attempts{5};
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    // Each delay is randomly stretched or shrunk by up to this fraction.
    double jitter{0.25};

    // Delay before the retry that follows failure number `failures` (1-based):
    // base_delay * 2^(failures-1), capped at max_delay, then jittered.
    [[nodiscard]] std::chrono::milliseconds delayFor(unsigned failures, std::mt19937_64& rng) const;
};

struct WorkerPoolOptions {
    std::string url;
    unsigned concurrency{1};
    RetryPolicy retry;
    // False when the server cannot serve ranges; chunks are then fetched as
    // plain GETs and restart from offset 0 after a failure.
    bool ranged{true};
};

struct ChunkFailure {
    std::size_t chunk{0};
    unsigned attempts{0};
    std::string reason;
    long status{0};
    bool range_rejected{false};
};

struct PoolOutcome {
    bool completed{false};
    bool cancelled{false};
    std::vector<ChunkFailure> failures;
    // At least one ranged request was answered with the requested range.
    bool range_honoured{false};
};

// Fixed set of threads pulling chunks from a shared queue. Each chunk runs a
// bounded state machine Pending -> InProgress -> Complete, or back to Pending
// after a transient error until RetryPolicy::max_attempts is reached. The
// first terminal failure halts the whole pool.
class WorkerPool {
public:
    WorkerPool(Transport& transport, OutputFile& file, ProgressAggregator& aggregator,
               WorkerPoolOptions options, CancellationToken& cancel);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Fetches every chunk not already Complete. Blocks until all are done,
    // one fails for good, or the transfer is cancelled.
    PoolOutcome run(std::vector<Chunk> chunks);

    [[nodiscard]] bool stopping() const noexcept;

private:
    class ChunkWriter;

    enum class FetchResult {
        Complete,
        Interrupted,
    };

    void workerLoop(unsigned id);
    FetchResult fetch(Chunk& chunk);
    void retryOrFail(Chunk chunk, const ChunkTransferError& error, std::mt19937_64& rng);
    void fail(const Chunk& chunk, const std::string& reason, long status, bool range_rejected);
    void halt();
    bool sleepUnlessStopped(std::chrono::milliseconds delay);

    Transport& transport_;
    OutputFile& file_;
    ProgressAggregator& aggregator_;
    WorkerPoolOptions options_;
    CancellationToken& cancel_;

    Channel<Chunk> queue_;
    std::atomic<std::size_t> outstanding_{0};
    std::atomic<bool> halted_{false};
    std::atomic<bool> range_honoured_{false};
    CancellationToken halt_signal_;

    std::mutex failures_mutex_;
    std::vector<ChunkFailure> failures_;
};

} // namespace rangefetch
