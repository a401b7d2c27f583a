#include "rangefetch/worker_pool.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace rangefetch {

namespace {

constexpr std::chrono::milliseconds kPollInterval{100};

} // namespace

std::chrono::milliseconds RetryPolicy::delayFor(unsigned failures, std::mt19937_64& rng) const {
    const unsigned exponent = std::min(failures > 0 ? failures - 1 : 0u, 30u);
    const double raw = static_cast<double>(base_delay.count()) * std::ldexp(1.0, static_cast<int>(exponent));
    double delay = std::min(raw, static_cast<double>(max_delay.count()));

    if (jitter > 0.0) {
        std::uniform_real_distribution<double> spread(-jitter, jitter);
        delay *= 1.0 + spread(rng);
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(std::max(0.0, delay))};
}

// Streams one response into the chunk's byte range, strictly in order.
class WorkerPool::ChunkWriter final : public ResponseHandler {
public:
    ChunkWriter(WorkerPool& pool, Chunk& chunk, bool ranged)
        : pool_(pool), chunk_(chunk), ranged_(ranged) {}

    bool onHeaders(const HttpResponse& head) override {
        if (!head.isSuccess()) {
            reject(fmt::format("server answered {}", head.status), head.status);
            return false;
        }

        if (!ranged_) {
            if (head.status != 200) {
                reject(fmt::format("unexpected status {} for a full download", head.status),
                       head.status);
                return false;
            }
            return true;
        }

        if (head.status == 206) {
            if (auto value = head.header("Content-Range")) {
                const auto range = parseContentRange(*value);
                if (!range || !range->first || *range->first != chunk_.offset()) {
                    reject(fmt::format("server sent range '{}' for offset {}", *value,
                                       chunk_.offset()),
                           head.status);
                    return false;
                }
            }
            pool_.range_honoured_.store(true, std::memory_order_relaxed);
            return true;
        }

        // A full body starting at byte 0 still fits a chunk that starts there.
        if (chunk_.offset() == 0) {
            return true;
        }
        reject(fmt::format("server ignored the Range header (status {})", head.status),
               head.status, true);
        return false;
    }

    bool onBody(const char* data, std::size_t size) override {
        std::size_t take = size;
        if (!chunk_.openEnded()) {
            take = static_cast<std::size_t>(std::min<std::uint64_t>(size, chunk_.remaining()));
        }

        if (take > 0) {
            pool_.file_.writeAt(chunk_.offset(), data, take);
            chunk_.bytes_written += take;

            ProgressEvent event;
            event.kind = ProgressEvent::Kind::BytesWritten;
            event.chunk = chunk_.index;
            event.bytes = take;
            pool_.aggregator_.post(event);
        }

        if (take < size) {
            // The chunk is full; whatever the server sends next belongs elsewhere.
            return false;
        }
        return !pool_.stopping();
    }

    [[nodiscard]] bool keepGoing() const override { return !pool_.stopping(); }

    [[nodiscard]] const std::optional<ChunkTransferError>& rejection() const noexcept {
        return rejection_;
    }

private:
    void reject(const std::string& reason, long status, bool range_rejected = false) {
        rejection_.emplace(chunk_.index, reason, status, range_rejected);
    }

    WorkerPool& pool_;
    Chunk& chunk_;
    bool ranged_;
    std::optional<ChunkTransferError> rejection_;
};

WorkerPool::WorkerPool(Transport& transport, OutputFile& file, ProgressAggregator& aggregator,
                       WorkerPoolOptions options, CancellationToken& cancel)
    : transport_(transport),
      file_(file),
      aggregator_(aggregator),
      options_(std::move(options)),
      cancel_(cancel) {}

PoolOutcome WorkerPool::run(std::vector<Chunk> chunks) {
    std::size_t pending = 0;
    for (auto& chunk : chunks) {
        if (chunk.isComplete()) {
            continue;
        }
        chunk.state = ChunkState::Pending;
        queue_.push(std::move(chunk));
        ++pending;
    }
    outstanding_.store(pending);

    PoolOutcome outcome;
    if (pending == 0) {
        queue_.close();
        outcome.completed = true;
        return outcome;
    }

    const unsigned thread_count =
        static_cast<unsigned>(std::min<std::size_t>(std::max(1u, options_.concurrency), pending));
    logger()->debug("starting {} workers for {} chunks", thread_count, pending);

    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (unsigned i = 0; i < thread_count; ++i) {
        workers.emplace_back([this, i]() { workerLoop(i); });
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(failures_mutex_);
        outcome.failures = failures_;
    }
    outcome.completed = outstanding_.load() == 0;
    outcome.cancelled = !outcome.completed && outcome.failures.empty() && cancel_.cancelled();
    outcome.range_honoured = range_honoured_.load();
    return outcome;
}

bool WorkerPool::stopping() const noexcept {
    return halted_.load(std::memory_order_acquire) || cancel_.cancelled();
}

void WorkerPool::workerLoop(unsigned id) {
    std::mt19937_64 rng{std::random_device{}() ^ (static_cast<std::uint64_t>(id) << 32)};

    while (!stopping()) {
        auto next = queue_.popFor(kPollInterval);
        if (!next) {
            if (queue_.closed()) {
                break;
            }
            continue;
        }
        if (stopping()) {
            break;
        }

        Chunk chunk = std::move(*next);
        chunk.state = ChunkState::InProgress;

        ProgressEvent started;
        started.kind = ProgressEvent::Kind::ChunkStarted;
        started.chunk = chunk.index;
        aggregator_.post(started);

        try {
            if (fetch(chunk) == FetchResult::Interrupted) {
                logger()->debug("chunk {} interrupted at offset {}", chunk.index, chunk.offset());
                break;
            }

            chunk.state = ChunkState::Complete;
            ProgressEvent done;
            done.kind = ProgressEvent::Kind::ChunkCompleted;
            done.chunk = chunk.index;
            aggregator_.post(done);
            logger()->debug("chunk {} complete", chunk.index);

            if (outstanding_.fetch_sub(1) == 1) {
                queue_.close();
            }
        } catch (const ChunkTransferError& e) {
            retryOrFail(std::move(chunk), e, rng);
        } catch (const std::system_error& e) {
            // Local I/O problems do not get better by asking the server again.
            fail(chunk, e.what(), 0, false);
        }
    }
}

WorkerPool::FetchResult WorkerPool::fetch(Chunk& chunk) {
    if (!chunk.openEnded() && chunk.remaining() == 0) {
        return FetchResult::Complete;
    }

    if (!options_.ranged && chunk.bytes_written > 0) {
        // Without ranges the only way to continue is from the beginning.
        ProgressEvent restarted;
        restarted.kind = ProgressEvent::Kind::ChunkRestarted;
        restarted.chunk = chunk.index;
        aggregator_.post(restarted);
        chunk.bytes_written = 0;
    }

    HttpRequest request;
    request.url = options_.url;
    if (options_.ranged) {
        request.headers.emplace_back("Range", rangeHeaderValue(chunk.offset(), chunk.end - 1));
    }

    logger()->debug("chunk {}: GET [{}, {}) attempt {}", chunk.index, chunk.offset(),
                    chunk.openEnded() ? std::string("eof") : std::to_string(chunk.end),
                    chunk.attempts + 1);

    ChunkWriter writer(*this, chunk, options_.ranged);
    HttpResponse response;
    try {
        response = transport_.request(request, writer);
    } catch (const TransportError& e) {
        throw ChunkTransferError(chunk.index, e.what());
    }

    if (writer.rejection()) {
        throw *writer.rejection();
    }

    if (chunk.openEnded()) {
        return stopping() ? FetchResult::Interrupted : FetchResult::Complete;
    }
    if (chunk.remaining() == 0) {
        return FetchResult::Complete;
    }
    if (stopping()) {
        return FetchResult::Interrupted;
    }
    throw ChunkTransferError(chunk.index,
                             fmt::format("connection closed after {} of {} bytes",
                                         chunk.bytes_written, chunk.size()),
                             response.status);
}

void WorkerPool::retryOrFail(Chunk chunk, const ChunkTransferError& error, std::mt19937_64& rng) {
    ++chunk.attempts;

    if (chunk.attempts >= options_.retry.max_attempts) {
        fail(chunk, error.what(), error.status(), error.rangeRejected());
        return;
    }

    ProgressEvent retrying;
    retrying.kind = ProgressEvent::Kind::ChunkRetrying;
    retrying.chunk = chunk.index;
    retrying.attempts = chunk.attempts;
    aggregator_.post(retrying);

    if (stopping()) {
        return;
    }

    const auto delay = options_.retry.delayFor(chunk.attempts, rng);
    logger()->warn("chunk {} attempt {}/{} failed: {}; retrying in {} ms", chunk.index,
                   chunk.attempts, options_.retry.max_attempts, error.what(), delay.count());

    if (!sleepUnlessStopped(delay)) {
        return;
    }
    chunk.state = ChunkState::Pending;
    queue_.push(std::move(chunk));
}

void WorkerPool::fail(const Chunk& chunk, const std::string& reason, long status,
                      bool range_rejected) {
    logger()->error("chunk {} [{}, {}) failed after {} attempts: {}", chunk.index, chunk.start,
                    chunk.openEnded() ? std::string("eof") : std::to_string(chunk.end),
                    chunk.attempts, reason);

    ProgressEvent failed;
    failed.kind = ProgressEvent::Kind::ChunkFailed;
    failed.chunk = chunk.index;
    failed.attempts = chunk.attempts;
    aggregator_.post(failed);

    {
        std::lock_guard<std::mutex> lock(failures_mutex_);
        failures_.push_back(ChunkFailure{chunk.index, chunk.attempts, reason, status, range_rejected});
    }
    halt();
}

void WorkerPool::halt() {
    halted_.store(true, std::memory_order_release);
    halt_signal_.cancel();
    queue_.close();
}

bool WorkerPool::sleepUnlessStopped(std::chrono::milliseconds delay) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (!stopping()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        // halt() wakes us at once; external cancellation is noticed on the next slice.
        halt_signal_.waitFor(std::min(left, kPollInterval));
    }
    return false;
}

} // namespace rangefetch
