#include "rangefetch/transfer_coordinator.hpp"
#include "rangefetch/cancellation.hpp"
#include "rangefetch/chunk_planner.hpp"
#include "rangefetch/detail/sha256.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"
#include "rangefetch/output_file.hpp"
#include "rangefetch/progress_aggregator.hpp"
#include "rangefetch/resource_probe.hpp"
#include "rangefetch/resume_store.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace rangefetch {

namespace fs = std::filesystem;

const char* toString(TransferState state) noexcept {
    switch (state) {
    case TransferState::Probing:
        return "probing";
    case TransferState::Planning:
        return "planning";
    case TransferState::Transferring:
        return "transferring";
    case TransferState::Finalizing:
        return "finalizing";
    case TransferState::Done:
        return "done";
    case TransferState::Failed:
        return "failed";
    }
    return "unknown";
}

const char* toString(FailureKind kind) noexcept {
    switch (kind) {
    case FailureKind::None:
        return "none";
    case FailureKind::Probe:
        return "probe";
    case FailureKind::Plan:
        return "plan";
    case FailureKind::ChunkTransfer:
        return "chunk transfer";
    case FailureKind::Finalization:
        return "finalization";
    case FailureKind::Cancelled:
        return "cancelled";
    case FailureKind::Io:
        return "i/o";
    }
    return "unknown";
}

class TransferCoordinator::Impl {
public:
    Impl(TransferTarget target, std::shared_ptr<Transport> transport, TransferOptions options)
        : target_(std::move(target)),
          transport_(std::move(transport)),
          options_(std::move(options)),
          store_(options_.state_dir) {
        if (!transport_) {
            throw std::invalid_argument("TransferCoordinator needs a transport");
        }
        target_.concurrency = std::max(1u, target_.concurrency);
    }

    TransferResult run() {
        TransferResult result;

        setState(TransferState::Probing);
        ResourceDescriptor descriptor;
        try {
            ProbeOptions probe_options;
            probe_options.allow_unknown_length = options_.allow_unknown_length;
            descriptor = probeResource(*transport_, target_.url, probe_options);
        } catch (const ProbeError& e) {
            return fail(result, FailureKind::Probe, fmt::format("{}: {}", toString(e.kind()), e.what()));
        }
        result.bytes_total = descriptor.total_length;
        if (!descriptor.effective_url.empty() && descriptor.effective_url != target_.url) {
            logger()->info("{} redirects to {}", target_.url, descriptor.effective_url);
        }

        bool may_fall_back = true;
        while (true) {
            if (cancel_.cancelled()) {
                return fail(result, FailureKind::Cancelled, "transfer cancelled");
            }

            setState(TransferState::Planning);
            try {
                prepare(descriptor, result);
            } catch (const PlanError& e) {
                return fail(result, FailureKind::Plan, e.what());
            } catch (const std::system_error& e) {
                return fail(result, FailureKind::Io, e.what());
            }

            setState(TransferState::Transferring);
            const auto outcome = transfer(descriptor, result);
            if (outcome.completed) {
                break;
            }
            if (outcome.cancelled) {
                return fail(result, FailureKind::Cancelled,
                            fmt::format("transfer cancelled with {} of {} chunks complete; run "
                                        "again to resume",
                                        completedChunks(), result.chunks_total));
            }
            if (may_fall_back && rangesNeverHonoured(outcome)) {
                // The server advertised ranges but refuses every ranged request.
                logger()->warn("{} ignores range requests, falling back to a single stream",
                               target_.url);
                may_fall_back = false;
                descriptor.accepts_ranges = false;
                store_.discard(key());
                result.fell_back_to_single_stream = true;
                continue;
            }
            return fail(result, FailureKind::ChunkTransfer, describeFailures(outcome.failures));
        }

        setState(TransferState::Finalizing);
        try {
            finalize(descriptor);
        } catch (const FinalizationError& e) {
            return fail(result, FailureKind::Finalization, e.what());
        } catch (const std::system_error& e) {
            return fail(result, FailureKind::Io, e.what());
        } catch (const Error& e) {
            return fail(result, FailureKind::Finalization, e.what());
        }

        if (descriptor.resumable()) {
            store_.discard(key());
        }

        result.state = TransferState::Done;
        setState(TransferState::Done);
        logger()->info("{} saved to {} ({} bytes fetched this run)", target_.url,
                       target_.destination.string(), result.bytes_fetched);
        return result;
    }

    void cancel() { cancel_.cancel(); }

    void setProgressCallback(ProgressCallback callback) { callback_ = std::move(callback); }

    [[nodiscard]] TransferState state() const { return state_.load(); }

    [[nodiscard]] ProgressSnapshot progress() const {
        std::lock_guard<std::mutex> lock(aggregator_mutex_);
        if (aggregator_) {
            return aggregator_->snapshot();
        }
        ProgressSnapshot snapshot;
        snapshot.total_bytes = total_bytes_;
        return snapshot;
    }

    [[nodiscard]] const TransferTarget& target() const noexcept { return target_; }

private:
    [[nodiscard]] std::string key() const { return target_.destination.string(); }

    void setState(TransferState state) {
        state_.store(state);
        logger()->debug("{}: {}", target_.destination.string(), toString(state));
    }

    TransferResult& fail(TransferResult& result, FailureKind kind, const std::string& message) {
        result.state = TransferState::Failed;
        result.failure = kind;
        result.message = message;
        setState(TransferState::Failed);
        if (kind == FailureKind::Cancelled) {
            logger()->warn("{}: {}", target_.destination.string(), message);
        } else {
            logger()->error("{}: {} failed: {}", target_.destination.string(), toString(kind),
                            message);
        }
        if (file_) {
            try {
                file_->sync();
                file_->close();
            } catch (const std::system_error& e) {
                logger()->warn("cannot close {}: {}", target_.destination.string(), e.what());
            }
        }
        return result;
    }

    void prepare(const ResourceDescriptor& descriptor, TransferResult& result) {
        const bool resumable = options_.resume && descriptor.resumable();
        {
            std::lock_guard<std::mutex> lock(aggregator_mutex_);
            total_bytes_ = descriptor.total_length;
        }

        std::optional<ResumeManifest> existing;
        if (resumable) {
            existing = store_.loadMatching(key(), target_.url, descriptor);
            if (existing) {
                std::error_code ec;
                const auto on_disk = fs::file_size(target_.destination, ec);
                if (ec || on_disk != *descriptor.total_length) {
                    logger()->warn("{} does not match its manifest, starting over",
                                   target_.destination.string());
                    store_.discard(key());
                    existing.reset();
                }
            }
        } else {
            store_.discard(key());
        }

        PlanOptions plan_options;
        plan_options.concurrency = target_.concurrency;
        plan_options.chunk_size = target_.chunk_size;
        plan_options.min_chunk_size = options_.min_chunk_size;
        plan_ = planChunks(descriptor, plan_options, existing);

        file_.reset();
        file_ = std::make_unique<OutputFile>(
            target_.destination, plan_.resumed ? OutputFile::Mode::Keep : OutputFile::Mode::Truncate);
        if (!plan_.resumed && descriptor.total_length) {
            file_->allocate(*descriptor.total_length);
        }

        manifest_ = ResumeManifest{};
        manifest_.destination = key();
        manifest_.url = target_.url;
        manifest_.total_length = descriptor.total_length.value_or(0);
        manifest_.identity = descriptor.identity;
        manifest_.chunks = plan_.chunks;
        persist_manifest_ = resumable;

        if (resumable && !plan_.resumed && !plan_.chunks.empty()) {
            try {
                store_.save(manifest_);
            } catch (const PersistenceError& e) {
                logger()->warn("cannot create resume manifest, this run cannot be resumed: {}",
                               e.what());
                result.persistence_degraded = true;
            }
        }

        result.chunks_total = plan_.chunks.size();
        result.chunks_resumed = plan_.completed_at_start;
        if (plan_.resumed) {
            logger()->info("resuming {}: {} of {} chunks already complete",
                           target_.destination.string(), plan_.completed_at_start,
                           plan_.chunks.size());
        }
    }

    PoolOutcome transfer(const ResourceDescriptor& descriptor, TransferResult& result) {
        auto aggregator =
            std::make_unique<ProgressAggregator>(manifest_, descriptor.total_length,
                                                 options_.progress_interval);
        aggregator->setProgressCallback(callback_);
        if (persist_manifest_) {
            OutputFile* file = file_.get();
            aggregator->setPersistence([this](const ResumeManifest& manifest) { store_.save(manifest); },
                                       [file]() { file->sync(); });
        }

        ProgressAggregator* events = aggregator.get();
        {
            std::lock_guard<std::mutex> lock(aggregator_mutex_);
            aggregator_ = std::move(aggregator);
        }
        events->start();

        WorkerPoolOptions pool_options;
        pool_options.url = target_.url;
        pool_options.concurrency = plan_.concurrency;
        pool_options.retry = options_.retry;
        pool_options.ranged = plan_.ranged;

        WorkerPool pool(*transport_, *file_, *events, pool_options, cancel_);
        auto outcome = pool.run(plan_.chunks);

        events->stop();
        manifest_ = events->manifest();
        result.bytes_fetched += events->bytesThisRun();
        result.persistence_degraded = result.persistence_degraded || events->persistenceDegraded();
        result.failed_chunks = outcome.failures;
        return outcome;
    }

    void finalize(const ResourceDescriptor& descriptor) {
        file_->sync();
        const auto size = file_->size();
        file_->close();

        if (descriptor.total_length && size != *descriptor.total_length) {
            throw FinalizationError(fmt::format("{} is {} bytes, expected {}",
                                                target_.destination.string(), size,
                                                *descriptor.total_length));
        }

        if (options_.expected_sha256) {
            std::string expected = *options_.expected_sha256;
            std::transform(expected.begin(), expected.end(), expected.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            const auto actual = detail::sha256File(target_.destination);
            if (actual != expected) {
                throw FinalizationError(fmt::format("SHA-256 mismatch for {}: expected {}, got {}",
                                                    target_.destination.string(), expected,
                                                    actual));
            }
        }
    }

    [[nodiscard]] std::size_t completedChunks() const {
        return static_cast<std::size_t>(
            std::count_if(manifest_.chunks.begin(), manifest_.chunks.end(),
                          [](const Chunk& chunk) { return chunk.isComplete(); }));
    }

    [[nodiscard]] static bool rangesNeverHonoured(const PoolOutcome& outcome) {
        if (outcome.range_honoured || outcome.failures.empty()) {
            return false;
        }
        return std::all_of(outcome.failures.begin(), outcome.failures.end(),
                           [](const ChunkFailure& failure) { return failure.range_rejected; });
    }

    [[nodiscard]] std::string describeFailures(const std::vector<ChunkFailure>& failures) const {
        if (failures.empty()) {
            return "transfer stopped before all chunks completed";
        }
        std::string message;
        for (const auto& failure : failures) {
            if (!message.empty()) {
                message += "; ";
            }
            const auto& chunk = manifest_.chunks.at(failure.chunk);
            message += fmt::format("chunk {} [{}, {}) failed after {} attempts: {}", failure.chunk,
                                   chunk.start,
                                   chunk.openEnded() ? std::string("eof") : std::to_string(chunk.end),
                                   failure.attempts, failure.reason);
        }
        return message;
    }

    TransferTarget target_;
    std::shared_ptr<Transport> transport_;
    TransferOptions options_;
    ResumeStore store_;
    CancellationToken cancel_;
    ProgressCallback callback_;

    std::atomic<TransferState> state_{TransferState::Probing};
    std::unique_ptr<OutputFile> file_;

    mutable std::mutex aggregator_mutex_;
    std::unique_ptr<ProgressAggregator> aggregator_;
    std::optional<std::uint64_t> total_bytes_;

    ChunkPlan plan_;
    ResumeManifest manifest_;
    bool persist_manifest_{false};
};

TransferCoordinator::TransferCoordinator(TransferTarget target, std::shared_ptr<Transport> transport,
                                         TransferOptions options)
    : impl_(std::make_unique<Impl>(std::move(target), std::move(transport), std::move(options))) {}

TransferCoordinator::~TransferCoordinator() = default;

void TransferCoordinator::setProgressCallback(ProgressCallback callback) {
    impl_->setProgressCallback(std::move(callback));
}

TransferResult TransferCoordinator::run() { return impl_->run(); }

void TransferCoordinator::cancel() { impl_->cancel(); }

TransferState TransferCoordinator::state() const { return impl_->state(); }

ProgressSnapshot TransferCoordinator::progress() const { return impl_->progress(); }

const TransferTarget& TransferCoordinator::target() const { return impl_->target(); }

} // namespace rangefetch
