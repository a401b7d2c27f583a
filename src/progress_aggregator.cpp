#include "rangefetch/progress_aggregator.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <system_error>
#include <utility>

namespace rangefetch {

ProgressAggregator::ProgressAggregator(ResumeManifest state,
                                       std::optional<std::uint64_t> total_bytes,
                                       std::chrono::milliseconds interval)
    : state_(std::move(state)), total_bytes_(total_bytes), interval_(interval) {
    bytes_completed_ = state_.bytesWritten();
}

ProgressAggregator::~ProgressAggregator() {
    stop();
}

void ProgressAggregator::setProgressCallback(ProgressCallback callback) {
    callback_ = std::move(callback);
}

void ProgressAggregator::setPersistence(PersistHook persist, SyncHook sync) {
    persist_ = std::move(persist);
    sync_ = std::move(sync);
}

void ProgressAggregator::start() {
    if (started_) {
        return;
    }
    started_ = true;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        started_at_ = std::chrono::steady_clock::now();
        last_update_ = started_at_;
    }
    last_report_ = started_at_;
    consumer_ = std::thread([this] { consume(); });
}

void ProgressAggregator::post(const ProgressEvent& event) {
    events_.push(event);
}

void ProgressAggregator::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    events_.close();
    if (consumer_.joinable()) {
        consumer_.join();
    }
    // Events posted without a running consumer are still applied.
    while (auto event = events_.tryPop()) {
        apply(*event);
    }
    persist();
    report(true);
}

ProgressSnapshot ProgressAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return snapshotLocked();
}

ResumeManifest ProgressAggregator::manifest() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::uint64_t ProgressAggregator::bytesThisRun() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return bytes_this_run_;
}

bool ProgressAggregator::persistenceDegraded() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return degraded_;
}

void ProgressAggregator::consume() {
    while (auto event = events_.pop()) {
        apply(*event);
    }
}

void ProgressAggregator::apply(const ProgressEvent& event) {
    bool completed = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (event.chunk >= state_.chunks.size()) {
            logger()->warn("progress event for unknown chunk {}", event.chunk);
            return;
        }

        auto& chunk = state_.chunks[event.chunk];
        last_update_ = std::chrono::steady_clock::now();

        switch (event.kind) {
        case ProgressEvent::Kind::ChunkStarted:
            chunk.state = ChunkState::InProgress;
            break;
        case ProgressEvent::Kind::BytesWritten:
            chunk.bytes_written += event.bytes;
            bytes_completed_ += event.bytes;
            bytes_this_run_ += event.bytes;
            break;
        case ProgressEvent::Kind::ChunkRestarted:
            bytes_completed_ -= chunk.bytes_written;
            chunk.bytes_written = 0;
            break;
        case ProgressEvent::Kind::ChunkCompleted:
            chunk.state = ChunkState::Complete;
            completed = true;
            break;
        case ProgressEvent::Kind::ChunkRetrying:
            chunk.state = ChunkState::Pending;
            chunk.attempts = event.attempts;
            break;
        case ProgressEvent::Kind::ChunkFailed:
            chunk.state = ChunkState::Failed;
            chunk.attempts = event.attempts;
            break;
        }
    }

    if (completed) {
        persist();
    }
    report(false);
}

void ProgressAggregator::persist() {
    if (!persist_) {
        return;
    }

    const auto current = manifest();
    try {
        if (sync_) {
            sync_();
        }
        persist_(current);
    } catch (const PersistenceError& e) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!degraded_) {
            logger()->warn("resume manifest not saved, this run cannot be resumed: {}", e.what());
        }
        degraded_ = true;
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!degraded_) {
            logger()->warn("output not synced, resume manifest left unchanged: {}", e.what());
        }
        degraded_ = true;
    }
}

void ProgressAggregator::report(bool force) {
    if (!callback_) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (!force && now - last_report_ < interval_) {
        return;
    }
    last_report_ = now;
    callback_(snapshot());
}

ProgressSnapshot ProgressAggregator::snapshotLocked() const {
    ProgressSnapshot snapshot;
    snapshot.bytes_completed = bytes_completed_;
    snapshot.total_bytes = total_bytes_;
    snapshot.elapsed = std::chrono::steady_clock::now() - started_at_;
    return snapshot;
}

} // namespace rangefetch
