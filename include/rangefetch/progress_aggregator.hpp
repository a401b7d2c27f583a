#pragma once

#include "channel.hpp"
#include "progress.hpp"
#include "resume_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace rangefetch {

// Single owner of transfer progress and of the resume manifest. Workers post
// events through a channel; one consumer thread applies them, so manifest
// writes are serialized without any locking in the workers.
class ProgressAggregator {
public:
    // May throw PersistenceError; the aggregator logs it and carries on.
    using PersistHook = std::function<void(const ResumeManifest&)>;
    // Runs before each persist so the manifest never claims unsynced bytes.
    using SyncHook = std::function<void()>;

    ProgressAggregator(ResumeManifest state, std::optional<std::uint64_t> total_bytes,
                       std::chrono::milliseconds interval = std::chrono::milliseconds{200});
    ~ProgressAggregator();

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void setProgressCallback(ProgressCallback callback);
    void setPersistence(PersistHook persist, SyncHook sync = {});

    void start();

    // Thread-safe. Events posted after stop() are dropped.
    void post(const ProgressEvent& event);

    // Drains pending events, persists the final state and reports progress
    // one last time. Idempotent.
    void stop();

    [[nodiscard]] ProgressSnapshot snapshot() const;
    [[nodiscard]] ResumeManifest manifest() const;
    [[nodiscard]] std::uint64_t bytesThisRun() const;
    [[nodiscard]] bool persistenceDegraded() const;

private:
    void consume();
    void apply(const ProgressEvent& event);
    void persist();
    void report(bool force);
    [[nodiscard]] ProgressSnapshot snapshotLocked() const;

    Channel<ProgressEvent> events_;
    std::thread consumer_;
    bool started_{false};
    bool stopped_{false};

    mutable std::mutex state_mutex_;
    ResumeManifest state_;
    std::optional<std::uint64_t> total_bytes_;
    std::uint64_t bytes_completed_{0};
    std::uint64_t bytes_this_run_{0};
    bool degraded_{false};
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
    std::chrono::steady_clock::time_point last_update_{};

    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_report_{};
    ProgressCallback callback_;
    PersistHook persist_;
    SyncHook sync_;
};

} // namespace rangefetch
