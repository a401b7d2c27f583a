#pragma once

#include "progress.hpp"
#include "transport.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rangefetch {

struct TransferTarget {
    std::string url;
    std::filesystem::path destination;
    unsigned concurrency{8};
    // Empty means "divide the total length by the worker count".
    std::optional<std::uint64_t> chunk_size;
};

struct TransferOptions {
    RetryPolicy retry;
    std::uint64_t min_chunk_size{64 * 1024};
    bool resume{true};
    // Where resume manifests live; empty keeps them next to the destination.
    std::filesystem::path state_dir;
    std::chrono::milliseconds progress_interval{200};
    // Lowercase hex SHA-256 the finished file must have, when known.
    std::optional<std::string> expected_sha256;
    bool allow_unknown_length{true};
};

enum class TransferState {
    Probing,
    Planning,
    Transferring,
    Finalizing,
    Done,
    Failed,
};

enum class FailureKind {
    None,
    Probe,
    Plan,
    ChunkTransfer,
    Finalization,
    Cancelled,
    Io,
};

struct TransferResult {
    TransferState state{TransferState::Failed};
    FailureKind failure{FailureKind::None};
    std::string message;
    std::vector<ChunkFailure> failed_chunks;
    std::size_t chunks_total{0};
    std::size_t chunks_resumed{0};
    std::optional<std::uint64_t> bytes_total;
    std::uint64_t bytes_fetched{0};
    bool persistence_degraded{false};
    bool fell_back_to_single_stream{false};

    [[nodiscard]] bool ok() const noexcept { return state == TransferState::Done; }
};

const char* toString(TransferState state) noexcept;
const char* toString(FailureKind kind) noexcept;

// Public entry point of the engine: probes the resource, plans chunks
// (resuming from a manifest when possible), runs the worker pool and verifies
// the result. A failed transfer keeps its partial file and manifest so the
// next run can resume it.
class TransferCoordinator {
public:
    TransferCoordinator(TransferTarget target, std::shared_ptr<Transport> transport,
                        TransferOptions options = {});
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    // Must be set before run().
    void setProgressCallback(ProgressCallback callback);

    // Runs the whole transfer on the calling thread.
    TransferResult run();

    // Thread-safe. The running transfer stops after its in-flight writes and
    // ends as a resumable failure.
    void cancel();

    [[nodiscard]] TransferState state() const;
    [[nodiscard]] ProgressSnapshot progress() const;
    [[nodiscard]] const TransferTarget& target() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangefetch
