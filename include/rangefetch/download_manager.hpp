#pragma once

#include "transfer_coordinator.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace rangefetch {

// Runs several transfers side by side and redraws a console progress panel
// until all of them reach a terminal state.
class DownloadManager {
public:
    void addTransfer(std::shared_ptr<TransferCoordinator> transfer);

    // Polled by the render loop; returning true cancels every transfer.
    void setInterruptCheck(std::function<bool()> check);

    // Returns true when every transfer finished successfully.
    bool start(std::ostream& out);

    void cancelAll();
    void printSummary(std::ostream& out) const;

    [[nodiscard]] std::vector<std::optional<TransferResult>> results() const;

    static std::string formatSize(std::uint64_t bytes);

private:
    void renderProgressLoop(std::ostream& out);
    std::string buildProgressPanel() const;
    static std::string formatTransferLine(const TransferCoordinator& transfer,
                                          const std::optional<TransferResult>& result);
    bool hasActiveTransfers() const;
    static void redrawPanel(std::ostream& out, const std::string& panel, std::size_t& previous_lines);

    std::vector<std::thread> threads_;
    std::vector<std::shared_ptr<TransferCoordinator>> transfers_;
    std::function<bool()> interrupted_;
    bool cancel_sent_{false};

    mutable std::mutex results_mutex_;
    std::vector<std::optional<TransferResult>> results_;
    std::atomic<std::size_t> finished_{0};
};

} // namespace rangefetch
