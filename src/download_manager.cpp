#include "rangefetch/download_manager.hpp"
#include "rangefetch/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <filesystem>
#include <utility>

#include <fmt/format.h>

namespace rangefetch {

void DownloadManager::addTransfer(std::shared_ptr<TransferCoordinator> transfer) {
    if (transfer) {
        transfers_.push_back(std::move(transfer));
    }
}

void DownloadManager::setInterruptCheck(std::function<bool()> check) {
    interrupted_ = std::move(check);
}

bool DownloadManager::start(std::ostream& out) {
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_.assign(transfers_.size(), std::nullopt);
    }
    finished_ = 0;

    threads_.reserve(transfers_.size());
    for (std::size_t i = 0; i < transfers_.size(); ++i) {
        threads_.emplace_back([this, i]() {
            TransferResult result;
            try {
                result = transfers_[i]->run();
            } catch (const std::exception& e) {
                result.state = TransferState::Failed;
                result.failure = FailureKind::Io;
                result.message = e.what();
                logger()->error("{}: {}", transfers_[i]->target().destination.string(), e.what());
            }
            {
                std::lock_guard<std::mutex> lock(results_mutex_);
                results_[i] = std::move(result);
            }
            ++finished_;
        });
    }

    renderProgressLoop(out);

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // One last frame with the terminal states.
    std::size_t lines = 0;
    redrawPanel(out, buildProgressPanel(), lines);
    out << std::flush;

    const auto all = results();
    return std::all_of(all.begin(), all.end(),
                       [](const std::optional<TransferResult>& r) { return r && r->ok(); });
}

void DownloadManager::cancelAll() {
    for (auto& transfer : transfers_) {
        transfer->cancel();
    }
}

std::vector<std::optional<TransferResult>> DownloadManager::results() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return results_;
}

void DownloadManager::renderProgressLoop(std::ostream& out) {
    std::size_t previous_lines = 0;
    while (hasActiveTransfers()) {
        if (!cancel_sent_ && interrupted_ && interrupted_()) {
            cancel_sent_ = true;
            cancelAll();
        }

        const auto panel = buildProgressPanel();
        redrawPanel(out, panel, previous_lines);

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (previous_lines > 0) {
        out << "\033[" << previous_lines << "F\033[J";
    }
}

std::string DownloadManager::buildProgressPanel() const {
    const auto all = results();

    std::string panel;
    panel.reserve(transfers_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("rangefetch ({} transfers)\n", transfers_.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    bool totals_known = true;

    for (std::size_t i = 0; i < transfers_.size(); ++i) {
        const auto& transfer = *transfers_[i];
        panel += formatTransferLine(transfer, all[i]);
        panel.push_back('\n');

        const auto progress = transfer.progress();
        if (progress.total_bytes) {
            total_all += *progress.total_bytes;
        } else {
            totals_known = false;
        }
        downloaded_all += progress.bytes_completed;
    }

    panel.append("--------------------------------------------------\n");
    if (totals_known && total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel += fmt::format("Overall: {}", formatSize(downloaded_all));
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string DownloadManager::formatTransferLine(const TransferCoordinator& transfer,
                                                const std::optional<TransferResult>& result) {
    const auto progress = transfer.progress();

    std::string display_name = transfer.target().destination.filename().string();
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    std::string line;
    line.reserve(256);

    if (progress.total_bytes && *progress.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(progress.bytes_completed) /
                                               static_cast<double>(*progress.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "█" : "░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                            formatSize(progress.bytes_completed), formatSize(*progress.total_bytes));
    } else if (transfer.state() == TransferState::Transferring || progress.bytes_completed > 0) {
        line += fmt::format("{:<20} [streaming] {}", display_name, formatSize(progress.bytes_completed));
    } else {
        line += fmt::format("{:<20} [{}...]", display_name, toString(transfer.state()));
    }

    if (result) {
        if (result->ok()) {
            line.append("  ✅ Done");
        } else if (result->failure == FailureKind::Cancelled) {
            line.append("  ⏸ Cancelled (resumable)");
        } else {
            line += fmt::format("  ❌ {}", toString(result->failure));
        }
    }

    return line;
}

std::string DownloadManager::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

bool DownloadManager::hasActiveTransfers() const {
    return finished_.load() < transfers_.size();
}

void DownloadManager::redrawPanel(std::ostream& out, const std::string& panel,
                                  std::size_t& previous_lines) {
    const std::size_t current_lines =
        static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        out << "\033[" << previous_lines << "F\033[J";
    }
    out << panel << std::flush;
    previous_lines = current_lines;
}

void DownloadManager::printSummary(std::ostream& out) const {
    const auto all = results();
    for (std::size_t i = 0; i < transfers_.size(); ++i) {
        const auto& target = transfers_[i]->target();
        const auto& result = all[i];
        if (!result) {
            continue;
        }

        if (result->chunks_resumed > 0) {
            out << fmt::format("{}: resumed with {} of {} chunks already complete\n",
                               target.destination.string(), result->chunks_resumed,
                               result->chunks_total);
        }
        if (result->fell_back_to_single_stream) {
            out << fmt::format("{}: server ignored range requests, used a single stream\n",
                               target.destination.string());
        }
        if (result->persistence_degraded) {
            out << fmt::format("{}: resume manifest could not be saved\n",
                               target.destination.string());
        }
        if (result->ok()) {
            continue;
        }
        if (result->failure == FailureKind::Cancelled) {
            out << fmt::format("{}: cancelled, run again to resume\n",
                               target.destination.string());
            continue;
        }

        out << fmt::format("{}: {} failed: {}\n", target.destination.string(),
                           toString(result->failure), result->message);
        for (const auto& failure : result->failed_chunks) {
            out << fmt::format("    chunk {} ({} attempts): {}\n", failure.chunk,
                               failure.attempts, failure.reason);
        }
    }
    out << std::flush;
}

} // namespace rangefetch
