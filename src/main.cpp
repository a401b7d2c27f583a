#include "rangefetch/cli_options.hpp"
#include "rangefetch/curl_transport.hpp"
#include "rangefetch/download_manager.hpp"
#include "rangefetch/log.hpp"
#include "rangefetch/transfer_coordinator.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void onSignal(int) {
    g_interrupted = 1;
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <url1> <file1> [<url2> <file2> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>        Download directory (default: current directory)\n"
              << "  -t <threads>          Concurrent connections per transfer (default: 8)\n"
              << "  -s <size>             Fixed chunk size, e.g. 4M (default: total / threads)\n"
              << "  -r <attempts>         Attempts per chunk before giving up (default: 5)\n"
              << "  --retry-delay <ms>    Initial retry delay in milliseconds (default: 1000)\n"
              << "  -A <agent>            User-Agent header (default: rangefetch/1.0)\n"
              << "  -x <proxy>            Proxy URL (implies --proxy-mode custom)\n"
              << "  --proxy-mode <mode>   auto (environment), off or custom (default: auto)\n"
              << "  --no-resume           Ignore and do not write resume manifests\n"
              << "  --state-dir <dir>     Keep resume manifests in this directory\n"
              << "  --sha256 <hex>        Expected SHA-256 of the file (single transfer only)\n"
              << "  --log-level <level>   off, error, warn, info, debug or trace (default: warn)\n"
              << "  -v                    Same as --log-level debug\n"
              << "  -h, --help            Show this message" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        unsigned threads = 8;
        std::optional<std::uint64_t> chunk_size;
        std::filesystem::path download_dir = std::filesystem::current_path();
        rangefetch::TransportOptions transport_options;
        rangefetch::TransferOptions transfer_options;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option == "-v") {
                rangefetch::setLogLevel(spdlog::level::debug);
                arg_index += 1;
                continue;
            }
            if (option == "--no-resume") {
                transfer_options.resume = false;
                arg_index += 1;
                continue;
            }

            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            const std::string value = argv[arg_index + 1];

            if (option == "-d") {
                download_dir = value;
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: " +
                                             download_dir.string() + " - " + ec.message());
                }
            } else if (option == "-t") {
                threads = static_cast<unsigned>(rangefetch::parseInt(option, value, 1, 64));
            } else if (option == "-s") {
                chunk_size = rangefetch::parseSize(value);
            } else if (option == "-r") {
                transfer_options.retry.max_attempts =
                    static_cast<unsigned>(rangefetch::parseInt(option, value, 1, 1000));
            } else if (option == "--retry-delay") {
                transfer_options.retry.base_delay =
                    std::chrono::milliseconds{rangefetch::parseInt(option, value, 0, 600000)};
            } else if (option == "-A") {
                transport_options.user_agent = value;
            } else if (option == "-x") {
                transport_options.proxy = value;
                transport_options.proxy_mode = rangefetch::ProxyMode::Custom;
            } else if (option == "--proxy-mode") {
                transport_options.proxy_mode = rangefetch::parseProxyMode(value);
            } else if (option == "--state-dir") {
                transfer_options.state_dir = value;
            } else if (option == "--sha256") {
                transfer_options.expected_sha256 = value;
            } else if (option == "--log-level") {
                rangefetch::setLogLevel(rangefetch::parseLogLevel(value));
            } else {
                printUsage(argv[0]);
                return 1;
            }
            arg_index += 2;
        }

        if (argc - arg_index < 2 || (argc - arg_index) % 2 != 0) {
            printUsage(argv[0]);
            return 1;
        }
        if (transfer_options.expected_sha256 && argc - arg_index > 2) {
            throw std::runtime_error("--sha256 applies to a single transfer only");
        }

        auto transport = std::make_shared<rangefetch::CurlTransport>(transport_options);

        rangefetch::DownloadManager manager;
        for (int i = arg_index; i < argc; i += 2) {
            rangefetch::TransferTarget target;
            target.url = argv[i];
            target.destination = download_dir / argv[i + 1];
            target.concurrency = threads;
            target.chunk_size = chunk_size;
            manager.addTransfer(
                std::make_shared<rangefetch::TransferCoordinator>(std::move(target), transport, transfer_options));
        }

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        manager.setInterruptCheck([] { return g_interrupted != 0; });

        const bool ok = manager.start(std::cout);
        manager.printSummary(std::cerr);
        return ok ? 0 : 1;

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
