#include "rangefetch/resume_store.hpp"
#include "rangefetch/chunk_planner.hpp"
#include "rangefetch/detail/sha256.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/log.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace rangefetch {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kManifestVersion = 1;

struct FdCloser {
    int fd{-1};
    ~FdCloser() {
        if (fd >= 0) {
            ::close(fd);
        }
    }
};

void writeAll(int fd, const std::string& data, const fs::path& path) {
    const char* cursor = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        const ssize_t n = ::write(fd, cursor, left);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw PersistenceError(
                fmt::format("cannot write {}: {}", path.string(), std::strerror(errno)));
        }
        cursor += n;
        left -= static_cast<std::size_t>(n);
    }
}

// Unlinks a temporary file unless release() was called.
struct TempFileGuard {
    fs::path path;
    bool armed{true};
    ~TempFileGuard() {
        if (armed) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
    void release() { armed = false; }
};

void syncDirectory(const fs::path& directory) {
    FdCloser dir{::open(directory.empty() ? "." : directory.c_str(), O_RDONLY | O_DIRECTORY)};
    if (dir.fd >= 0) {
        ::fsync(dir.fd);
    }
}

} // namespace

std::size_t ResumeManifest::completedChunks() const noexcept {
    std::size_t count = 0;
    for (const auto& chunk : chunks) {
        if (chunk.isComplete()) {
            ++count;
        }
    }
    return count;
}

std::uint64_t ResumeManifest::bytesWritten() const noexcept {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.isComplete() && !chunk.openEnded() ? chunk.size() : chunk.bytes_written;
    }
    return total;
}

std::string encodeManifest(const ResumeManifest& manifest) {
    json chunks = json::array();
    for (const auto& chunk : manifest.chunks) {
        chunks.push_back({
            {"start", chunk.start},
            {"end", chunk.end},
            {"state", toString(chunk.state)},
            {"bytes_written", chunk.bytes_written},
            {"attempts", chunk.attempts},
        });
    }

    const json document = {
        {"version", kManifestVersion},
        {"destination", manifest.destination},
        {"url", manifest.url},
        {"total_length", manifest.total_length},
        {"identity", manifest.identity},
        {"chunks", std::move(chunks)},
    };
    return document.dump(2);
}

ResumeManifest decodeManifest(const std::string& text) {
    try {
        const json document = json::parse(text);
        if (document.at("version").get<int>() != kManifestVersion) {
            throw PlanError(fmt::format("unsupported manifest version {}",
                                        document.at("version").dump()));
        }

        ResumeManifest manifest;
        manifest.destination = document.at("destination").get<std::string>();
        manifest.url = document.at("url").get<std::string>();
        manifest.total_length = document.at("total_length").get<std::uint64_t>();
        manifest.identity = document.at("identity").get<std::string>();

        for (const auto& entry : document.at("chunks")) {
            Chunk chunk;
            chunk.index = manifest.chunks.size();
            chunk.start = entry.at("start").get<std::uint64_t>();
            chunk.end = entry.at("end").get<std::uint64_t>();
            const auto state = chunkStateFromString(entry.at("state").get<std::string>());
            if (!state) {
                throw PlanError(fmt::format("unknown chunk state {}", entry.at("state").dump()));
            }
            chunk.state = *state;
            chunk.bytes_written = entry.at("bytes_written").get<std::uint64_t>();
            chunk.attempts = entry.at("attempts").get<unsigned>();
            if (chunk.end < chunk.start || chunk.bytes_written > chunk.size()) {
                throw PlanError(fmt::format("chunk {} has an invalid range", chunk.index));
            }
            manifest.chunks.push_back(chunk);
        }
        return manifest;
    } catch (const json::exception& e) {
        throw PlanError(fmt::format("malformed manifest: {}", e.what()));
    }
}

bool manifestMatches(const ResumeManifest& manifest, const std::string& url,
                     const ResourceDescriptor& descriptor) {
    if (!descriptor.resumable()) {
        return false;
    }
    if (manifest.url != url) {
        logger()->info("manifest was written for {}, not {}", manifest.url, url);
        return false;
    }
    if (manifest.total_length != *descriptor.total_length) {
        logger()->info("resource length changed from {} to {}", manifest.total_length,
                       *descriptor.total_length);
        return false;
    }
    if (manifest.identity != descriptor.identity) {
        logger()->info("resource identity changed from '{}' to '{}'", manifest.identity,
                       descriptor.identity);
        return false;
    }
    try {
        validatePartition(manifest.chunks, manifest.total_length);
    } catch (const PlanError& e) {
        logger()->warn("manifest chunk layout rejected: {}", e.what());
        return false;
    }
    return true;
}

ResumeStore::ResumeStore(fs::path directory) : directory_(std::move(directory)) {}

fs::path ResumeStore::manifestPath(const std::string& key) const {
    const fs::path destination{key};
    if (directory_.empty()) {
        return fs::path{key + kExtension};
    }
    // Destinations from different directories may share a file name.
    const auto absolute = fs::absolute(destination).lexically_normal().string();
    const auto digest = detail::sha256Hex(absolute).substr(0, 16);
    return directory_ /
           fmt::format("{}.{}{}", destination.filename().string(), digest, kExtension);
}

std::optional<ResumeManifest> ResumeStore::load(const std::string& key) const {
    const auto path = manifestPath(key);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    try {
        auto manifest = decodeManifest(text);
        if (manifest.destination != key) {
            logger()->warn("manifest {} belongs to {}, ignoring it", path.string(),
                           manifest.destination);
            return std::nullopt;
        }
        return manifest;
    } catch (const PlanError& e) {
        logger()->warn("ignoring unreadable manifest {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::optional<ResumeManifest> ResumeStore::loadMatching(const std::string& key,
                                                        const std::string& url,
                                                        const ResourceDescriptor& descriptor) const {
    auto manifest = load(key);
    if (!manifest) {
        return std::nullopt;
    }
    if (!manifestMatches(*manifest, url, descriptor)) {
        logger()->warn("discarding stale manifest for {}", key);
        discard(key);
        return std::nullopt;
    }
    return manifest;
}

void ResumeStore::save(const ResumeManifest& manifest) const {
    const auto path = manifestPath(manifest.destination);
    const fs::path temp{path.string() + ".tmp"};

    if (!directory_.empty()) {
        std::error_code ec;
        fs::create_directories(directory_, ec);
        if (ec) {
            throw PersistenceError(fmt::format("cannot create state directory {}: {}",
                                               directory_.string(), ec.message()));
        }
    }

    TempFileGuard guard{temp};
    {
        FdCloser file{::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
        if (file.fd < 0) {
            throw PersistenceError(
                fmt::format("cannot create {}: {}", temp.string(), std::strerror(errno)));
        }
        writeAll(file.fd, encodeManifest(manifest), temp);
        if (::fsync(file.fd) != 0) {
            throw PersistenceError(
                fmt::format("cannot sync {}: {}", temp.string(), std::strerror(errno)));
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        throw PersistenceError(fmt::format("cannot replace {}: {}", path.string(), ec.message()));
    }
    guard.release();
    syncDirectory(path.parent_path());
}

void ResumeStore::discard(const std::string& key) const {
    const auto path = manifestPath(key);
    std::error_code ec;
    if (fs::remove(path, ec)) {
        logger()->debug("removed manifest {}", path.string());
    } else if (ec) {
        logger()->warn("cannot remove manifest {}: {}", path.string(), ec.message());
    }
}

} // namespace rangefetch
