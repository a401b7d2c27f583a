#pragma once

#include "chunk.hpp"
#include "resource_probe.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rangefetch {

struct ResumeManifest {
    std::string destination;
    std::string url;
    std::uint64_t total_length{0};
    std::string identity;
    std::vector<Chunk> chunks;

    [[nodiscard]] std::size_t completedChunks() const noexcept;
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept;
};

std::string encodeManifest(const ResumeManifest& manifest);

// Throws PlanError when `text` is not a manifest this version can read.
ResumeManifest decodeManifest(const std::string& text);

// True when the manifest still describes `descriptor` and its chunks
// partition the resource exactly.
bool manifestMatches(const ResumeManifest& manifest, const std::string& url,
                     const ResourceDescriptor& descriptor);

// Persists resume manifests keyed by destination path. Saves are atomic: a
// crash leaves either the previous or the new manifest on disk.
class ResumeStore {
public:
    static constexpr const char* kExtension = ".rangefetch";

    // With an empty directory the manifest is kept next to the destination.
    explicit ResumeStore(std::filesystem::path directory = {});

    [[nodiscard]] std::filesystem::path manifestPath(const std::string& key) const;

    // Empty when there is no manifest or it cannot be decoded.
    [[nodiscard]] std::optional<ResumeManifest> load(const std::string& key) const;

    // Like load(), but a manifest that no longer matches the resource is
    // discarded and reported as absent.
    std::optional<ResumeManifest> loadMatching(const std::string& key, const std::string& url,
                                               const ResourceDescriptor& descriptor) const;

    // Throws PersistenceError.
    void save(const ResumeManifest& manifest) const;

    void discard(const std::string& key) const;

private:
    std::filesystem::path directory_;
};

} // namespace rangefetch
