#include <catch2/catch.hpp>

#include "fake_transport.hpp"
#include "rangefetch/detail/sha256.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/resume_store.hpp"

#include <filesystem>
#include <string>

using namespace rangefetch;
using namespace rangefetch::testing;

namespace fs = std::filesystem;

namespace {

ResumeManifest sampleManifest(const std::string& destination) {
    ResumeManifest manifest;
    manifest.destination = destination;
    manifest.url = "http://example.test/data.bin";
    manifest.total_length = 300;
    manifest.identity = "\"v1\"";

    for (std::size_t i = 0; i < 3; ++i) {
        Chunk chunk;
        chunk.index = i;
        chunk.start = i * 100;
        chunk.end = chunk.start + 100;
        manifest.chunks.push_back(chunk);
    }
    manifest.chunks[0].state = ChunkState::Complete;
    manifest.chunks[0].bytes_written = 100;
    manifest.chunks[1].state = ChunkState::InProgress;
    manifest.chunks[1].bytes_written = 42;
    manifest.chunks[1].attempts = 1;
    return manifest;
}

ResourceDescriptor matchingResource() {
    ResourceDescriptor descriptor;
    descriptor.total_length = 300;
    descriptor.accepts_ranges = true;
    descriptor.identity = "\"v1\"";
    return descriptor;
}

} // namespace

TEST_CASE("Manifest survives a save and load", "[resume]") {
    TempDir dir;
    const auto destination = (dir.path() / "data.bin").string();
    ResumeStore store;

    const auto original = sampleManifest(destination);
    store.save(original);

    REQUIRE(fs::exists(destination + ResumeStore::kExtension));
    REQUIRE_FALSE(fs::exists(destination + ResumeStore::kExtension + std::string(".tmp")));

    const auto loaded = store.load(destination);
    REQUIRE(loaded);
    REQUIRE(loaded->url == original.url);
    REQUIRE(loaded->total_length == 300u);
    REQUIRE(loaded->identity == "\"v1\"");
    REQUIRE(loaded->chunks.size() == 3);
    REQUIRE(loaded->chunks[0].state == ChunkState::Complete);
    REQUIRE(loaded->chunks[1].state == ChunkState::InProgress);
    REQUIRE(loaded->chunks[1].bytes_written == 42u);
    REQUIRE(loaded->chunks[1].attempts == 1u);
    REQUIRE(loaded->chunks[2].start == 200u);
    REQUIRE(loaded->completedChunks() == 1);
    REQUIRE(loaded->bytesWritten() == 142u);
}

TEST_CASE("Saving twice replaces the manifest", "[resume]") {
    TempDir dir;
    const auto destination = (dir.path() / "data.bin").string();
    ResumeStore store;

    auto manifest = sampleManifest(destination);
    store.save(manifest);
    manifest.chunks[2].state = ChunkState::Complete;
    manifest.chunks[2].bytes_written = 100;
    store.save(manifest);

    const auto loaded = store.load(destination);
    REQUIRE(loaded);
    REQUIRE(loaded->completedChunks() == 2);
}

TEST_CASE("Missing or corrupt manifests load as absent", "[resume]") {
    TempDir dir;
    const auto destination = (dir.path() / "data.bin").string();
    ResumeStore store;

    REQUIRE_FALSE(store.load(destination));

    writeFile(destination + ResumeStore::kExtension, "{ not json");
    REQUIRE_FALSE(store.load(destination));

    writeFile(destination + ResumeStore::kExtension, R"({"version": 99})");
    REQUIRE_FALSE(store.load(destination));
}

TEST_CASE("decodeManifest rejects inconsistent chunks", "[resume]") {
    auto manifest = sampleManifest("x.bin");
    auto text = encodeManifest(manifest);
    REQUIRE_NOTHROW(decodeManifest(text));

    manifest.chunks[1].bytes_written = 1000;
    REQUIRE_THROWS_AS(decodeManifest(encodeManifest(manifest)), PlanError);
    REQUIRE_THROWS_AS(decodeManifest("[]"), PlanError);
}

TEST_CASE("A manifest for a changed resource is discarded", "[resume]") {
    TempDir dir;
    const auto destination = (dir.path() / "data.bin").string();
    const auto manifest_path = destination + ResumeStore::kExtension;
    ResumeStore store;
    const auto url = std::string("http://example.test/data.bin");

    SECTION("matching resource") {
        store.save(sampleManifest(destination));
        REQUIRE(store.loadMatching(destination, url, matchingResource()));
        REQUIRE(fs::exists(manifest_path));
    }

    SECTION("identity changed") {
        store.save(sampleManifest(destination));
        auto descriptor = matchingResource();
        descriptor.identity = "\"v2\"";
        REQUIRE_FALSE(store.loadMatching(destination, url, descriptor));
        REQUIRE_FALSE(fs::exists(manifest_path));
    }

    SECTION("length changed") {
        store.save(sampleManifest(destination));
        auto descriptor = matchingResource();
        descriptor.total_length = 301;
        REQUIRE_FALSE(store.loadMatching(destination, url, descriptor));
        REQUIRE_FALSE(fs::exists(manifest_path));
    }

    SECTION("different url") {
        store.save(sampleManifest(destination));
        REQUIRE_FALSE(store.loadMatching(destination, url + "?mirror=2", matchingResource()));
    }

    SECTION("ranges no longer supported") {
        store.save(sampleManifest(destination));
        auto descriptor = matchingResource();
        descriptor.accepts_ranges = false;
        REQUIRE_FALSE(store.loadMatching(destination, url, descriptor));
    }
}

TEST_CASE("A manifest with a gap in its chunks does not match", "[resume]") {
    auto manifest = sampleManifest("x.bin");
    manifest.chunks[2].start = 210;

    REQUIRE_FALSE(manifestMatches(manifest, manifest.url, matchingResource()));
}

TEST_CASE("A state directory holds manifests under a hashed name", "[resume]") {
    TempDir dir;
    const auto state_dir = dir.path() / "state";
    ResumeStore store(state_dir);

    const auto first = (dir.path() / "a" / "data.bin").string();
    const auto second = (dir.path() / "b" / "data.bin").string();

    const auto first_path = store.manifestPath(first);
    REQUIRE(first_path.parent_path().string() == state_dir.string());
    REQUIRE(first_path.filename().string().rfind("data.bin.", 0) == 0);
    REQUIRE(first_path.extension().string() == ResumeStore::kExtension);
    REQUIRE(first_path.string() != store.manifestPath(second).string());

    store.save(sampleManifest(first));
    REQUIRE(fs::exists(first_path));
    REQUIRE(store.load(first));
    REQUIRE_FALSE(store.load(second));

    store.discard(first);
    REQUIRE_FALSE(fs::exists(first_path));
}

TEST_CASE("Hashed manifest names are stable across builds", "[resume]") {
    REQUIRE(detail::sha256Hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    ResumeStore store("/var/lib/rangefetch");
    const auto path = store.manifestPath("/srv/files/data.bin");
    REQUIRE(path.string() == "/var/lib/rangefetch/data.bin.b63f67c4f35be505.rangefetch");

    SECTION("equivalent spellings of a destination share a manifest") {
        REQUIRE(store.manifestPath("/srv/files/../files/./data.bin").string() == path.string());
    }
}

TEST_CASE("A failed save leaves no temporary file behind", "[resume]") {
    TempDir dir;
    const auto destination = (dir.path() / "data.bin").string();
    ResumeStore store;

    // A non-empty directory where the manifest belongs makes the final rename fail.
    const auto path = store.manifestPath(destination);
    fs::create_directories(path / "occupied");

    REQUIRE_THROWS_AS(store.save(sampleManifest(destination)), PersistenceError);
    REQUIRE_FALSE(fs::exists(path.string() + ".tmp"));
    REQUIRE(fs::is_directory(path));
}

TEST_CASE("discard tolerates a missing manifest", "[resume]") {
    TempDir dir;
    ResumeStore store;
    REQUIRE_NOTHROW(store.discard((dir.path() / "nothing.bin").string()));
}

TEST_CASE("An unusable state directory raises PersistenceError", "[resume]") {
    TempDir dir;
    const auto blocker = dir.path() / "blocker";
    writeFile(blocker, "not a directory");

    ResumeStore store(blocker / "state");
    REQUIRE_THROWS_AS(store.save(sampleManifest((dir.path() / "data.bin").string())),
                      PersistenceError);
}
