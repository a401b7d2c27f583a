#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace rangefetch {

// Destination file shared by all workers. Writes are positional (pwrite), so
// workers filling disjoint ranges never need a lock. Errors are reported as
// std::system_error.
class OutputFile {
public:
    enum class Mode {
        Truncate,   // start from an empty file
        Keep,       // reuse the existing content (resume)
    };

    OutputFile(std::filesystem::path path, Mode mode);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    // Sets the file length up front so any chunk can be written in bounds.
    void allocate(std::uint64_t size);

    void writeAt(std::uint64_t offset, const char* data, std::size_t size);

    void sync();
    void close();

    [[nodiscard]] std::uint64_t size() const;

private:
    std::filesystem::path path_;
    int fd_{-1};
};

} // namespace rangefetch
