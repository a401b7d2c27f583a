#include "rangefetch/output_file.hpp"

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rangefetch {

namespace {

[[noreturn]] void throwErrno(const std::string& what, const std::filesystem::path& path) {
    throw std::system_error(errno, std::generic_category(), what + " " + path.string());
}

} // namespace

OutputFile::OutputFile(std::filesystem::path path, Mode mode) : path_(std::move(path)) {
    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (mode == Mode::Truncate) {
        flags |= O_TRUNC;
    }
    fd_ = ::open(path_.c_str(), flags, 0644);
    if (fd_ < 0) {
        throwErrno("Cannot open destination file", path_);
    }
}

OutputFile::~OutputFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void OutputFile::allocate(std::uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        throwErrno("Cannot resize destination file", path_);
    }
}

void OutputFile::writeAt(std::uint64_t offset, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwErrno("Failed to write output file", path_);
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
}

void OutputFile::sync() {
    if (fd_ >= 0 && ::fdatasync(fd_) == -1) {
        throwErrno("Failed to sync output file", path_);
    }
}

void OutputFile::close() {
    if (fd_ < 0) {
        return;
    }
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) == -1) {
        throwErrno("Failed to close output file", path_);
    }
}

std::uint64_t OutputFile::size() const {
    struct stat info {};
    if (::fstat(fd_, &info) == -1) {
        throwErrno("Cannot stat output file", path_);
    }
    return static_cast<std::uint64_t>(info.st_size);
}

} // namespace rangefetch
