#include "rangefetch/detail/sha256.hpp"
#include "rangefetch/errors.hpp"

#include <cerrno>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

#include <openssl/evp.h>

namespace rangefetch::detail {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext newDigest() {
    DigestContext ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw Error("Cannot initialise SHA-256 digest");
    }
    return ctx;
}

std::string finishDigest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        throw Error("SHA-256 finalisation failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

} // namespace

std::string sha256File(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::system_error(errno, std::generic_category(), "Cannot open " + path.string());
    }

    auto ctx = newDigest();
    char buffer[64 * 1024];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw Error("SHA-256 update failed");
        }
    }
    if (file.bad()) {
        throw std::system_error(errno, std::generic_category(), "Cannot read " + path.string());
    }

    return finishDigest(ctx.get());
}

std::string sha256Hex(std::string_view data) {
    auto ctx = newDigest();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw Error("SHA-256 update failed");
    }
    return finishDigest(ctx.get());
}

} // namespace rangefetch::detail
