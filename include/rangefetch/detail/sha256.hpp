#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace rangefetch::detail {

// Lowercase hex SHA-256 of a file's content. Throws std::system_error when
// the file cannot be read and rangefetch::Error when hashing fails.
std::string sha256File(const std::filesystem::path& path);

// Lowercase hex SHA-256 of an in-memory buffer.
std::string sha256Hex(std::string_view data);

} // namespace rangefetch::detail
