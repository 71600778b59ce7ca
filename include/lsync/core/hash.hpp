#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lsync {

/**
 * @brief Incremental 64-bit FNV-1a, rendered as 16 hex digits
 *
 * Used for download integrity checks and test checksums. Not a
 * cryptographic hash.
 */
class Fnv1aHasher {
public:
    void update(const char* data, std::size_t size) noexcept;
    void update(const std::string& data) noexcept { update(data.data(), data.size()); }

    [[nodiscard]] std::string hex() const;

private:
    std::uint64_t state_ = 0xcbf29ce484222325ULL;
};

std::string fnv1a_hex(const std::string& data);

/// Hashes a file's content; returns an empty string when it cannot be opened.
std::string hash_file(const std::filesystem::path& path);

std::string hex_encode(const std::string& bytes);

/// Returns false (leaving out untouched) when the input is not valid hex.
bool hex_decode(const std::string& hex, std::string& out);

} // namespace lsync
