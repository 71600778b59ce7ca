#include "lsync/core/hash.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace lsync {
namespace {

constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

void Fnv1aHasher::update(const char* data, std::size_t size) noexcept {
    for (std::size_t i = 0; i < size; ++i) {
        state_ ^= static_cast<std::uint64_t>(static_cast<unsigned char>(data[i]));
        state_ *= kFnvPrime;
    }
}

std::string Fnv1aHasher::hex() const {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(state_) * 2) << std::setfill('0') << state_;
    return oss.str();
}

std::string fnv1a_hex(const std::string& data) {
    Fnv1aHasher hasher;
    hasher.update(data);
    return hasher.hex();
}

std::string hash_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return {};
    }
    Fnv1aHasher hasher;
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        hasher.update(buffer, static_cast<std::size_t>(input.gcount()));
    }
    return hasher.hex();
}

std::string hex_encode(const std::string& bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char byte : bytes) {
        out.push_back(kDigits[byte >> 4]);
        out.push_back(kDigits[byte & 0x0f]);
    }
    return out;
}

bool hex_decode(const std::string& hex, std::string& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    std::string bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        bytes.push_back(static_cast<char>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

} // namespace lsync
