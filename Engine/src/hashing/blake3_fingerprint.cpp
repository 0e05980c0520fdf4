/**
 * @file blake3_fingerprint.cpp
 * @brief BLAKE3 fingerprint implementation
 */

#include <hashing/blake3_fingerprint.hpp>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace PriceSync {

BLAKE3Fingerprint::Hash BLAKE3Fingerprint::hash(std::string_view key) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, key.data(), key.size());
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string BLAKE3Fingerprint::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }

    return oss.str();
}

BLAKE3Fingerprint::Hash BLAKE3Fingerprint::from_hex(const std::string& hex) {
    std::string clean = hex;
    clean.erase(std::remove(clean.begin(), clean.end(), '-'), clean.end());

    if (clean.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid fingerprint length: " + std::to_string(clean.size()) +
                                    ". Expected " + std::to_string(HASH_SIZE * 2) + ".");
    }
    if (!std::all_of(clean.begin(), clean.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid fingerprint: non-hex character in '" + hex + "'");
    }

    Hash result = {0};
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        result[i] = static_cast<uint8_t>(std::stoul(clean.substr(i * 2, 2), nullptr, 16));
    }

    return result;
}

} // namespace PriceSync
