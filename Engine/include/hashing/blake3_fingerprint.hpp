/**
 * @file blake3_fingerprint.hpp
 * @brief BLAKE3 digests used as product identity fingerprints
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace PriceSync {

/**
 * @brief 128-bit BLAKE3 digest of a normalized identity key.
 *
 * SAME KEY = SAME FINGERPRINT, independent of process, platform or run.
 */
class PRICESYNC_API BLAKE3Fingerprint {
public:
    static constexpr size_t HASH_SIZE = 16;
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash an identity key
     * @param key Already-normalized key text
     * @return 16-byte BLAKE3 digest
     */
    static Hash hash(std::string_view key);

    /**
     * @brief Lowercase hex rendering (32 chars)
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Parse a 32-char hex string; hyphens are ignored
     * @throws std::invalid_argument on bad length or non-hex characters
     */
    static Hash from_hex(const std::string& hex);
};

using Fingerprint = BLAKE3Fingerprint::Hash;

// Hasher for unordered containers keyed by fingerprint. The digest is already
// uniformly distributed, so the leading bytes are used directly.
struct FingerprintHasher {
    size_t operator()(const Fingerprint& fp) const noexcept {
        size_t h = 0;
        std::memcpy(&h, fp.data(), sizeof(h));
        return h;
    }
};

} // namespace PriceSync
