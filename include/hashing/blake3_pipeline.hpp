/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 hashing for stable store identifiers
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace RdfPg {

/**
 * @brief BLAKE3 hashing helpers
 *
 * A store identifier always hashes to the same table prefix, so two
 * processes opening the same identifier see the same tables.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Convert hash to lower-case hex string
     */
    static std::string to_hex(const Hash& hash);
};

} // namespace RdfPg
