/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 digests for session identifiers and lock keys
 */

#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Sessionizer {

/**
 * @brief BLAKE3 hashing
 *
 * Same fields, same digest: identifiers derived here are stable across runs and hosts.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash a sequence of fields, each prefixed by its 8-byte little-endian length.
     *
     * The framing makes ("ab", "c") and ("a", "bc") hash differently.
     */
    static Hash hash_fields(std::initializer_list<std::string_view> fields);

    /**
     * @brief First 8 bytes of the digest as a signed integer (PostgreSQL advisory lock key).
     */
    static int64_t to_int64(const Hash& hash);

    /**
     * @brief Convert hash to lowercase hex string
     */
    static std::string to_hex(const Hash& hash);
};

} // namespace Sessionizer
