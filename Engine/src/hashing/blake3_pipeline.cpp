/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>

namespace Sessionizer {

namespace {

constexpr char k_hex_lut[] = "0123456789abcdef";

} // namespace

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_fields(std::initializer_list<std::string_view> fields) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    for (std::string_view field : fields) {
        uint64_t len = field.size();
        uint8_t prefix[8];
        for (int i = 0; i < 8; ++i) prefix[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
        blake3_hasher_update(&hasher, prefix, sizeof(prefix));
        blake3_hasher_update(&hasher, field.data(), field.size());
    }
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

int64_t BLAKE3Pipeline::to_int64(const Hash& hash) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | hash[i];
    return static_cast<int64_t>(v);
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t byte : hash) {
        out.push_back(k_hex_lut[(byte >> 4) & 0xF]);
        out.push_back(k_hex_lut[byte & 0xF]);
    }
    return out;
}

} // namespace Sessionizer
