/**
 * @file record_digest.cpp
 * @brief BLAKE3 record digest implementation
 */

#include <hashing/record_digest.hpp>

namespace FemCanon {

namespace {
constexpr char k_hex_lut[] = "0123456789abcdef";
}

RecordDigest::Hash RecordDigest::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string RecordDigest::to_hex(const Hash& hash) {
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t byte : hash) {
        out.push_back(k_hex_lut[(byte >> 4) & 0xF]);
        out.push_back(k_hex_lut[byte & 0xF]);
    }
    return out;
}

} // namespace FemCanon
