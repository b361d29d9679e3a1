/**
 * @file record_digest.hpp
 * @brief BLAKE3 content digest of serialized canonical records
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace FemCanon {

/**
 * @brief Content digest of a canonical record.
 *
 * Two conversions of the same source produce the same bytes and therefore
 * the same digest. The tools report it so that reruns can be compared.
 */
class RecordDigest {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    static Hash hash(const std::vector<uint8_t>& data) {
        return hash(data.data(), data.size());
    }

    static std::string to_hex(const Hash& hash);
};

} // namespace FemCanon
