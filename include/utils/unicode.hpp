#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace FemCanon {

/**
 * @brief Measure the UTF-8 sequence starting at s[i].
 *
 * Follows the well-formed byte table of the Unicode standard (no overlong
 * forms, no surrogates, nothing above U+10FFFF).
 *
 * @return Length of the well-formed sequence, or 0 when ill-formed. In the
 *         ill-formed case `consumed` is the length of the maximal subpart
 *         (always at least 1) so that the caller can skip over it.
 */
inline size_t utf8_sequence_length(const std::string& s, size_t i, size_t& consumed) {
    uint8_t c = static_cast<uint8_t>(s[i]);
    size_t len = 0;
    uint8_t lo = 0x80, hi = 0xBF; // Valid range of the second byte

    if (c < 0x80)                   { consumed = 1; return 1; }
    else if (c >= 0xC2 && c <= 0xDF) { len = 2; }
    else if (c == 0xE0)              { len = 3; lo = 0xA0; }
    else if (c >= 0xE1 && c <= 0xEC) { len = 3; }
    else if (c == 0xED)              { len = 3; hi = 0x9F; }
    else if (c >= 0xEE && c <= 0xEF) { len = 3; }
    else if (c == 0xF0)              { len = 4; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
    else if (c == 0xF4)              { len = 4; hi = 0x8F; }
    else                             { consumed = 1; return 0; } // Invalid start byte

    for (size_t j = 1; j < len; ++j) {
        if (i + j >= s.size()) { consumed = j; return 0; } // Truncated
        uint8_t cc = static_cast<uint8_t>(s[i + j]);
        if (j == 1 ? (cc < lo || cc > hi) : (cc < 0x80 || cc > 0xBF)) {
            consumed = j;
            return 0;
        }
    }

    consumed = len;
    return len;
}

inline bool is_valid_utf8(const std::string& s) {
    for (size_t i = 0; i < s.size(); ) {
        size_t consumed = 0;
        if (utf8_sequence_length(s, i, consumed) == 0) return false;
        i += consumed;
    }
    return true;
}

/**
 * @brief Copy of `s` with every ill-formed subsequence removed.
 */
inline std::string drop_invalid_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        size_t consumed = 0;
        if (utf8_sequence_length(s, i, consumed) != 0) {
            out.append(s, i, consumed);
        }
        i += consumed;
    }
    return out;
}

} // namespace FemCanon
