#pragma once

#include <source/source_reader.hpp>
#include <optional>
#include <string>

namespace FemCanon {

enum class Decoding {
    Strict,  // Ill-formed UTF-8 yields no text
    Lenient  // Ill-formed subsequences are dropped
};

/**
 * @brief Decode a raw byte sequence to UTF-8 text.
 *
 * `raw` is a (possibly nested) array of integers in [0, 255]. A string node
 * is taken as already decoded. Anything else is not text in either mode.
 *
 * @return The text, or std::nullopt when decoding failed.
 */
std::optional<std::string> decode_text(const SourceDocument& raw, Decoding decoding);

} // namespace FemCanon
