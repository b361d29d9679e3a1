#pragma once

#include <source/source_reader.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace FemCanon {

// Numeric coercions of raw source arrays. Nested arrays are flattened
// depth-first and a bare number counts as a one-element sequence. Each
// returns std::nullopt when an element is not a number or falls outside the
// target range; fractional values truncate toward zero for integer targets.

std::optional<std::vector<double>> to_doubles(const SourceDocument& raw);
std::optional<std::vector<uint32_t>> to_uint32s(const SourceDocument& raw);
std::optional<std::vector<int32_t>> to_int32s(const SourceDocument& raw);

} // namespace FemCanon
