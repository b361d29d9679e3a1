/**
 * @file canonical_serializer.hpp
 * @brief Canonical record rendering, encodings and identifiers
 *
 * Record layout:
 *   modelDescription, inputs, outputs,
 *   eigenfrequencies, inputsToModalForce, modalDisplacementToOutputs,
 *   proportionalDampingVector, gainMatrix
 * where inputs/outputs are lists of one-entry mappings {group: [channel...]}.
 * Payload fields of the other variant are present as empty arrays.
 */

#pragma once

#include <model/canonical_model.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FemCanon {

enum class Encoding {
    Json,
    Cbor,
    MessagePack
};

const char* to_string(Encoding encoding);

/// "json", "cbor" or "msgpack"; std::nullopt otherwise.
std::optional<Encoding> parse_encoding(std::string_view name);

/// File extension including the dot.
const char* extension(Encoding encoding);

/**
 * @brief Store key of a canonical record.
 *
 * modal_state_space_model_2ndOrder / static_reduction_model, with ".73"
 * for the hierarchical generation, followed by the encoding extension.
 */
std::string canonical_identifier(ModelVariant variant, SourceFormat format, Encoding encoding);

class CanonicalSerializer {
public:
    using Record = nlohmann::ordered_json;

    static Record to_record(const CanonicalModel& model);
    static std::vector<uint8_t> encode(const CanonicalModel& model, Encoding encoding);

    /// Inverse of to_record; throws ConversionError(InvalidFieldValue) on a malformed record.
    static CanonicalModel from_record(const Record& record);

    /// Load a stored record, the encoding chosen from the file extension.
    static CanonicalModel load(const std::filesystem::path& path);
};

} // namespace FemCanon
