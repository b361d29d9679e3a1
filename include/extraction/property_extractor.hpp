/**
 * @file property_extractor.hpp
 * @brief Per-channel property sub-record extraction
 */

#pragma once

#include <model/canonical_model.hpp>
#include <source/source_adapter.hpp>
#include <string>

namespace FemCanon {

struct ExtractionStats {
    size_t groups = 0;
    size_t channels = 0;
    size_t omitted_fields = 0;   // Optional fields dropped as absent or undecodable
};

/**
 * @brief Build the PropertyRecord of one channel.
 *
 * `nodeID` is mandatory for every channel. `csLabel`, `csNumber` and, for
 * outputs, `component` follow the adapter's field table; every other field
 * is copied as a flattened numeric sequence under its source name.
 *
 * @param properties The raw property mapping of the channel
 * @param path       Diagnostic path of the mapping, used in error messages
 * @throws ConversionError on a fatal field
 */
PropertyRecord extract_properties(const SourceDocument& properties,
                                  ChannelKind kind,
                                  const FieldTable& table,
                                  const std::string& path,
                                  ExtractionStats& stats);

} // namespace FemCanon
