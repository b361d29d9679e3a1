/**
 * @file channel_normalizer.hpp
 * @brief Generic channel extraction over any SourceAdapter
 *
 * One engine serves both export generations: layout differences are hidden
 * by the adapter accessors and tolerance differences by its field table.
 */

#pragma once

#include <extraction/property_extractor.hpp>
#include <model/canonical_model.hpp>
#include <source/source_adapter.hpp>
#include <string>
#include <vector>

namespace FemCanon {

/// Channel k of a group. Type and description are always strictly decoded.
ChannelEntry normalize_entry(const SourceAdapter& adapter, ChannelKind kind,
                             const std::string& group, size_t k, ExtractionStats& stats);

/// Every channel of a group, in source order.
ChannelGroup normalize_group(const SourceAdapter& adapter, ChannelKind kind,
                             const std::string& group, ExtractionStats& stats);

/**
 * @brief Every group of one kind, in source order.
 * @throws ConversionError(DuplicateGroupName) when a group name repeats
 */
std::vector<ChannelGroup> normalize_channels(const SourceAdapter& adapter, ChannelKind kind,
                                             ExtractionStats& stats);

} // namespace FemCanon
