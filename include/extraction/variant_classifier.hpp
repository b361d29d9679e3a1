/**
 * @file variant_classifier.hpp
 * @brief Model variant detection and final record assembly
 */

#pragma once

#include <model/canonical_model.hpp>
#include <source/source_adapter.hpp>
#include <optional>
#include <vector>

namespace FemCanon {

/**
 * @brief Variant carried by a source, judged from its top-level keys alone.
 *
 * Modal when eigenfrequencies, inputs2ModalF, modalDisp2Outputs and
 * proportionalDampingVec are all present; otherwise static reduction when
 * gainMatrix is present; otherwise std::nullopt. A key whose array holds no
 * values counts as absent, so the chosen payload is never empty.
 */
std::optional<ModelVariant> detect_variant(const SourceAdapter& adapter);

/**
 * @brief Compose the CanonicalModel from the normalized channels.
 *
 * @return std::nullopt when the source matches neither variant; nothing
 *         should be written in that case.
 * @throws ConversionError when modelDescription is missing or undecodable,
 *         or a payload array is not numeric
 */
std::optional<CanonicalModel> classify_model(const SourceAdapter& adapter,
                                             std::vector<ChannelGroup> inputs,
                                             std::vector<ChannelGroup> outputs);

} // namespace FemCanon
