/**
 * @file canonical_model.hpp
 * @brief Canonical FEM model record shared by every pipeline stage
 *
 * Every value here is built once per conversion run and consumed as const.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace FemCanon {

enum class ChannelKind {
    Input,
    Output
};

/**
 * @brief Source encoding generation
 *
 * FlatRecords is the older array-of-records export (format A);
 * Hierarchical is the large-file nested-mapping export (format B).
 */
enum class SourceFormat {
    FlatRecords,
    Hierarchical
};

enum class ModelVariant {
    Modal,
    StaticReduction
};

const char* to_string(ChannelKind kind);
const char* to_string(SourceFormat format);
const char* to_string(ModelVariant variant);

// Canonical names of the special property fields, in output order
inline constexpr const char* k_record_cs_label = "coordinateSystemLabel";
inline constexpr const char* k_record_node_id = "nodeId";
inline constexpr const char* k_record_cs_number = "coordinateSystemNumber";
inline constexpr const char* k_record_component = "component";

/**
 * @brief Per-channel metadata
 *
 * Optional members stay disengaged when the source lacks them; they are
 * never defaulted. `fields` keeps every other property in source order.
 */
struct PropertyRecord {
    std::optional<std::string> coordinate_system_label;
    std::vector<uint32_t> node_id;
    std::optional<std::vector<uint32_t>> coordinate_system_number;
    std::optional<std::vector<int32_t>> component;
    std::vector<std::pair<std::string, std::vector<double>>> fields;
};

struct ChannelEntry {
    std::string type_tag;
    std::string description;
    std::vector<uint32_t> indices;
    std::optional<std::vector<uint32_t>> excitation_ids; // Inputs only
    PropertyRecord properties;
};

struct ChannelGroup {
    std::string name;
    std::vector<ChannelEntry> entries;
};

struct ModalPayload {
    std::vector<double> eigenfrequencies;
    std::vector<double> inputs_to_modal_force;
    std::vector<double> modal_displacement_to_outputs;
    std::vector<double> proportional_damping_vector;

    bool empty() const {
        return eigenfrequencies.empty() && inputs_to_modal_force.empty() &&
               modal_displacement_to_outputs.empty() && proportional_damping_vector.empty();
    }
};

struct StaticPayload {
    std::vector<double> gain_matrix;

    bool empty() const { return gain_matrix.empty(); }
};

struct CanonicalModel {
    std::string model_description;
    std::vector<ChannelGroup> inputs;
    std::vector<ChannelGroup> outputs;
    ModelVariant variant = ModelVariant::Modal;
    ModalPayload modal;          // Empty unless variant == Modal
    StaticPayload static_gain;   // Empty unless variant == StaticReduction

    size_t n_inputs() const;
    size_t n_outputs() const;
    size_t n_modes() const { return modal.eigenfrequencies.size(); }
};

} // namespace FemCanon
