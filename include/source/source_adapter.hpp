/**
 * @file source_adapter.hpp
 * @brief Capability set through which the extraction engine reads a source
 *
 * The two export generations differ in how channel groups are laid out and
 * in how tolerant extraction is. Both differences live behind this
 * interface: layout in the accessors, tolerance in the field table.
 */

#pragma once

#include <extraction/text_decoding.hpp>
#include <model/canonical_model.hpp>
#include <source/source_reader.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace FemCanon {

// Channel-level source field names
inline constexpr std::string_view k_field_types = "types";
inline constexpr std::string_view k_field_descriptions = "descriptions";
inline constexpr std::string_view k_field_indices = "indices";
inline constexpr std::string_view k_field_excite_ids = "exciteIDs";
inline constexpr std::string_view k_field_properties = "properties";

// Property source field names
inline constexpr std::string_view k_prop_cs_label = "csLabel";
inline constexpr std::string_view k_prop_node_id = "nodeID";
inline constexpr std::string_view k_prop_cs_number = "csNumber";
inline constexpr std::string_view k_prop_component = "component";

// Top-level source keys
inline constexpr std::string_view k_key_inputs = "fem_inputs";
inline constexpr std::string_view k_key_outputs = "fem_outputs";
inline constexpr std::string_view k_key_description = "modelDescription";
inline constexpr std::string_view k_key_eigenfrequencies = "eigenfrequencies";
inline constexpr std::string_view k_key_inputs_to_modal_force = "inputs2ModalF";
inline constexpr std::string_view k_key_modal_disp_to_outputs = "modalDisp2Outputs";
inline constexpr std::string_view k_key_damping = "proportionalDampingVec";
inline constexpr std::string_view k_key_gain_matrix = "gainMatrix";

/// What happens when a field is absent or null.
enum class Presence {
    Mandatory,  // Fatal
    Optional    // Omitted from the result
};

/// What happens when a field is present but cannot be decoded or coerced.
enum class Recovery {
    Abort,
    Omit
};

struct FieldRule {
    std::string_view name;
    Presence presence;
    Recovery on_invalid;
};

/**
 * @brief Per-field classification consulted during extraction
 *
 * Fields not listed for a channel kind are not rules at all: channel-level
 * ones are ignored and property ones are copied as plain numeric sequences
 * under `plain_fields` recovery.
 */
struct FieldTable {
    std::vector<FieldRule> input_rules;
    std::vector<FieldRule> output_rules;
    Recovery plain_fields;   // A null or non-numeric plain property field
    Decoding model_description;

    const FieldRule* rule(ChannelKind kind, std::string_view name) const;
};

class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    virtual SourceFormat format() const = 0;
    virtual const FieldTable& fields() const = 0;

    /// Group names under fem_inputs / fem_outputs, in source order.
    virtual std::vector<std::string> group_names(ChannelKind kind) const = 0;

    /// Number of channels in a group.
    virtual size_t entry_count(ChannelKind kind, const std::string& group) const = 0;

    /// Channel-level field of entry k, or nullptr when absent.
    virtual const SourceDocument* field(ChannelKind kind, const std::string& group,
                                        size_t k, std::string_view name) const = 0;

    /// Top-level key, or nullptr when absent.
    virtual const SourceDocument* top_level(std::string_view key) const = 0;

    bool has_field(ChannelKind kind, const std::string& group, size_t k, std::string_view name) const {
        return field(kind, group, k, name) != nullptr;
    }

    bool has_top_level(std::string_view key) const { return top_level(key) != nullptr; }
};

/// "fem_inputs" or "fem_outputs".
std::string_view group_root_key(ChannelKind kind);

/// The fem_inputs / fem_outputs mapping of a document; throws when absent or not a mapping.
const SourceDocument& group_root(const SourceDocument& document, ChannelKind kind);

/// Member of a mapping node, or nullptr.
const SourceDocument* find_member(const SourceDocument& node, std::string_view key);

/// Diagnostic path of a channel field, e.g. "fem_inputs/OSS_M1_lcl_6F[0]/indices".
std::string field_path(ChannelKind kind, const std::string& group, size_t k, std::string_view name);

} // namespace FemCanon
