#include <source/flat_record_adapter.hpp>
#include <model/errors.hpp>
#include <utility>

namespace FemCanon {

FlatRecordAdapter::FlatRecordAdapter(SourceDocument document) : document_(std::move(document)) {}

const FieldTable& FlatRecordAdapter::field_table() {
    static const FieldTable table{
        {
            {k_field_types,        Presence::Mandatory, Recovery::Abort},
            {k_field_descriptions, Presence::Mandatory, Recovery::Abort},
            {k_field_indices,      Presence::Mandatory, Recovery::Abort},
            {k_field_excite_ids,   Presence::Mandatory, Recovery::Abort},
            {k_field_properties,   Presence::Mandatory, Recovery::Abort},
            {k_prop_node_id,       Presence::Mandatory, Recovery::Abort},
            {k_prop_cs_label,      Presence::Mandatory, Recovery::Abort},
            {k_prop_cs_number,     Presence::Optional,  Recovery::Abort},
        },
        {
            {k_field_types,        Presence::Mandatory, Recovery::Abort},
            {k_field_descriptions, Presence::Mandatory, Recovery::Abort},
            {k_field_indices,      Presence::Mandatory, Recovery::Abort},
            {k_field_properties,   Presence::Mandatory, Recovery::Abort},
            {k_prop_node_id,       Presence::Mandatory, Recovery::Abort},
            {k_prop_cs_label,      Presence::Optional,  Recovery::Omit},
            {k_prop_cs_number,     Presence::Optional,  Recovery::Abort},
            {k_prop_component,     Presence::Optional,  Recovery::Abort},
        },
        Recovery::Abort,
        Decoding::Strict
    };
    return table;
}

std::vector<std::string> FlatRecordAdapter::group_names(ChannelKind kind) const {
    std::vector<std::string> names;
    for (const auto& [name, record] : group_root(document_, kind).items()) {
        names.push_back(name);
    }
    return names;
}

const SourceDocument& FlatRecordAdapter::group_record(ChannelKind kind, const std::string& group) const {
    const SourceDocument* record = find_member(group_root(document_, kind), group);
    if (record == nullptr) {
        throw ConversionError(ErrorKind::MandatoryFieldMissing,
                              std::string(group_root_key(kind)) + "/" + group);
    }
    if (!record->is_object()) {
        throw ConversionError(ErrorKind::InvalidFieldValue,
                              std::string(group_root_key(kind)) + "/" + group + " is not a structured array");
    }
    return *record;
}

size_t FlatRecordAdapter::entry_count(ChannelKind kind, const std::string& group) const {
    const SourceDocument& record = group_record(kind, group);
    std::string base = std::string(group_root_key(kind)) + "/" + group + "/";

    const SourceDocument* types = find_member(record, k_field_types);
    if (types == nullptr) {
        throw ConversionError(ErrorKind::MandatoryFieldMissing, base + std::string(k_field_types));
    }
    if (!types->is_array()) {
        throw ConversionError(ErrorKind::InvalidFieldValue, base + std::string(k_field_types) + " is not an array");
    }

    // Every field of a structured array shares its extent
    size_t extent = types->size();
    for (const auto& [name, values] : record.items()) {
        if (!values.is_array() || values.size() != extent) {
            throw ConversionError(ErrorKind::InvalidFieldValue,
                                  base + name + " does not span the " + std::to_string(extent) + " channels of the group");
        }
    }
    return extent;
}

const SourceDocument* FlatRecordAdapter::field(ChannelKind kind, const std::string& group,
                                               size_t k, std::string_view name) const {
    const SourceDocument* values = find_member(group_record(kind, group), name);
    if (values == nullptr || !values->is_array() || k >= values->size()) {
        return nullptr;
    }
    return &(*values)[k];
}

const SourceDocument* FlatRecordAdapter::top_level(std::string_view key) const {
    return find_member(document_, key);
}

} // namespace FemCanon
