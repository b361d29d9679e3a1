#include <source/hierarchical_adapter.hpp>
#include <model/errors.hpp>
#include <utility>

namespace FemCanon {

HierarchicalAdapter::HierarchicalAdapter(SourceDocument document) : document_(std::move(document)) {}

const FieldTable& HierarchicalAdapter::field_table() {
    static const FieldTable table{
        {
            {k_field_types,        Presence::Mandatory, Recovery::Abort},
            {k_field_descriptions, Presence::Mandatory, Recovery::Abort},
            {k_field_indices,      Presence::Mandatory, Recovery::Abort},
            {k_field_excite_ids,   Presence::Mandatory, Recovery::Abort},
            {k_field_properties,   Presence::Mandatory, Recovery::Abort},
            {k_prop_node_id,       Presence::Mandatory, Recovery::Abort},
            {k_prop_cs_label,      Presence::Mandatory, Recovery::Abort},
            {k_prop_cs_number,     Presence::Optional,  Recovery::Omit},
        },
        {
            {k_field_types,        Presence::Mandatory, Recovery::Abort},
            {k_field_descriptions, Presence::Mandatory, Recovery::Abort},
            {k_field_indices,      Presence::Mandatory, Recovery::Abort},
            {k_field_properties,   Presence::Mandatory, Recovery::Abort},
            {k_prop_node_id,       Presence::Mandatory, Recovery::Abort},
            {k_prop_cs_label,      Presence::Optional,  Recovery::Omit},
            {k_prop_cs_number,     Presence::Optional,  Recovery::Omit},
            {k_prop_component,     Presence::Optional,  Recovery::Omit},
        },
        Recovery::Omit,
        Decoding::Lenient
    };
    return table;
}

std::vector<std::string> HierarchicalAdapter::group_names(ChannelKind kind) const {
    std::vector<std::string> names;
    for (const auto& [name, channels] : group_root(document_, kind).items()) {
        names.push_back(name);
    }
    return names;
}

const SourceDocument& HierarchicalAdapter::channel_list(ChannelKind kind, const std::string& group) const {
    const SourceDocument* channels = find_member(group_root(document_, kind), group);
    if (channels == nullptr) {
        throw ConversionError(ErrorKind::MandatoryFieldMissing,
                              std::string(group_root_key(kind)) + "/" + group);
    }
    if (!channels->is_array()) {
        throw ConversionError(ErrorKind::InvalidFieldValue,
                              std::string(group_root_key(kind)) + "/" + group + " is not a list of channels");
    }
    return *channels;
}

size_t HierarchicalAdapter::entry_count(ChannelKind kind, const std::string& group) const {
    return channel_list(kind, group).size();
}

const SourceDocument* HierarchicalAdapter::field(ChannelKind kind, const std::string& group,
                                                 size_t k, std::string_view name) const {
    const SourceDocument& channels = channel_list(kind, group);
    if (k >= channels.size()) return nullptr;

    const SourceDocument& channel = channels[k];
    if (!channel.is_object()) {
        throw ConversionError(ErrorKind::InvalidFieldValue,
                              field_path(kind, group, k, "") + " is not a channel mapping");
    }
    return find_member(channel, name);
}

const SourceDocument* HierarchicalAdapter::top_level(std::string_view key) const {
    return find_member(document_, key);
}

} // namespace FemCanon
