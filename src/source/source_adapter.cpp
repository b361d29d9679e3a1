#include <source/source_adapter.hpp>
#include <model/errors.hpp>

namespace FemCanon {

const FieldRule* FieldTable::rule(ChannelKind kind, std::string_view name) const {
    const auto& rules = kind == ChannelKind::Input ? input_rules : output_rules;
    for (const auto& r : rules) {
        if (r.name == name) return &r;
    }
    return nullptr;
}

std::string_view group_root_key(ChannelKind kind) {
    return kind == ChannelKind::Input ? k_key_inputs : k_key_outputs;
}

const SourceDocument& group_root(const SourceDocument& document, ChannelKind kind) {
    std::string_view key = group_root_key(kind);
    const SourceDocument* root = find_member(document, key);
    if (root == nullptr || root->is_null()) {
        throw ConversionError(ErrorKind::MandatoryFieldMissing, std::string(key));
    }
    if (!root->is_object()) {
        throw ConversionError(ErrorKind::InvalidFieldValue, std::string(key) + " is not a mapping of channel groups");
    }
    return *root;
}

const SourceDocument* find_member(const SourceDocument& node, std::string_view key) {
    if (!node.is_object()) return nullptr;
    auto it = node.find(std::string(key));
    return it == node.end() ? nullptr : &*it;
}

std::string field_path(ChannelKind kind, const std::string& group, size_t k, std::string_view name) {
    std::string path(group_root_key(kind));
    path += "/" + group + "[" + std::to_string(k) + "]";
    if (!name.empty()) {
        path += "/";
        path += name;
    }
    return path;
}

} // namespace FemCanon
