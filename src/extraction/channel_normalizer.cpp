#include <extraction/channel_normalizer.hpp>
#include <extraction/field_coercion.hpp>
#include <extraction/text_decoding.hpp>
#include <model/errors.hpp>
#include <utils/logger.hpp>
#include <set>

namespace FemCanon {

namespace {

// The raw field, nullptr when an optional one is absent or undefined
const SourceDocument* lookup(const SourceAdapter& adapter, ChannelKind kind,
                             const std::string& group, size_t k, std::string_view name) {
    const SourceDocument* raw = adapter.field(kind, group, k, name);
    if (raw != nullptr && !raw->is_null()) return raw;

    const FieldRule* rule = adapter.fields().rule(kind, name);
    if (rule != nullptr && rule->presence == Presence::Mandatory) {
        throw ConversionError(ErrorKind::MandatoryFieldMissing, field_path(kind, group, k, name));
    }
    return nullptr;
}

std::string strict_text(const SourceDocument& raw, const std::string& where) {
    auto text = decode_text(raw, Decoding::Strict);
    if (!text) {
        throw ConversionError(ErrorKind::TextDecodeError, where + " is not valid UTF-8 text");
    }
    return *text;
}

std::vector<uint32_t> uint32_sequence(const SourceDocument& raw, const std::string& where) {
    auto values = to_uint32s(raw);
    if (!values) {
        throw ConversionError(ErrorKind::InvalidFieldValue, where + " is not a sequence of uint32");
    }
    return *values;
}

} // namespace

ChannelEntry normalize_entry(const SourceAdapter& adapter, ChannelKind kind,
                             const std::string& group, size_t k, ExtractionStats& stats) {
    ChannelEntry entry;

    if (const auto* raw = lookup(adapter, kind, group, k, k_field_types)) {
        entry.type_tag = strict_text(*raw, field_path(kind, group, k, k_field_types));
    }
    if (const auto* raw = lookup(adapter, kind, group, k, k_field_descriptions)) {
        entry.description = strict_text(*raw, field_path(kind, group, k, k_field_descriptions));
    }
    if (const auto* raw = lookup(adapter, kind, group, k, k_field_indices)) {
        entry.indices = uint32_sequence(*raw, field_path(kind, group, k, k_field_indices));
    }
    if (kind == ChannelKind::Input) {
        if (const auto* raw = lookup(adapter, kind, group, k, k_field_excite_ids)) {
            entry.excitation_ids = uint32_sequence(*raw, field_path(kind, group, k, k_field_excite_ids));
        } else {
            entry.excitation_ids.emplace();
        }
    }
    if (const auto* raw = lookup(adapter, kind, group, k, k_field_properties)) {
        entry.properties = extract_properties(*raw, kind, adapter.fields(),
                                              field_path(kind, group, k, k_field_properties), stats);
    }

    return entry;
}

ChannelGroup normalize_group(const SourceAdapter& adapter, ChannelKind kind,
                             const std::string& group, ExtractionStats& stats) {
    ChannelGroup result;
    result.name = group;

    size_t n = adapter.entry_count(kind, group);
    result.entries.reserve(n);
    for (size_t k = 0; k < n; ++k) {
        result.entries.push_back(normalize_entry(adapter, kind, group, k, stats));
    }

    ++stats.groups;
    stats.channels += n;
    return result;
}

std::vector<ChannelGroup> normalize_channels(const SourceAdapter& adapter, ChannelKind kind,
                                             ExtractionStats& stats) {
    std::vector<std::string> names = adapter.group_names(kind);
    Logger::step("Normalizing " + std::string(group_root_key(kind)) + " (" +
                 std::to_string(names.size()) + " groups)");

    std::set<std::string> seen;
    std::vector<ChannelGroup> groups;
    groups.reserve(names.size());

    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            throw ConversionError(ErrorKind::DuplicateGroupName,
                                  std::string(group_root_key(kind)) + "/" + name);
        }
        groups.push_back(normalize_group(adapter, kind, name, stats));
    }

    return groups;
}

} // namespace FemCanon
