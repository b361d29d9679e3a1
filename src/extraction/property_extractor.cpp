#include <extraction/property_extractor.hpp>
#include <extraction/field_coercion.hpp>
#include <extraction/text_decoding.hpp>
#include <model/errors.hpp>
#include <utils/logger.hpp>
#include <array>

namespace FemCanon {

namespace {

constexpr std::array<std::string_view, 4> k_special_properties = {
    k_prop_cs_label, k_prop_node_id, k_prop_cs_number, k_prop_component
};

// Record an unusable optional field, or throw when the rule says so
void drop_or_throw(const FieldRule& rule, ErrorKind kind, const std::string& where,
                   const std::string& why, ExtractionStats& stats) {
    if (rule.on_invalid == Recovery::Abort) {
        throw ConversionError(kind, where + " " + why);
    }
    Logger::warn(where + " " + why + "; omitted");
    ++stats.omitted_fields;
}

void extract_special(PropertyRecord& record, const FieldRule& rule, const SourceDocument& value,
                     const std::string& where, ExtractionStats& stats) {
    if (rule.name == k_prop_cs_label) {
        auto label = decode_text(value, Decoding::Strict);
        if (label) {
            record.coordinate_system_label = std::move(*label);
        } else {
            drop_or_throw(rule, ErrorKind::TextDecodeError, where, "is not valid UTF-8 text", stats);
        }
    } else if (rule.name == k_prop_node_id) {
        auto ids = to_uint32s(value);
        if (!ids) {
            throw ConversionError(ErrorKind::InvalidFieldValue, where + " is not a sequence of uint32");
        }
        if (ids->empty()) {
            throw ConversionError(ErrorKind::MandatoryFieldMissing, where + " is empty");
        }
        record.node_id = std::move(*ids);
    } else if (rule.name == k_prop_cs_number) {
        auto numbers = to_uint32s(value);
        if (numbers) {
            record.coordinate_system_number = std::move(*numbers);
        } else {
            drop_or_throw(rule, ErrorKind::InvalidFieldValue, where, "is not a sequence of uint32", stats);
        }
    } else if (rule.name == k_prop_component) {
        auto components = to_int32s(value);
        if (components) {
            record.component = std::move(*components);
        } else {
            drop_or_throw(rule, ErrorKind::InvalidFieldValue, where, "is not a sequence of int32", stats);
        }
    }
}

// A plain field may not take the canonical name of a special one. The
// canonical component name equals its source name, so an output component
// never reaches here and an input component stays a plain field.
bool takes_canonical_name(const std::string& name) {
    return name == k_record_cs_label || name == k_record_node_id || name == k_record_cs_number;
}

const FieldRule* special_rule(const FieldTable& table, ChannelKind kind, std::string_view name) {
    for (auto special : k_special_properties) {
        if (special == name) return table.rule(kind, name);
    }
    return nullptr;
}

} // namespace

PropertyRecord extract_properties(const SourceDocument& properties,
                                  ChannelKind kind,
                                  const FieldTable& table,
                                  const std::string& path,
                                  ExtractionStats& stats) {
    if (!properties.is_object()) {
        throw ConversionError(ErrorKind::InvalidFieldValue, path + " is not a property mapping");
    }

    PropertyRecord record;

    for (const auto& [name, value] : properties.items()) {
        std::string where = path + "/" + name;

        if (const FieldRule* rule = special_rule(table, kind, name)) {
            if (value.is_null()) continue; // Undefined: handled with the absent fields below
            extract_special(record, *rule, value, where, stats);
            continue;
        }

        if (takes_canonical_name(name)) {
            throw ConversionError(ErrorKind::InvalidFieldValue,
                                  where + " collides with the canonical property " + name);
        }

        auto values = value.is_null() ? std::nullopt : to_doubles(value);
        if (values) {
            record.fields.emplace_back(name, std::move(*values));
        } else if (table.plain_fields == Recovery::Abort) {
            throw ConversionError(ErrorKind::InvalidFieldValue, where + " is not a numeric sequence");
        } else {
            ++stats.omitted_fields;
        }
    }

    for (auto special : k_special_properties) {
        const FieldRule* rule = table.rule(kind, special);
        if (rule == nullptr) continue;

        const SourceDocument* value = find_member(properties, special);
        if (value != nullptr && !value->is_null()) continue;

        if (rule->presence == Presence::Mandatory) {
            throw ConversionError(ErrorKind::MandatoryFieldMissing, path + "/" + std::string(special));
        }
        ++stats.omitted_fields;
    }

    return record;
}

} // namespace FemCanon
