#include <output/canonical_serializer.hpp>
#include <model/errors.hpp>
#include <fstream>
#include <iterator>

namespace FemCanon {

namespace {

using Record = CanonicalSerializer::Record;

constexpr const char* k_out_description = "modelDescription";
constexpr const char* k_out_inputs = "inputs";
constexpr const char* k_out_outputs = "outputs";
constexpr const char* k_out_eigenfrequencies = "eigenfrequencies";
constexpr const char* k_out_inputs_to_modal_force = "inputsToModalForce";
constexpr const char* k_out_modal_disp_to_outputs = "modalDisplacementToOutputs";
constexpr const char* k_out_damping = "proportionalDampingVector";
constexpr const char* k_out_gain_matrix = "gainMatrix";

constexpr const char* k_out_type_tag = "typeTag";
constexpr const char* k_out_channel_description = "description";
constexpr const char* k_out_indices = "indices";
constexpr const char* k_out_excitation_ids = "excitationIds";
constexpr const char* k_out_properties = "properties";

constexpr const char* k_out_cs_label = k_record_cs_label;
constexpr const char* k_out_node_id = k_record_node_id;
constexpr const char* k_out_cs_number = k_record_cs_number;
constexpr const char* k_out_component = k_record_component;

Record properties_record(const PropertyRecord& properties) {
    Record r = Record::object();
    if (properties.coordinate_system_label) r[k_out_cs_label] = *properties.coordinate_system_label;
    r[k_out_node_id] = properties.node_id;
    if (properties.coordinate_system_number) r[k_out_cs_number] = *properties.coordinate_system_number;
    if (properties.component) r[k_out_component] = *properties.component;
    for (const auto& [name, values] : properties.fields) {
        r[name] = values;
    }
    return r;
}

Record groups_record(const std::vector<ChannelGroup>& groups) {
    Record list = Record::array();
    for (const auto& group : groups) {
        Record channels = Record::array();
        for (const auto& entry : group.entries) {
            Record channel = Record::object();
            channel[k_out_type_tag] = entry.type_tag;
            channel[k_out_channel_description] = entry.description;
            channel[k_out_indices] = entry.indices;
            if (entry.excitation_ids) channel[k_out_excitation_ids] = *entry.excitation_ids;
            channel[k_out_properties] = properties_record(entry.properties);
            channels.push_back(std::move(channel));
        }
        Record named = Record::object();
        named[group.name] = std::move(channels);
        list.push_back(std::move(named));
    }
    return list;
}

PropertyRecord properties_from(const Record& r, ChannelKind kind) {
    PropertyRecord properties;
    for (const auto& [name, value] : r.items()) {
        if (name == k_out_cs_label) {
            properties.coordinate_system_label = value.get<std::string>();
        } else if (name == k_out_node_id) {
            properties.node_id = value.get<std::vector<uint32_t>>();
        } else if (name == k_out_cs_number) {
            properties.coordinate_system_number = value.get<std::vector<uint32_t>>();
        } else if (name == k_out_component && kind == ChannelKind::Output) {
            properties.component = value.get<std::vector<int32_t>>();
        } else {
            properties.fields.emplace_back(name, value.get<std::vector<double>>());
        }
    }
    return properties;
}

std::vector<ChannelGroup> groups_from(const Record& list, ChannelKind kind) {
    std::vector<ChannelGroup> groups;
    for (const auto& named : list) {
        for (const auto& [name, channels] : named.items()) {
            ChannelGroup group;
            group.name = name;
            for (const auto& channel : channels) {
                ChannelEntry entry;
                entry.type_tag = channel.at(k_out_type_tag).get<std::string>();
                entry.description = channel.at(k_out_channel_description).get<std::string>();
                entry.indices = channel.at(k_out_indices).get<std::vector<uint32_t>>();
                if (kind == ChannelKind::Input) {
                    entry.excitation_ids = channel.at(k_out_excitation_ids).get<std::vector<uint32_t>>();
                }
                entry.properties = properties_from(channel.at(k_out_properties), kind);
                group.entries.push_back(std::move(entry));
            }
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

} // namespace

const char* to_string(Encoding encoding) {
    switch (encoding) {
        case Encoding::Json:        return "json";
        case Encoding::Cbor:        return "cbor";
        case Encoding::MessagePack: return "msgpack";
    }
    return "json";
}

std::optional<Encoding> parse_encoding(std::string_view name) {
    if (name == "json") return Encoding::Json;
    if (name == "cbor") return Encoding::Cbor;
    if (name == "msgpack") return Encoding::MessagePack;
    return std::nullopt;
}

const char* extension(Encoding encoding) {
    switch (encoding) {
        case Encoding::Json:        return ".json";
        case Encoding::Cbor:        return ".cbor";
        case Encoding::MessagePack: return ".msgpack";
    }
    return ".json";
}

std::string canonical_identifier(ModelVariant variant, SourceFormat format, Encoding encoding) {
    std::string id = variant == ModelVariant::Modal ? "modal_state_space_model_2ndOrder"
                                                    : "static_reduction_model";
    if (format == SourceFormat::Hierarchical) id += ".73";
    return id + extension(encoding);
}

Record CanonicalSerializer::to_record(const CanonicalModel& model) {
    Record r = Record::object();
    r[k_out_description] = model.model_description;
    r[k_out_inputs] = groups_record(model.inputs);
    r[k_out_outputs] = groups_record(model.outputs);
    r[k_out_eigenfrequencies] = model.modal.eigenfrequencies;
    r[k_out_inputs_to_modal_force] = model.modal.inputs_to_modal_force;
    r[k_out_modal_disp_to_outputs] = model.modal.modal_displacement_to_outputs;
    r[k_out_damping] = model.modal.proportional_damping_vector;
    r[k_out_gain_matrix] = model.static_gain.gain_matrix;
    return r;
}

std::vector<uint8_t> CanonicalSerializer::encode(const CanonicalModel& model, Encoding encoding) {
    Record record = to_record(model);
    switch (encoding) {
        case Encoding::Cbor:
            return Record::to_cbor(record);
        case Encoding::MessagePack:
            return Record::to_msgpack(record);
        case Encoding::Json:
            break;
    }
    std::string text = record.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

CanonicalModel CanonicalSerializer::from_record(const Record& record) {
    try {
        CanonicalModel model;
        model.model_description = record.at(k_out_description).get<std::string>();
        model.inputs = groups_from(record.at(k_out_inputs), ChannelKind::Input);
        model.outputs = groups_from(record.at(k_out_outputs), ChannelKind::Output);
        model.modal.eigenfrequencies = record.at(k_out_eigenfrequencies).get<std::vector<double>>();
        model.modal.inputs_to_modal_force = record.at(k_out_inputs_to_modal_force).get<std::vector<double>>();
        model.modal.modal_displacement_to_outputs = record.at(k_out_modal_disp_to_outputs).get<std::vector<double>>();
        model.modal.proportional_damping_vector = record.at(k_out_damping).get<std::vector<double>>();
        model.static_gain.gain_matrix = record.at(k_out_gain_matrix).get<std::vector<double>>();
        model.variant = model.modal.empty() ? ModelVariant::StaticReduction : ModelVariant::Modal;
        return model;
    } catch (const nlohmann::json::exception& e) {
        throw ConversionError(ErrorKind::InvalidFieldValue, std::string("malformed canonical record: ") + e.what());
    }
}

CanonicalModel CanonicalSerializer::load(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConversionError(ErrorKind::SourceLoadFailure, "cannot open " + path.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::string ext = path.extension().string();
    try {
        if (ext == extension(Encoding::Cbor)) return from_record(Record::from_cbor(bytes));
        if (ext == extension(Encoding::MessagePack)) return from_record(Record::from_msgpack(bytes));
        return from_record(Record::parse(bytes));
    } catch (const nlohmann::json::parse_error& e) {
        throw ConversionError(ErrorKind::SourceLoadFailure, path.string() + ": " + e.what());
    }
}

} // namespace FemCanon
