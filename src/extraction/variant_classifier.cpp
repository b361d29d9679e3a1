#include <extraction/variant_classifier.hpp>
#include <extraction/field_coercion.hpp>
#include <extraction/text_decoding.hpp>
#include <model/errors.hpp>
#include <utils/logger.hpp>
#include <utility>

namespace FemCanon {

namespace {

// Absent, null and empty payloads carry no variant. A non-numeric one does,
// and is rejected when the payload is read.
bool present(const SourceAdapter& adapter, std::string_view key) {
    const SourceDocument* value = adapter.top_level(key);
    if (value == nullptr || value->is_null()) return false;

    auto values = to_doubles(*value);
    return !values || !values->empty();
}

std::vector<double> payload(const SourceAdapter& adapter, std::string_view key) {
    auto values = to_doubles(*adapter.top_level(key));
    if (!values) {
        throw ConversionError(ErrorKind::InvalidFieldValue, std::string(key) + " is not a numeric array");
    }
    return std::move(*values);
}

std::string model_description(const SourceAdapter& adapter) {
    const SourceDocument* raw = adapter.top_level(k_key_description);
    if (raw == nullptr || raw->is_null()) {
        throw ConversionError(ErrorKind::MandatoryFieldMissing, std::string(k_key_description));
    }

    auto text = decode_text(*raw, adapter.fields().model_description);
    if (!text) {
        throw ConversionError(ErrorKind::TextDecodeError,
                              std::string(k_key_description) + " is not valid UTF-8 text");
    }
    return std::move(*text);
}

} // namespace

std::optional<ModelVariant> detect_variant(const SourceAdapter& adapter) {
    if (present(adapter, k_key_eigenfrequencies) &&
        present(adapter, k_key_inputs_to_modal_force) &&
        present(adapter, k_key_modal_disp_to_outputs) &&
        present(adapter, k_key_damping)) {
        return ModelVariant::Modal;
    }
    if (present(adapter, k_key_gain_matrix)) {
        return ModelVariant::StaticReduction;
    }
    return std::nullopt;
}

std::optional<CanonicalModel> classify_model(const SourceAdapter& adapter,
                                             std::vector<ChannelGroup> inputs,
                                             std::vector<ChannelGroup> outputs) {
    auto variant = detect_variant(adapter);
    if (!variant) {
        Logger::warn("Source carries neither the modal payload nor a gain matrix: unsupported variant");
        return std::nullopt;
    }

    CanonicalModel model;
    model.model_description = model_description(adapter);
    model.inputs = std::move(inputs);
    model.outputs = std::move(outputs);
    model.variant = *variant;

    if (*variant == ModelVariant::Modal) {
        model.modal.eigenfrequencies = payload(adapter, k_key_eigenfrequencies);
        model.modal.inputs_to_modal_force = payload(adapter, k_key_inputs_to_modal_force);
        model.modal.modal_displacement_to_outputs = payload(adapter, k_key_modal_disp_to_outputs);
        model.modal.proportional_damping_vector = payload(adapter, k_key_damping);
    } else {
        model.static_gain.gain_matrix = payload(adapter, k_key_gain_matrix);
    }

    Logger::info(std::string("Variant: ") + to_string(*variant));
    return model;
}

} // namespace FemCanon
