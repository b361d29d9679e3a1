#include <extraction/text_decoding.hpp>
#include <utils/unicode.hpp>

namespace FemCanon {

namespace {

bool append_bytes(const SourceDocument& node, std::string& out) {
    if (node.is_array()) {
        for (const auto& element : node) {
            if (!append_bytes(element, out)) return false;
        }
        return true;
    }
    if (node.is_number_unsigned()) {
        auto value = node.get<uint64_t>();
        if (value > 0xFF) return false;
        out.push_back(static_cast<char>(value));
        return true;
    }
    if (node.is_number_integer()) {
        auto value = node.get<int64_t>();
        if (value < 0 || value > 0xFF) return false;
        out.push_back(static_cast<char>(value));
        return true;
    }
    if (node.is_number_float()) {
        // MATLAB char arrays come out as doubles from some exporters
        double value = node.get<double>();
        if (!(value >= 0.0 && value <= 255.0) || value != static_cast<double>(static_cast<int>(value))) {
            return false;
        }
        out.push_back(static_cast<char>(static_cast<int>(value)));
        return true;
    }
    return false;
}

} // namespace

std::optional<std::string> decode_text(const SourceDocument& raw, Decoding decoding) {
    if (raw.is_string()) {
        return raw.get<std::string>();
    }
    if (!raw.is_array()) {
        return std::nullopt;
    }

    std::string bytes;
    if (!append_bytes(raw, bytes)) {
        return std::nullopt;
    }

    if (decoding == Decoding::Lenient) {
        return drop_invalid_utf8(bytes);
    }
    if (!is_valid_utf8(bytes)) {
        return std::nullopt;
    }
    return bytes;
}

} // namespace FemCanon
