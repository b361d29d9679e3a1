#include <extraction/field_coercion.hpp>
#include <cmath>

namespace FemCanon {

namespace {

bool flatten(const SourceDocument& node, std::vector<double>& out) {
    if (node.is_array()) {
        for (const auto& element : node) {
            if (!flatten(element, out)) return false;
        }
        return true;
    }
    if (!node.is_number()) return false;

    double value = node.get<double>();
    if (!std::isfinite(value)) return false;
    out.push_back(value);
    return true;
}

template <typename T>
std::optional<std::vector<T>> to_integers(const SourceDocument& raw, double lo, double hi) {
    std::vector<double> values;
    if (!flatten(raw, values)) return std::nullopt;

    std::vector<T> out;
    out.reserve(values.size());
    for (double value : values) {
        double truncated = std::trunc(value);
        if (truncated < lo || truncated >= hi) return std::nullopt;
        out.push_back(static_cast<T>(truncated));
    }
    return out;
}

} // namespace

std::optional<std::vector<double>> to_doubles(const SourceDocument& raw) {
    std::vector<double> out;
    if (!flatten(raw, out)) return std::nullopt;
    return out;
}

std::optional<std::vector<uint32_t>> to_uint32s(const SourceDocument& raw) {
    return to_integers<uint32_t>(raw, 0.0, 4294967296.0);
}

std::optional<std::vector<int32_t>> to_int32s(const SourceDocument& raw) {
    return to_integers<int32_t>(raw, -2147483648.0, 2147483648.0);
}

} // namespace FemCanon
