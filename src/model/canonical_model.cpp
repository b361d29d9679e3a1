#include <model/canonical_model.hpp>

namespace FemCanon {

namespace {

size_t count_channels(const std::vector<ChannelGroup>& groups) {
    size_t total = 0;
    for (const auto& group : groups) total += group.entries.size();
    return total;
}

} // namespace

const char* to_string(ChannelKind kind) {
    return kind == ChannelKind::Input ? "input" : "output";
}

const char* to_string(SourceFormat format) {
    return format == SourceFormat::FlatRecords ? "flat-records" : "hierarchical";
}

const char* to_string(ModelVariant variant) {
    return variant == ModelVariant::Modal ? "modal" : "static-reduction";
}

size_t CanonicalModel::n_inputs() const {
    return count_channels(inputs);
}

size_t CanonicalModel::n_outputs() const {
    return count_channels(outputs);
}

} // namespace FemCanon
