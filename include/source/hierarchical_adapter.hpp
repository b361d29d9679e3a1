/**
 * @file hierarchical_adapter.hpp
 * @brief Adapter for the hierarchical large-model export (format B)
 *
 * A channel group is a list of per-channel mappings addressed index first:
 * group[k][field]. The schema of this generation evolved over time, so
 * optional property fields are attempted and dropped when unavailable.
 */

#pragma once

#include <source/source_adapter.hpp>

namespace FemCanon {

class HierarchicalAdapter : public SourceAdapter {
public:
    explicit HierarchicalAdapter(SourceDocument document);

    SourceFormat format() const override { return SourceFormat::Hierarchical; }
    const FieldTable& fields() const override { return field_table(); }

    std::vector<std::string> group_names(ChannelKind kind) const override;
    size_t entry_count(ChannelKind kind, const std::string& group) const override;
    const SourceDocument* field(ChannelKind kind, const std::string& group,
                                size_t k, std::string_view name) const override;
    const SourceDocument* top_level(std::string_view key) const override;

    static const FieldTable& field_table();

private:
    const SourceDocument& channel_list(ChannelKind kind, const std::string& group) const;

    SourceDocument document_;
};

} // namespace FemCanon
