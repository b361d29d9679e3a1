/**
 * @file flat_record_adapter.hpp
 * @brief Adapter for the flat array-of-records export (format A)
 *
 * A channel group is a structured array addressed field first:
 * group[field][k] is `field` of channel k. This generation was always
 * exported in full, so extraction is strict: a missing or malformed field
 * means the file is corrupt.
 */

#pragma once

#include <source/source_adapter.hpp>

namespace FemCanon {

class FlatRecordAdapter : public SourceAdapter {
public:
    explicit FlatRecordAdapter(SourceDocument document);

    SourceFormat format() const override { return SourceFormat::FlatRecords; }
    const FieldTable& fields() const override { return field_table(); }

    std::vector<std::string> group_names(ChannelKind kind) const override;
    size_t entry_count(ChannelKind kind, const std::string& group) const override;
    const SourceDocument* field(ChannelKind kind, const std::string& group,
                                size_t k, std::string_view name) const override;
    const SourceDocument* top_level(std::string_view key) const override;

    static const FieldTable& field_table();

private:
    const SourceDocument& group_record(ChannelKind kind, const std::string& group) const;

    SourceDocument document_;
};

} // namespace FemCanon
