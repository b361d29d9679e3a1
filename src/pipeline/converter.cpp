#include <pipeline/converter.hpp>
#include <extraction/channel_normalizer.hpp>
#include <extraction/variant_classifier.hpp>
#include <hashing/record_digest.hpp>
#include <output/canonical_serializer.hpp>
#include <source/flat_record_adapter.hpp>
#include <source/hierarchical_adapter.hpp>
#include <utils/logger.hpp>
#include <utility>

namespace FemCanon {

std::unique_ptr<SourceAdapter> make_adapter(SourceFormat format, SourceDocument document) {
    if (format == SourceFormat::FlatRecords) {
        return std::make_unique<FlatRecordAdapter>(std::move(document));
    }
    return std::make_unique<HierarchicalAdapter>(std::move(document));
}

std::optional<CanonicalModel> build_canonical_model(const SourceAdapter& adapter, ExtractionStats& stats) {
    auto inputs = normalize_channels(adapter, ChannelKind::Input, stats);
    auto outputs = normalize_channels(adapter, ChannelKind::Output, stats);
    return classify_model(adapter, std::move(inputs), std::move(outputs));
}

Converter::Converter(const SourceReader& reader, CanonicalStore& store, ConversionConfig config)
    : reader_(reader), store_(store), config_(std::move(config)) {}

LoadedSource Converter::load() const {
    // Only the hierarchical generation ships as two alternative artifacts
    if (config_.format == SourceFormat::Hierarchical) {
        return load_with_fallback(reader_, config_.primary_path(), config_.alternate_path());
    }
    return load_source(reader_, config_.primary_path());
}

ConversionReport Converter::run() const {
    ConversionReport report;
    report.format = config_.format;

    Logger::info(std::string("FEM conversion (") + to_string(config_.format) + " source)");

    LoadedSource loaded = load();
    report.source_path = loaded.path;
    report.used_alternate_source = loaded.used_alternate;

    auto adapter = make_adapter(config_.format, std::move(loaded.document));
    auto model = build_canonical_model(*adapter, report.stats);
    if (!model) {
        report.status = ConversionStatus::UnsupportedVariant;
        return report;
    }

    report.variant = model->variant;
    report.n_inputs = model->n_inputs();
    report.n_outputs = model->n_outputs();
    report.identifier = canonical_identifier(model->variant, config_.format, config_.encoding);

    auto bytes = CanonicalSerializer::encode(*model, config_.encoding);
    report.digest = RecordDigest::to_hex(RecordDigest::hash(bytes));
    report.bytes_written = bytes.size();

    Logger::step("Storing " + report.identifier);
    store_.put(report.identifier, bytes);
    report.status = ConversionStatus::Written;

    Logger::success(report.identifier + " written (" + std::to_string(report.bytes_written) +
                    " bytes, digest " + report.digest + ")");
    return report;
}

} // namespace FemCanon
