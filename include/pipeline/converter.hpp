/**
 * @file converter.hpp
 * @brief One conversion run: source file to stored canonical record
 *
 * Stages run in a fixed line:
 * 1. Reader     → SourceDocument (whole file in memory)
 * 2. Adapter    → layout and tolerance of the export generation
 * 3. Normalizer → inputs and outputs channel groups
 * 4. Classifier → CanonicalModel, or nothing for an unsupported variant
 * 5. Serializer → bytes under a variant/generation identifier in the store
 *
 * Any fatal error aborts before stage 5, so nothing partial is stored.
 */

#pragma once

#include <extraction/property_extractor.hpp>
#include <model/canonical_model.hpp>
#include <output/canonical_store.hpp>
#include <pipeline/conversion_config.hpp>
#include <source/source_adapter.hpp>
#include <source/source_reader.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace FemCanon {

enum class ConversionStatus {
    Written,
    UnsupportedVariant
};

struct ConversionReport {
    ConversionStatus status = ConversionStatus::UnsupportedVariant;
    SourceFormat format = SourceFormat::Hierarchical;
    std::filesystem::path source_path;
    bool used_alternate_source = false;
    std::optional<ModelVariant> variant;
    std::string identifier;
    std::string digest;          // BLAKE3 of the stored bytes, hex
    size_t bytes_written = 0;
    size_t n_inputs = 0;
    size_t n_outputs = 0;
    ExtractionStats stats;
};

std::unique_ptr<SourceAdapter> make_adapter(SourceFormat format, SourceDocument document);

/// Stages 3 and 4 over an adapter.
std::optional<CanonicalModel> build_canonical_model(const SourceAdapter& adapter, ExtractionStats& stats);

class Converter {
public:
    Converter(const SourceReader& reader, CanonicalStore& store, ConversionConfig config);

    /// Throws ConversionError on any fatal condition.
    ConversionReport run() const;

    const ConversionConfig& config() const { return config_; }

private:
    LoadedSource load() const;

    const SourceReader& reader_;
    CanonicalStore& store_;
    ConversionConfig config_;
};

} // namespace FemCanon
