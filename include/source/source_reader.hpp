/**
 * @file source_reader.hpp
 * @brief Boundary to the external structured-file readers
 *
 * A reader turns one file into a nested record tree. The tree is held in
 * memory in full; adapters address it afterwards by name.
 */

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

namespace FemCanon {

/// Nested record tree returned by a reader. Key order follows the source.
using SourceDocument = nlohmann::ordered_json;

class SourceReader {
public:
    virtual ~SourceReader() = default;

    /// Read the whole file; throws ConversionError(SourceLoadFailure) when unreadable.
    virtual SourceDocument read(const std::filesystem::path& path) const = 0;
};

/**
 * @brief Reader for nested-record exports serialized as JSON
 *
 * Numeric arrays are (possibly nested) JSON arrays, byte sequences are
 * arrays of integers in [0, 255], undefined values are null. A key repeated
 * within one mapping is rejected: DuplicateGroupName for a channel group,
 * SourceLoadFailure otherwise.
 */
class JsonRecordReader : public SourceReader {
public:
    SourceDocument read(const std::filesystem::path& path) const override;
};

struct LoadedSource {
    SourceDocument document;
    std::filesystem::path path;
    bool used_alternate = false;
};

/// Load a single file with no fallback.
LoadedSource load_source(const SourceReader& reader, const std::filesystem::path& path);

/**
 * @brief Load `primary`, or `alternate` when the primary cannot be read.
 *
 * Exactly one alternate attempt is made; when it fails too the error of
 * the alternate is reported along with the primary failure.
 */
LoadedSource load_with_fallback(const SourceReader& reader,
                                const std::filesystem::path& primary,
                                const std::filesystem::path& alternate);

} // namespace FemCanon
