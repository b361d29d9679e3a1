#pragma once

#include <model/canonical_model.hpp>
#include <output/canonical_serializer.hpp>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace FemCanon {

/// "flat"/"a" or "hierarchical"/"b"; std::nullopt otherwise.
inline std::optional<SourceFormat> parse_source_format(std::string_view name) {
    if (name == "flat" || name == "a" || name == "A") return SourceFormat::FlatRecords;
    if (name == "hierarchical" || name == "b" || name == "B") return SourceFormat::Hierarchical;
    return std::nullopt;
}

struct ConversionConfig {
    SourceFormat format = SourceFormat::Hierarchical;

    std::filesystem::path source_dir = ".";
    std::filesystem::path alternate_dir;   // Directory of the alternate file; empty means source_dir
    std::filesystem::path source_file;     // Explicit primary file; empty means source_dir/primary_name
    std::string primary_name = "modal_state_space_model_2ndOrder.rs.json";
    std::string alternate_name = "static_reduction_model.rs.json";

    std::filesystem::path output_dir;      // Empty means source_dir
    Encoding encoding = Encoding::Json;

    std::filesystem::path primary_path() const {
        return source_file.empty() ? source_dir / primary_name : source_file;
    }

    std::filesystem::path alternate_path() const {
        return (alternate_dir.empty() ? source_dir : alternate_dir) / alternate_name;
    }

    std::filesystem::path output_path() const {
        return output_dir.empty() ? source_dir : output_dir;
    }

    /**
     * @brief Defaults overridden by the environment.
     *
     * FEM_REPO           source directory
     * STATIC_FEM_REPO    directory of the alternate (static reduction) file
     * FEMCANON_OUTPUT_DIR, FEMCANON_ENCODING, FEMCANON_FORMAT
     */
    static ConversionConfig load_from_env() {
        ConversionConfig config;

        if (const char* repo = std::getenv("FEM_REPO")) config.source_dir = repo;
        if (const char* static_repo = std::getenv("STATIC_FEM_REPO")) config.alternate_dir = static_repo;
        if (const char* out = std::getenv("FEMCANON_OUTPUT_DIR")) config.output_dir = out;

        if (const char* encoding = std::getenv("FEMCANON_ENCODING")) {
            auto parsed = parse_encoding(encoding);
            if (!parsed) throw std::runtime_error(std::string("FEMCANON_ENCODING: unknown encoding ") + encoding);
            config.encoding = *parsed;
        }

        if (const char* format = std::getenv("FEMCANON_FORMAT")) {
            auto parsed = parse_source_format(format);
            if (!parsed) throw std::runtime_error(std::string("FEMCANON_FORMAT: unknown source format ") + format);
            config.format = *parsed;
        }

        return config;
    }
};

} // namespace FemCanon
