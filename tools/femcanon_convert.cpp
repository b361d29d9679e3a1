/**
 * @file femcanon_convert.cpp
 * @brief CLI tool converting one FEM export into its canonical record
 *
 * Usage: femcanon_convert [options]
 *
 * Defaults come from FEM_REPO, STATIC_FEM_REPO, FEMCANON_OUTPUT_DIR,
 * FEMCANON_ENCODING and FEMCANON_FORMAT; flags override them.
 *
 * Exit status: 0 record written, 2 unsupported model variant, 1 error.
 */

#include <pipeline/converter.hpp>
#include <pipeline/model_summary.hpp>
#include <output/canonical_serializer.hpp>
#include <output/canonical_store.hpp>
#include <model/errors.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace FemCanon;

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  --format <flat|hierarchical>   source export generation (default: hierarchical)\n"
              << "  --source <file>                primary source file\n"
              << "  --source-dir <dir>             directory holding the default source files\n"
              << "  --alternate-dir <dir>          directory of the alternate (static reduction) file\n"
              << "  --output-dir <dir>             where the canonical record is stored\n"
              << "  --encoding <json|cbor|msgpack> canonical record encoding (default: json)\n"
              << "  --summary                      print a model overview after conversion\n"
              << "  --quiet                        only report errors\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        ConversionConfig config = ConversionConfig::load_from_env();
        bool summary = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::runtime_error(arg + " expects a value");
                return argv[++i];
            };

            if (arg == "--format") {
                std::string name = value();
                auto format = parse_source_format(name);
                if (!format) throw std::runtime_error("unknown source format: " + name);
                config.format = *format;
            } else if (arg == "--source") {
                config.source_file = value();
            } else if (arg == "--source-dir") {
                config.source_dir = value();
            } else if (arg == "--alternate-dir") {
                config.alternate_dir = value();
            } else if (arg == "--output-dir") {
                config.output_dir = value();
            } else if (arg == "--encoding") {
                std::string name = value();
                auto encoding = parse_encoding(name);
                if (!encoding) throw std::runtime_error("unknown encoding: " + name);
                config.encoding = *encoding;
            } else if (arg == "--summary") {
                summary = true;
            } else if (arg == "--quiet") {
                Logger::set_threshold(Logger::Level::Error);
            } else if (arg == "--help" || arg == "-h") {
                usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                usage(argv[0]);
                return 1;
            }
        }

        JsonRecordReader reader;
        DirectoryStore store(config.output_path());
        Converter converter(reader, store, config);

        ConversionReport report = converter.run();
        if (report.status == ConversionStatus::UnsupportedVariant) {
            Logger::error("Not a suitable model: " + report.source_path.string());
            return 2;
        }

        std::cout << "\n✓ Conversion complete!\n";
        std::cout << "  Source:    " << report.source_path.string()
                  << (report.used_alternate_source ? " (alternate)" : "") << "\n";
        std::cout << "  Record:    " << store.path_of(report.identifier).string() << "\n";
        std::cout << "  Variant:   " << to_string(*report.variant) << "\n";
        std::cout << "  Groups:    " << report.stats.groups << "\n";
        std::cout << "  Inputs:    " << report.n_inputs << "\n";
        std::cout << "  Outputs:   " << report.n_outputs << "\n";
        std::cout << "  Omitted:   " << report.stats.omitted_fields << " optional fields\n";
        std::cout << "  Digest:    " << report.digest << "\n";

        if (summary) {
            std::cout << "\n" << format_summary(CanonicalSerializer::load(store.path_of(report.identifier)),
                                                report.identifier);
        }
        return 0;

    } catch (const ConversionError& e) {
        Logger::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
