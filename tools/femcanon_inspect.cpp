/**
 * @file femcanon_inspect.cpp
 * @brief CLI tool printing the overview of stored canonical records
 *
 * Usage: femcanon_inspect <record> [record...]
 */

#include <output/canonical_serializer.hpp>
#include <pipeline/model_summary.hpp>
#include <iostream>
#include <filesystem>

using namespace FemCanon;
namespace fs = std::filesystem;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <record> [record...]\n";
        return 1;
    }

    try {
        for (int i = 1; i < argc; ++i) {
            fs::path path(argv[i]);
            CanonicalModel model = CanonicalSerializer::load(path);
            std::cout << format_summary(model, path.filename().string()) << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }
}
