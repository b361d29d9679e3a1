#include <output/canonical_store.hpp>
#include <model/errors.hpp>
#include <fstream>
#include <system_error>
#include <utility>

namespace FemCanon {

namespace fs = std::filesystem;

DirectoryStore::DirectoryStore(fs::path directory) : directory_(std::move(directory)) {}

void DirectoryStore::put(const std::string& identifier, const std::vector<uint8_t>& bytes) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw ConversionError(ErrorKind::StoreWriteFailure,
                              "cannot create " + directory_.string() + ": " + ec.message());
    }

    fs::path target = path_of(identifier);
    fs::path staging = target;
    staging += ".tmp";

    {
        std::ofstream file(staging, std::ios::binary | std::ios::trunc);
        if (file) {
            file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
            file.flush();
        }
        if (!file) {
            file.close();
            fs::remove(staging, ec);
            throw ConversionError(ErrorKind::StoreWriteFailure, "cannot write " + staging.string());
        }
    }

    fs::rename(staging, target, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(staging, cleanup);
        throw ConversionError(ErrorKind::StoreWriteFailure,
                              "cannot publish " + target.string() + ": " + ec.message());
    }
}

} // namespace FemCanon
