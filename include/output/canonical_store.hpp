/**
 * @file canonical_store.hpp
 * @brief Sink for serialized canonical records
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace FemCanon {

class CanonicalStore {
public:
    virtual ~CanonicalStore() = default;

    /// Publish `bytes` under `identifier`; throws ConversionError(StoreWriteFailure).
    virtual void put(const std::string& identifier, const std::vector<uint8_t>& bytes) = 0;
};

/**
 * @brief Store writing one file per identifier in a directory.
 *
 * Records are written to a temporary sibling first and renamed into place,
 * so a failed run never leaves a truncated record behind.
 */
class DirectoryStore : public CanonicalStore {
public:
    explicit DirectoryStore(std::filesystem::path directory);

    void put(const std::string& identifier, const std::vector<uint8_t>& bytes) override;

    std::filesystem::path path_of(const std::string& identifier) const { return directory_ / identifier; }

private:
    std::filesystem::path directory_;
};

} // namespace FemCanon
