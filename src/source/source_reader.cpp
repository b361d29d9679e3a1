#include <source/source_reader.hpp>
#include <model/errors.hpp>
#include <source/source_adapter.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <vector>

namespace FemCanon {

namespace fs = std::filesystem;

namespace {

/**
 * @brief Rejects repeated keys while a document is parsed.
 *
 * The DOM parser keeps only the last of two equal keys, which would drop a
 * whole channel group without notice. A repeated group name is reported as
 * DuplicateGroupName, any other repeated key as SourceLoadFailure.
 */
class RepeatedKeyGuard {
public:
    explicit RepeatedKeyGuard(const fs::path& path) : path_(path.string()) {}

    bool operator()(int /*depth*/, SourceDocument::parse_event_t event, SourceDocument& parsed) {
        using Event = SourceDocument::parse_event_t;

        switch (event) {
            case Event::object_start:
            case Event::array_start:
                open(event == Event::object_start);
                break;
            case Event::object_end:
            case Event::array_end:
                if (!stack_.empty()) stack_.pop_back();
                break;
            case Event::key:
                check(parsed.get<std::string>());
                break;
            case Event::value:
                break;
        }
        return true;
    }

private:
    struct Container {
        bool is_object = false;
        std::string name;              // Key holding this container in its parent mapping
        std::set<std::string> keys;
        std::string last_key;
    };

    void open(bool is_object) {
        Container c;
        c.is_object = is_object;
        if (!stack_.empty() && stack_.back().is_object) c.name = stack_.back().last_key;
        stack_.push_back(std::move(c));
    }

    void check(const std::string& key) {
        Container& current = stack_.back();
        if (!current.keys.insert(key).second) {
            bool group_mapping = stack_.size() == 2 &&
                                 (current.name == k_key_inputs || current.name == k_key_outputs);
            if (group_mapping) {
                throw ConversionError(ErrorKind::DuplicateGroupName, current.name + "/" + key);
            }
            throw ConversionError(ErrorKind::SourceLoadFailure,
                                  path_ + ": key " + key + " repeats within one mapping");
        }
        current.last_key = key;
    }

    std::string path_;
    std::vector<Container> stack_;
};

} // namespace

SourceDocument JsonRecordReader::read(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConversionError(ErrorKind::SourceLoadFailure, "cannot open " + path.string());
    }

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ConversionError(ErrorKind::SourceLoadFailure, "read error on " + path.string());
    }

    try {
        return SourceDocument::parse(contents, RepeatedKeyGuard(path));
    } catch (const nlohmann::json::parse_error& e) {
        throw ConversionError(ErrorKind::SourceLoadFailure,
                              path.string() + " is not a record export: " + e.what());
    }
}

LoadedSource load_source(const SourceReader& reader, const fs::path& path) {
    Logger::step("Loading " + path.string());
    LoadedSource loaded;
    loaded.document = reader.read(path);
    loaded.path = path;
    return loaded;
}

LoadedSource load_with_fallback(const SourceReader& reader,
                                const fs::path& primary,
                                const fs::path& alternate) {
    try {
        return load_source(reader, primary);
    } catch (const ConversionError& e) {
        if (e.kind() != ErrorKind::SourceLoadFailure) throw;
        Logger::warn(std::string(e.what()) + "; trying " + alternate.string());
    }

    try {
        LoadedSource loaded = load_source(reader, alternate);
        loaded.used_alternate = true;
        return loaded;
    } catch (const ConversionError& e) {
        if (e.kind() != ErrorKind::SourceLoadFailure) throw;
        throw ConversionError(ErrorKind::SourceLoadFailure,
                              "neither " + primary.string() + " nor " + alternate.string() +
                              " could be loaded (" + e.what() + ")");
    }
}

} // namespace FemCanon
