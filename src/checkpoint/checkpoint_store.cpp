#include "audiobook_resume/checkpoint/checkpoint_store.hpp"

#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/core/utils.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <set>

namespace audiobook_resume::checkpoint {

namespace core = audiobook_resume::core;
using json = nlohmann::json;

nlohmann::ordered_json to_json(const Checkpoint& cp) {
    nlohmann::ordered_json j;

    nlohmann::ordered_json map_json = nlohmann::ordered_json::object();
    for (const auto& ch : cp.chapter_files) {
        auto it = cp.chapter_line_map.find(ch);
        if (it != cp.chapter_line_map.end()) {
            map_json[ch] = it->second;
        }
    }
    for (const auto& [ch, lines] : cp.chapter_line_map) {
        if (!map_json.contains(ch)) {
            map_json[ch] = lines;
        }
    }

    j["chapter_line_map"] = map_json;
    j["chapter_files"] = cp.chapter_files;
    j["total_lines"] = cp.total_lines;

    nlohmann::ordered_json meta = nlohmann::ordered_json::array();
    for (const auto& m : cp.results_metadata) {
        meta.push_back({{"index", m.index},
                        {"line", m.line},
                        {"is_chapter_heading", m.is_chapter_heading}});
    }
    j["results_metadata"] = meta;
    return j;
}

static const json& require_field(const json& j, const char* key) {
    if (!j.contains(key)) {
        throw CheckpointError(std::string("missing field '") + key + "'");
    }
    return j.at(key);
}

// Non-negative integer that fits in int; nlohmann's get<int>() would truncate.
static int require_count(const json& v, const std::string& what) {
    if (v.is_number_unsigned()) {
        if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw CheckpointError(what + " is out of range");
        }
        return static_cast<int>(v.get<std::uint64_t>());
    }
    if (v.is_number_integer()) {
        std::int64_t n = v.get<std::int64_t>();
        if (n < 0 || n > std::numeric_limits<int>::max()) {
            throw CheckpointError(what + " is out of range");
        }
        return static_cast<int>(n);
    }
    throw CheckpointError(what + " must be an integer");
}

Checkpoint from_json(const json& j) {
    if (!j.is_object()) {
        throw CheckpointError("document is not a JSON object");
    }

    Checkpoint cp;
    try {
        const json& map_json = require_field(j, "chapter_line_map");
        if (!map_json.is_object()) {
            throw CheckpointError("'chapter_line_map' must be an object");
        }
        for (const auto& [ch, lines] : map_json.items()) {
            if (!lines.is_array()) {
                throw CheckpointError("chapter_line_map['" + ch + "'] must be an array");
            }
            std::vector<int> indices;
            indices.reserve(lines.size());
            for (const auto& v : lines) {
                indices.push_back(require_count(v, "chapter_line_map['" + ch + "'] index"));
            }
            cp.chapter_line_map[ch] = std::move(indices);
        }

        const json& files_json = require_field(j, "chapter_files");
        if (!files_json.is_array()) {
            throw CheckpointError("'chapter_files' must be an array");
        }
        for (const auto& f : files_json) {
            cp.chapter_files.push_back(f.get<std::string>());
        }

        const json& total_json = require_field(j, "total_lines");
        cp.total_lines = require_count(total_json, "'total_lines'");

        const json& meta_json = require_field(j, "results_metadata");
        if (!meta_json.is_array()) {
            throw CheckpointError("'results_metadata' must be an array");
        }
        for (const auto& m : meta_json) {
            UnitMetadata um;
            um.index = require_count(m.at("index"), "results_metadata index");
            um.line = m.at("line").get<std::string>();
            um.is_chapter_heading = m.at("is_chapter_heading").get<bool>();
            cp.results_metadata.push_back(std::move(um));
        }
    } catch (const json::exception& e) {
        throw CheckpointError(e.what());
    }

    validate(cp);
    return cp;
}

void validate(const Checkpoint& cp) {
    if (cp.total_lines < 0) {
        throw CheckpointError("total_lines must be >= 0");
    }

    std::set<std::string> ordered(cp.chapter_files.begin(), cp.chapter_files.end());
    if (ordered.size() != cp.chapter_files.size()) {
        throw CheckpointError("chapter_files contains duplicate entries");
    }
    for (const auto& ch : cp.chapter_files) {
        if (!core::is_plain_file_name(ch)) {
            throw CheckpointError("chapter '" + ch + "' is not a plain file name");
        }
        if (cp.chapter_line_map.find(ch) == cp.chapter_line_map.end()) {
            throw CheckpointError("chapter '" + ch + "' has no entry in chapter_line_map");
        }
    }
    for (const auto& [ch, lines] : cp.chapter_line_map) {
        if (ordered.find(ch) == ordered.end()) {
            throw CheckpointError("chapter_line_map entry '" + ch + "' is not listed in chapter_files");
        }
    }

    std::set<int> covered;
    for (const auto& [ch, lines] : cp.chapter_line_map) {
        for (int idx : lines) {
            if (idx < 0 || idx >= cp.total_lines) {
                throw CheckpointError("chapter '" + ch + "' references line " +
                                      std::to_string(idx) + " outside [0, " +
                                      std::to_string(cp.total_lines) + ")");
            }
            covered.insert(idx);
        }
    }
    if (static_cast<int>(covered.size()) != cp.total_lines) {
        throw CheckpointError("chapters cover " + std::to_string(covered.size()) +
                              " distinct lines but total_lines is " +
                              std::to_string(cp.total_lines));
    }

    if (static_cast<int>(cp.results_metadata.size()) != cp.total_lines) {
        throw CheckpointError("results_metadata has " +
                              std::to_string(cp.results_metadata.size()) +
                              " entries, expected " + std::to_string(cp.total_lines));
    }
}

CheckpointStore::CheckpointStore(const fs::path& working_dir, const std::string& file_name)
    : path_(working_dir / file_name) {}

bool CheckpointStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(path_, ec);
}

void CheckpointStore::write(const ChapterLineMap& chapter_line_map,
                            const std::vector<std::string>& chapter_files,
                            const std::vector<UnitMetadata>& results_metadata) const {
    Checkpoint cp;
    cp.chapter_line_map = chapter_line_map;
    cp.chapter_files = chapter_files;
    cp.total_lines = static_cast<int>(results_metadata.size());
    cp.results_metadata = results_metadata;
    write(cp);
}

void CheckpointStore::write(const Checkpoint& cp) const {
    validate(cp);

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        throw IOError("Cannot create " + path_.parent_path().string() + ": " + ec.message());
    }

    core::write_text_atomic(path_, to_json(cp).dump(2) + "\n");
    std::cerr << "[CHECKPOINT] Recovery checkpoint written: " << path_.string()
              << " (" << cp.chapter_files.size() << " chapters, "
              << cp.total_lines << " lines)" << std::endl;
}

Checkpoint CheckpointStore::read_strict() const {
    std::string text = core::read_text(path_);

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw CheckpointError(std::string("cannot parse ") + path_.string() + ": " + e.what());
    }
    return from_json(j);
}

std::optional<Checkpoint> CheckpointStore::read() const {
    if (!exists()) {
        return std::nullopt;
    }

    try {
        return read_strict();
    } catch (const CheckpointError& e) {
        std::cerr << "[CHECKPOINT] Warning: could not load recovery checkpoint: "
                  << e.what() << std::endl;
    } catch (const IOError& e) {
        std::cerr << "[CHECKPOINT] Warning: could not read recovery checkpoint: "
                  << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace audiobook_resume::checkpoint
