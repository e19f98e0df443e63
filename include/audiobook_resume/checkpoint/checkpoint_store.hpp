#pragma once

#include "audiobook_resume/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace audiobook_resume::checkpoint {

namespace fs = std::filesystem;

inline constexpr const char* kDefaultCheckpointFile = "recovery_checkpoint.json";

/**
 * Serialize a checkpoint. chapter_line_map entries are written in
 * chapter_files order so the file reads in assembly order.
 */
nlohmann::ordered_json to_json(const Checkpoint& cp);

/**
 * Parse and validate a checkpoint document.
 * Throws CheckpointError on missing fields, wrong types or violated invariants.
 */
Checkpoint from_json(const nlohmann::json& j);

/**
 * Check the structural invariants of a checkpoint:
 *  - total_lines >= 0
 *  - chapter_files and chapter_line_map keys name the same set, no duplicates
 *  - every line index lies in [0, total_lines)
 *  - the union of all chapter indices covers exactly total_lines lines
 *  - results_metadata has one entry per line
 */
void validate(const Checkpoint& cp);

/**
 * Reads and writes the single recovery checkpoint of a working directory.
 */
class CheckpointStore {
public:
    explicit CheckpointStore(const fs::path& working_dir,
                             const std::string& file_name = kDefaultCheckpointFile);

    const fs::path& path() const { return path_; }
    bool exists() const;

    // Atomic overwrite (temp file + rename). total_lines = metadata.size().
    void write(const ChapterLineMap& chapter_line_map,
               const std::vector<std::string>& chapter_files,
               const std::vector<UnitMetadata>& results_metadata) const;
    void write(const Checkpoint& cp) const;

    // Absent file or corrupt content both yield nullopt; corruption is logged.
    std::optional<Checkpoint> read() const;

    // Throwing variant of read(); the file must exist.
    Checkpoint read_strict() const;

private:
    fs::path path_;
};

} // namespace audiobook_resume::checkpoint
