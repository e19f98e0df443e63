#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace audiobook_resume::media {

namespace fs = std::filesystem;

/**
 * Audio operations the phase pipeline delegates to. Implementations may block
 * for a long time and report failure by throwing.
 */
class MediaOperations {
public:
    virtual ~MediaOperations() = default;

    // Concatenate line segments (in the given order) into working_dir/chapter_file.
    virtual void assemble(const std::string& chapter_file, const std::vector<int>& line_indices,
                          const fs::path& line_dir, const fs::path& working_dir) = 0;

    // Append duration_ms of silence to the chapter file in place.
    virtual void add_silence(const fs::path& chapter_path, int duration_ms) = 0;

    // Transcode input to output; the target format follows output's extension.
    virtual void convert(const fs::path& input, const fs::path& output) = 0;

    // Merge converted chapters (working_dir relative names) into the final
    // audiobook and return its path.
    virtual fs::path merge_final(const std::vector<std::string>& converted_files,
                                 const fs::path& working_dir, const fs::path& book_path,
                                 const std::string& narrator_voice) = 0;
};

} // namespace audiobook_resume::media
