#pragma once

#include "audiobook_resume/config/configuration.hpp"
#include "audiobook_resume/media/command_runner.hpp"
#include "audiobook_resume/media/media_operations.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace audiobook_resume::media {

namespace fs = std::filesystem;

/**
 * MediaOperations backed by the ffmpeg/ffprobe command-line tools.
 *
 * Transient files follow the cleaner's patterns so an interrupted call
 * leaves nothing the next resume cannot discard:
 *   <chapter stem>.concat_list.txt   assemble input list
 *   <chapter stem>.temp.<ext>        add_silence output before rename
 *   chapter_list_<title>.txt         merge_final chapter metadata
 *   <title>.concat_list.txt          merge_final input list
 */
class FfmpegMediaOperations : public MediaOperations {
public:
    FfmpegMediaOperations(const config::MediaConfig& cfg, std::string line_extension,
                          fs::path output_dir, CommandRunner& runner);

    void assemble(const std::string& chapter_file, const std::vector<int>& line_indices,
                  const fs::path& line_dir, const fs::path& working_dir) override;
    void add_silence(const fs::path& chapter_path, int duration_ms) override;
    void convert(const fs::path& input, const fs::path& output) override;
    fs::path merge_final(const std::vector<std::string>& converted_files,
                         const fs::path& working_dir, const fs::path& book_path,
                         const std::string& narrator_voice) override;

    // Duration of a media file in seconds, as reported by ffprobe.
    double probe_duration_seconds(const fs::path& file);

private:
    CommandResult run_checked(const std::string& command);

    config::MediaConfig cfg_;
    std::string line_extension_;
    fs::path output_dir_;
    CommandRunner& runner_;
};

// Line of an ffmpeg concat demuxer list: file '<path>'
std::string concat_list_entry(const fs::path& file);

// Escape a value for an FFMETADATA1 file
std::string escape_ffmetadata(const std::string& value);

} // namespace audiobook_resume::media
