#include "audiobook_resume/media/ffmpeg_media_operations.hpp"

#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/core/utils.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace audiobook_resume::media {

namespace core = audiobook_resume::core;

std::string concat_list_entry(const fs::path& file) {
    std::string out = "file '";
    for (char c : file.string()) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out += "'";
    return out;
}

std::string escape_ffmetadata(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '=' || c == ';' || c == '#' || c == '\\' || c == '\n') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

FfmpegMediaOperations::FfmpegMediaOperations(const config::MediaConfig& cfg,
                                             std::string line_extension, fs::path output_dir,
                                             CommandRunner& runner)
    : cfg_(cfg), line_extension_(std::move(line_extension)),
      output_dir_(std::move(output_dir)), runner_(runner) {}

CommandResult FfmpegMediaOperations::run_checked(const std::string& command) {
    std::cerr << "[MEDIA] Running: " << command << std::endl;
    CommandResult res = runner_.run(command);
    if (res.exit_code != 0) {
        throw CommandError(command, res.exit_code, output_tail(res.output));
    }
    return res;
}

void FfmpegMediaOperations::assemble(const std::string& chapter_file,
                                     const std::vector<int>& line_indices,
                                     const fs::path& line_dir, const fs::path& working_dir) {
    if (line_indices.empty()) {
        throw ValidationError("chapter '" + chapter_file + "' has no line segments");
    }

    fs::path chapter_path = working_dir / chapter_file;
    fs::path list_path =
        working_dir / (fs::path(chapter_file).stem().string() + ".concat_list.txt");

    std::ostringstream list;
    for (int idx : line_indices) {
        list << concat_list_entry(fs::absolute(core::line_file_path(line_dir, idx, line_extension_)))
             << "\n";
    }
    core::write_text(list_path, list.str());

    run_checked(core::shell_quote(cfg_.ffmpeg_bin) + " -y -hide_banner -loglevel error" +
                " -f concat -safe 0 -i " + core::shell_quote(list_path.string()) +
                " -c copy " + core::shell_quote(chapter_path.string()));

    std::error_code ec;
    fs::remove(list_path, ec);
}

void FfmpegMediaOperations::add_silence(const fs::path& chapter_path, int duration_ms) {
    if (!fs::exists(chapter_path)) {
        throw IOError("Chapter file not found: " + chapter_path.string());
    }

    fs::path temp_path = chapter_path.parent_path() /
                         (chapter_path.stem().string() + ".temp" +
                          chapter_path.extension().string());

    std::ostringstream pad;
    pad << std::fixed << std::setprecision(3) << (static_cast<double>(duration_ms) / 1000.0);

    run_checked(core::shell_quote(cfg_.ffmpeg_bin) + " -y -hide_banner -loglevel error" +
                " -i " + core::shell_quote(chapter_path.string()) +
                " -af apad=pad_dur=" + pad.str() + " " +
                core::shell_quote(temp_path.string()));

    std::error_code ec;
    fs::rename(temp_path, chapter_path, ec);
    if (ec) {
        throw IOError("Cannot replace " + chapter_path.string() + " with padded audio: " +
                      ec.message());
    }
}

void FfmpegMediaOperations::convert(const fs::path& input, const fs::path& output) {
    const std::string ext = core::to_lower(output.extension().string());

    std::string codec_args;
    if (ext == ".m4a" || ext == ".m4b" || ext == ".aac" || ext == ".mp4") {
        codec_args = " -c:a aac -b:a " + core::shell_quote(cfg_.audio_bitrate);
    } else if (ext == ".mp3") {
        codec_args = " -c:a libmp3lame -b:a " + core::shell_quote(cfg_.audio_bitrate);
    }

    run_checked(core::shell_quote(cfg_.ffmpeg_bin) + " -y -hide_banner -loglevel error" +
                " -i " + core::shell_quote(input.string()) + " -vn" + codec_args + " " +
                core::shell_quote(output.string()));
}

double FfmpegMediaOperations::probe_duration_seconds(const fs::path& file) {
    CommandResult res = run_checked(
        core::shell_quote(cfg_.ffprobe_bin) +
        " -v error -show_entries format=duration -of default=noprint_wrappers=1:nokey=1 " +
        core::shell_quote(file.string()));

    std::istringstream iss(res.output);
    double seconds = 0.0;
    if (!(iss >> seconds) || !std::isfinite(seconds) || seconds < 0.0) {
        throw IOError("ffprobe returned no usable duration for " + file.string());
    }
    return seconds;
}

fs::path FfmpegMediaOperations::merge_final(const std::vector<std::string>& converted_files,
                                            const fs::path& working_dir,
                                            const fs::path& book_path,
                                            const std::string& narrator_voice) {
    if (converted_files.empty()) {
        throw ValidationError("no converted chapters to merge");
    }

    std::string title = book_path.empty() ? std::string()
                                          : core::sanitize_filename(book_path.stem().string());
    if (title.empty()) {
        title = "audiobook";
    }

    std::ostringstream meta;
    meta << ";FFMETADATA1\n";
    meta << "title=" << escape_ffmetadata(title) << "\n";
    meta << "artist=" << escape_ffmetadata(narrator_voice) << "\n";

    std::ostringstream list;
    long long start_ms = 0;
    for (const auto& name : converted_files) {
        fs::path chapter = working_dir / name;
        double secs = probe_duration_seconds(chapter);
        long long end_ms = start_ms + static_cast<long long>(std::llround(secs * 1000.0));

        meta << "\n[CHAPTER]\nTIMEBASE=1/1000\n";
        meta << "START=" << start_ms << "\n";
        meta << "END=" << end_ms << "\n";
        meta << "title=" << escape_ffmetadata(fs::path(name).stem().string()) << "\n";
        start_ms = end_ms;

        list << concat_list_entry(fs::absolute(chapter)) << "\n";
    }

    fs::path meta_path = working_dir / ("chapter_list_" + title + ".txt");
    fs::path list_path = working_dir / (title + ".concat_list.txt");
    core::write_text(meta_path, meta.str());
    core::write_text(list_path, list.str());

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        throw IOError("Cannot create output directory " + output_dir_.string() + ": " +
                      ec.message());
    }
    fs::path out_path = output_dir_ / (title + ".m4b");

    run_checked(core::shell_quote(cfg_.ffmpeg_bin) + " -y -hide_banner -loglevel error" +
                " -f concat -safe 0 -i " + core::shell_quote(list_path.string()) +
                " -i " + core::shell_quote(meta_path.string()) +
                " -map 0:a -map_metadata 1 -map_chapters 1 -c copy " +
                core::shell_quote(out_path.string()));

    fs::remove(meta_path, ec);
    fs::remove(list_path, ec);
    return out_path;
}

} // namespace audiobook_resume::media
