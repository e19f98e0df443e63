#include "audiobook_resume/config/configuration.hpp"
#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace audiobook_resume::config {

namespace core = audiobook_resume::core;

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }

    try {
        if (node["paths"]) {
            auto p = node["paths"];
            if (p["checkpoint_file"]) cfg.paths.checkpoint_file = p["checkpoint_file"].as<std::string>();
            if (p["line_segments_dir"]) cfg.paths.line_segments_dir = p["line_segments_dir"].as<std::string>();
            if (p["line_extension"]) cfg.paths.line_extension = p["line_extension"].as<std::string>();
            if (p["output_dir"]) cfg.paths.output_dir = p["output_dir"].as<std::string>();
            if (p["logs_dir"]) cfg.paths.logs_dir = p["logs_dir"].as<std::string>();
        }

        if (node["assembly"]) {
            auto a = node["assembly"];
            if (a["silence_ms"]) cfg.assembly.silence_ms = a["silence_ms"].as<int>();
            if (a["output_format"]) cfg.assembly.output_format = a["output_format"].as<std::string>();
        }

        if (node["cleanup"]) {
            auto c = node["cleanup"];
            if (c["patterns"]) {
                if (!c["patterns"].IsSequence()) {
                    throw ConfigError("cleanup.patterns must be a list");
                }
                cfg.cleanup.patterns.clear();
                for (const auto& pat : c["patterns"]) {
                    cfg.cleanup.patterns.push_back(pat.as<std::string>());
                }
            }
        }

        if (node["media"]) {
            auto m = node["media"];
            if (m["ffmpeg_bin"]) cfg.media.ffmpeg_bin = m["ffmpeg_bin"].as<std::string>();
            if (m["ffprobe_bin"]) cfg.media.ffprobe_bin = m["ffprobe_bin"].as<std::string>();
            if (m["audio_bitrate"]) cfg.media.audio_bitrate = m["audio_bitrate"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["paths"]["checkpoint_file"] = paths.checkpoint_file;
    node["paths"]["line_segments_dir"] = paths.line_segments_dir;
    node["paths"]["line_extension"] = paths.line_extension;
    node["paths"]["output_dir"] = paths.output_dir;
    node["paths"]["logs_dir"] = paths.logs_dir;

    node["assembly"]["silence_ms"] = assembly.silence_ms;
    node["assembly"]["output_format"] = assembly.output_format;

    for (const auto& pat : cleanup.patterns) {
        node["cleanup"]["patterns"].push_back(pat);
    }

    node["media"]["ffmpeg_bin"] = media.ffmpeg_bin;
    node["media"]["ffprobe_bin"] = media.ffprobe_bin;
    node["media"]["audio_bitrate"] = media.audio_bitrate;

    return node;
}

void Config::validate() const {
    if (paths.checkpoint_file.empty()) {
        throw ValidationError("paths.checkpoint_file must not be empty");
    }
    if (paths.line_segments_dir.empty()) {
        throw ValidationError("paths.line_segments_dir must not be empty");
    }
    if (paths.line_extension.size() < 2 || paths.line_extension[0] != '.') {
        throw ValidationError("paths.line_extension must start with '.' (e.g. '.wav')");
    }
    if (paths.output_dir.empty()) {
        throw ValidationError("paths.output_dir must not be empty");
    }
    if (assembly.silence_ms < 0 || assembly.silence_ms > 60000) {
        throw ValidationError("assembly.silence_ms must be in [0,60000]");
    }
    if (assembly.output_format.empty() ||
        !std::all_of(assembly.output_format.begin(), assembly.output_format.end(),
                     [](unsigned char c) { return std::isalnum(c) != 0; })) {
        throw ValidationError("assembly.output_format must be a plain extension such as 'm4a'");
    }
    if (cleanup.patterns.empty()) {
        throw ValidationError("cleanup.patterns must contain at least one pattern");
    }
    for (const auto& pat : cleanup.patterns) {
        if (pat.empty() || pat.find('/') != std::string::npos) {
            throw ValidationError("cleanup.patterns entries must be non-empty file name globs");
        }
        if (!core::is_valid_glob(pat)) {
            throw ValidationError("cleanup.patterns entry '" + pat + "' is not a valid glob");
        }
    }
    if (media.ffmpeg_bin.empty() || media.ffprobe_bin.empty()) {
        throw ValidationError("media.ffmpeg_bin and media.ffprobe_bin must not be empty");
    }
    if (media.audio_bitrate.empty()) {
        throw ValidationError("media.audio_bitrate must not be empty");
    }
}

} // namespace audiobook_resume::config
