#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace audiobook_resume::config {

namespace fs = std::filesystem;

struct PathsConfig {
  std::string checkpoint_file = "recovery_checkpoint.json";
  std::string line_segments_dir = "line_segments";
  std::string line_extension = ".wav";
  std::string output_dir = "generated_audiobooks";
  std::string logs_dir = "logs";
};

struct AssemblyConfig {
  int silence_ms = 1000;
  std::string output_format = "m4a";
};

struct CleanupConfig {
  std::vector<std::string> patterns{"chapter_list_*.txt", "*.temp.*",
                                    "*.concat_list.txt"};
};

struct MediaConfig {
  std::string ffmpeg_bin = "ffmpeg";
  std::string ffprobe_bin = "ffprobe";
  std::string audio_bitrate = "256k";
};

struct Config {
  PathsConfig paths;
  AssemblyConfig assembly;
  CleanupConfig cleanup;
  MediaConfig media;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace audiobook_resume::config
