#include "audiobook_resume/config/configuration.hpp"
#include "audiobook_resume/core/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

using audiobook_resume::ConfigError;
using audiobook_resume::ValidationError;
using audiobook_resume::config::Config;
using audiobook_resume::testing::ScratchDir;
using audiobook_resume::testing::write_file;

TEST_CASE("config_defaults_match_recovery_layout") {
  Config cfg;
  REQUIRE(cfg.paths.checkpoint_file == "recovery_checkpoint.json");
  REQUIRE(cfg.paths.line_segments_dir == "line_segments");
  REQUIRE(cfg.paths.line_extension == ".wav");
  REQUIRE(cfg.assembly.silence_ms == 1000);
  REQUIRE(cfg.assembly.output_format == "m4a");
  REQUIRE(cfg.cleanup.patterns.size() == 3);
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_from_yaml_overrides_selected_fields") {
  YAML::Node node = YAML::Load(R"(
paths:
  line_segments_dir: segments
assembly:
  silence_ms: 500
  output_format: mp3
cleanup:
  patterns: ["*.part"]
media:
  ffmpeg_bin: /opt/ffmpeg/bin/ffmpeg
)");
  Config cfg = Config::from_yaml(node);
  REQUIRE(cfg.paths.line_segments_dir == "segments");
  REQUIRE(cfg.paths.checkpoint_file == "recovery_checkpoint.json");
  REQUIRE(cfg.assembly.silence_ms == 500);
  REQUIRE(cfg.assembly.output_format == "mp3");
  REQUIRE(cfg.cleanup.patterns == std::vector<std::string>{"*.part"});
  REQUIRE(cfg.media.ffmpeg_bin == "/opt/ffmpeg/bin/ffmpeg");
  REQUIRE(cfg.media.ffprobe_bin == "ffprobe");
}

TEST_CASE("config_save_then_load_preserves_values") {
  ScratchDir dir;
  Config cfg;
  cfg.assembly.silence_ms = 250;
  cfg.paths.output_dir = "books";
  cfg.cleanup.patterns = {"*.temp.*"};
  cfg.save(dir.path() / "resume.yaml");

  Config loaded = Config::load(dir.path() / "resume.yaml");
  REQUIRE(loaded.assembly.silence_ms == 250);
  REQUIRE(loaded.paths.output_dir == "books");
  REQUIRE(loaded.cleanup.patterns == std::vector<std::string>{"*.temp.*"});
}

TEST_CASE("config_load_missing_file_throws_config_error") {
  ScratchDir dir;
  REQUIRE_THROWS_AS(Config::load(dir.path() / "nope.yaml"), ConfigError);
}

TEST_CASE("config_load_rejects_wrong_types") {
  ScratchDir dir;
  write_file(dir.path() / "bad.yaml", "assembly:\n  silence_ms: lots\n");
  REQUIRE_THROWS_AS(Config::load(dir.path() / "bad.yaml"), ConfigError);

  write_file(dir.path() / "bad2.yaml", "cleanup:\n  patterns: '*.tmp'\n");
  REQUIRE_THROWS_AS(Config::load(dir.path() / "bad2.yaml"), ConfigError);
}

TEST_CASE("config_validate_rejects_out_of_range_values") {
  Config cfg;
  cfg.assembly.silence_ms = -1;
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config{};
  cfg.assembly.output_format = "../m4a";
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config{};
  cfg.paths.line_extension = "wav";
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config{};
  cfg.cleanup.patterns.clear();
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg = Config{};
  cfg.cleanup.patterns = {"sub/*.tmp"};
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_validate_rejects_malformed_cleanup_glob") {
  Config cfg;
  cfg.cleanup.patterns = {"*.temp.*", "chapter_[1.txt"};
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);

  cfg.cleanup.patterns = {"chapter_[0-9].txt"};
  REQUIRE_NOTHROW(cfg.validate());
}
