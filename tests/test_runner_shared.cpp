#include "runner_shared.hpp"

#include "audiobook_resume/core/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <ostream>
#include <sstream>

using audiobook_resume::ConfigError;
using audiobook_resume::testing::ScratchDir;
using audiobook_resume::testing::write_file;

namespace runner = audiobook_resume::runner;

TEST_CASE("format_bytes_uses_binary_units") {
  REQUIRE(runner::format_bytes(0) == "0 B");
  REQUIRE(runner::format_bytes(1023) == "1023 B");
  REQUIRE(runner::format_bytes(1536) == "1.50 KiB");
  REQUIRE(runner::format_bytes(5ull * 1024 * 1024 * 1024) == "5.00 GiB");
}

TEST_CASE("estimate_total_file_bytes_skips_missing_files") {
  ScratchDir dir;
  write_file(dir.path() / "a", "1234");
  write_file(dir.path() / "b", "12");
  REQUIRE(runner::estimate_total_file_bytes(
              {dir.path() / "a", dir.path() / "b", dir.path() / "missing"}) == 6);
}

TEST_CASE("disk_full_messages_are_detected") {
  REQUIRE(runner::message_indicates_disk_full("write: No space left on device"));
  REQUIRE(runner::message_indicates_disk_full("ENOSPC"));
  REQUIRE(runner::message_indicates_disk_full("Disk full"));
  REQUIRE(runner::message_indicates_disk_full("write failed: Disk quota exceeded"));
  REQUIRE_FALSE(runner::message_indicates_disk_full("Invalid data found when processing input"));
}

TEST_CASE("failure_guidance_leads_with_disk_tip_when_disk_is_full") {
  auto full = runner::failure_guidance("No space left on device", "temp_audio");
  REQUIRE(full.front().find("sufficient free disk space") != std::string::npos);
  REQUIRE(full.size() == 4);

  auto other = runner::failure_guidance("Invalid data", "temp_audio");
  REQUIRE(other.front() == "Check that FFmpeg is properly installed and on PATH");
  REQUIRE(other.size() == 4);
  REQUIRE(other.back() == "Check file permissions in temp_audio");
}

TEST_CASE("tee_buf_writes_to_both_streams") {
  std::ostringstream a;
  std::ostringstream b;
  runner::TeeBuf tee(a.rdbuf(), b.rdbuf());
  std::ostream out(&tee);
  out << "{\"type\":\"run_start\"}" << std::endl;

  REQUIRE(a.str() == "{\"type\":\"run_start\"}\n");
  REQUIRE(b.str() == a.str());
}

TEST_CASE("load_run_config_prefers_explicit_path_then_work_dir_file") {
  ScratchDir dir;
  REQUIRE(runner::load_run_config(dir.path(), "").assembly.silence_ms == 1000);

  write_file(dir.path() / "resume.yaml", "assembly:\n  silence_ms: 500\n");
  REQUIRE(runner::load_run_config(dir.path(), "").assembly.silence_ms == 500);

  write_file(dir.path() / "other.yaml", "assembly:\n  silence_ms: 250\n");
  REQUIRE(runner::load_run_config(dir.path(), (dir.path() / "other.yaml").string())
              .assembly.silence_ms == 250);

  REQUIRE_THROWS_AS(runner::load_run_config(dir.path(), (dir.path() / "nope.yaml").string()),
                    ConfigError);
}
