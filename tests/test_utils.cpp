#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/core/utils.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

namespace core = audiobook_resume::core;
using audiobook_resume::testing::ScratchDir;
using audiobook_resume::testing::write_file;

TEST_CASE("line_file_name_is_zero_padded_to_six_digits") {
  REQUIRE(core::line_file_name(0) == "line_000000.wav");
  REQUIRE(core::line_file_name(7) == "line_000007.wav");
  REQUIRE(core::line_file_name(123456) == "line_123456.wav");
  REQUIRE(core::line_file_name(42, ".flac") == "line_000042.flac");
}

TEST_CASE("sanitize_filename_strips_problem_characters") {
  REQUIRE(core::sanitize_filename("Chapter 2 Dont Get Carried Away, Said God") ==
          "Chapter 2 Dont Get Carried Away Said God");
  REQUIRE(core::sanitize_filename("Chapter 1: The Beginning!") ==
          "Chapter 1 The Beginning");
  REQUIRE(core::sanitize_filename("Part 3 - What's Next?") == "Part 3 - Whats Next");
  REQUIRE(core::sanitize_filename("Section A (Important Notes)") ==
          "Section A Important Notes");
  REQUIRE(core::sanitize_filename("Chapter 5: Money & Power") ==
          "Chapter 5 Money and Power");
  REQUIRE(core::sanitize_filename("Epilogue: The End... Or Is It?") ==
          "Epilogue The End Or Is It");
  REQUIRE(core::sanitize_filename("Chapter 10 - 50% Done!") == "Chapter 10 - 50 Done");
  REQUIRE(core::sanitize_filename("  a/b  ") == "a b");
}

TEST_CASE("chapter_file_name_appends_extension_to_sanitized_title") {
  REQUIRE(core::chapter_file_name("Intro: Hello, World! #1") == "Intro Hello World 1.wav");
}

TEST_CASE("with_extension_replaces_last_extension") {
  REQUIRE(core::with_extension("ch1.wav", "m4a") == "ch1.m4a");
  REQUIRE(core::with_extension("Chapter 1 The Beginning.wav", "mp3") ==
          "Chapter 1 The Beginning.mp3");
  REQUIRE(core::with_extension("noext", "m4a") == "noext.m4a");
}

TEST_CASE("glob_match_handles_transient_patterns") {
  REQUIRE(core::glob_match("*.temp.*", "ch1.temp.wav"));
  REQUIRE_FALSE(core::glob_match("*.temp.*", "ch1.wav"));
  REQUIRE(core::glob_match("chapter_list_*.txt", "chapter_list_book.txt"));
  REQUIRE_FALSE(core::glob_match("chapter_list_*.txt", "chapter_list_book.txt.bak"));
  REQUIRE(core::glob_match("*.concat_list.txt", "Part (1).concat_list.txt"));
  REQUIRE_FALSE(core::glob_match("*.concat_list.txt", "concat_listXtxt"));
}

TEST_CASE("glob_returns_sorted_regular_files_only") {
  ScratchDir dir;
  write_file(dir.path() / "b.temp.wav");
  write_file(dir.path() / "a.temp.wav");
  write_file(dir.path() / "keep.wav");
  std::filesystem::create_directories(dir.path() / "sub.temp.d");

  auto matches = core::glob(dir.path(), "*.temp.*");
  REQUIRE(matches.size() == 2);
  REQUIRE(matches[0].filename() == "a.temp.wav");
  REQUIRE(matches[1].filename() == "b.temp.wav");

  REQUIRE(core::glob(dir.path() / "missing", "*").empty());
}

TEST_CASE("write_text_atomic_replaces_file_without_leftovers") {
  ScratchDir dir;
  auto target = dir.path() / "state.json";
  core::write_text_atomic(target, "first");
  core::write_text_atomic(target, "second");

  REQUIRE(core::read_text(target) == "second");
  REQUIRE_FALSE(std::filesystem::exists(dir.path() / "state.json.tmp"));
}

TEST_CASE("is_nonempty_file_rejects_empty_and_missing") {
  ScratchDir dir;
  write_file(dir.path() / "full.wav", "x");
  write_file(dir.path() / "empty.wav", "");

  REQUIRE(core::is_nonempty_file(dir.path() / "full.wav"));
  REQUIRE_FALSE(core::is_nonempty_file(dir.path() / "empty.wav"));
  REQUIRE_FALSE(core::is_nonempty_file(dir.path() / "missing.wav"));
  REQUIRE_FALSE(core::is_nonempty_file(dir.path()));
}

TEST_CASE("shell_quote_escapes_single_quotes") {
  REQUIRE(core::shell_quote("plain") == "'plain'");
  REQUIRE(core::shell_quote("it's") == "'it'\\''s'");
}

TEST_CASE("sha256_file_matches_known_digest") {
  ScratchDir dir;
  write_file(dir.path() / "abc.txt", "abc");
  REQUIRE(core::sha256_file(dir.path() / "abc.txt") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("malformed_glob_raises_validation_error") {
  REQUIRE_FALSE(core::is_valid_glob("chapter_[1.txt"));
  REQUIRE(core::is_valid_glob("chapter_[12].txt"));
  REQUIRE_THROWS_AS(core::glob_match("chapter_[1.txt", "chapter_1.txt"),
                    audiobook_resume::ValidationError);

  ScratchDir dir;
  write_file(dir.path() / "chapter_1.txt");
  REQUIRE_THROWS_AS(core::glob(dir.path(), "chapter_[1.txt"), audiobook_resume::ValidationError);
}

TEST_CASE("plain_file_name_is_a_single_path_component") {
  REQUIRE(core::is_plain_file_name("Chapter 1.wav"));
  REQUIRE(core::is_plain_file_name("..hidden.wav"));
  REQUIRE_FALSE(core::is_plain_file_name(""));
  REQUIRE_FALSE(core::is_plain_file_name("."));
  REQUIRE_FALSE(core::is_plain_file_name(".."));
  REQUIRE_FALSE(core::is_plain_file_name("/abs.wav"));
  REQUIRE_FALSE(core::is_plain_file_name("../up.wav"));
  REQUIRE_FALSE(core::is_plain_file_name("a\\b.wav"));
}
