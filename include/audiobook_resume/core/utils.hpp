#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace audiobook_resume::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void write_text_atomic(const fs::path& path, const std::string& text);
bool is_nonempty_file(const fs::path& path);

// Line segment naming: line_{index:06d}<ext>
std::string line_file_name(int index, const std::string& ext = ".wav");
fs::path line_file_path(const fs::path& line_dir, int index, const std::string& ext = ".wav");

// Chapter naming
std::string sanitize_filename(const std::string& text);
std::string chapter_file_name(const std::string& title, const std::string& ext = ".wav");
std::string with_extension(const std::string& file_name, const std::string& format);
// Single path component: non-empty, not "." or "..", no separators
bool is_plain_file_name(const std::string& name);

// Hash utilities
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string shell_quote(const std::string& s);

// Glob pattern matching. Malformed patterns raise ValidationError;
// glob() stops quietly at an unreadable directory entry.
bool is_valid_glob(const std::string& pattern);
bool glob_match(const std::string& pattern, const std::string& str);
std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern);

} // namespace audiobook_resume::core
