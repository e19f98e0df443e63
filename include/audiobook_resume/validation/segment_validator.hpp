#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace audiobook_resume::validation {

namespace fs = std::filesystem;

struct SegmentValidation {
    bool all_present = false;
    std::vector<int> missing_indices; // ascending
};

/**
 * Check that line_{i:06d}<ext> exists and is non-empty for every i in
 * [0, expected_count). A missing directory reports every index.
 * Read-only.
 */
SegmentValidation validate_line_segments(int expected_count, const fs::path& line_dir,
                                         const std::string& ext = ".wav");

} // namespace audiobook_resume::validation
