#include "audiobook_resume/validation/segment_validator.hpp"

#include "audiobook_resume/core/utils.hpp"

namespace audiobook_resume::validation {

namespace core = audiobook_resume::core;

SegmentValidation validate_line_segments(int expected_count, const fs::path& line_dir,
                                         const std::string& ext) {
    SegmentValidation result;
    if (expected_count < 0) {
        expected_count = 0;
    }

    std::error_code ec;
    if (!fs::is_directory(line_dir, ec)) {
        result.missing_indices.reserve(static_cast<size_t>(expected_count));
        for (int i = 0; i < expected_count; ++i) {
            result.missing_indices.push_back(i);
        }
        result.all_present = result.missing_indices.empty();
        return result;
    }

    for (int i = 0; i < expected_count; ++i) {
        if (!core::is_nonempty_file(core::line_file_path(line_dir, i, ext))) {
            result.missing_indices.push_back(i);
        }
    }

    result.all_present = result.missing_indices.empty();
    return result;
}

} // namespace audiobook_resume::validation
