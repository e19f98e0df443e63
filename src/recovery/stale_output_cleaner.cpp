#include "audiobook_resume/recovery/stale_output_cleaner.hpp"

#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/core/utils.hpp"

#include <iostream>

namespace audiobook_resume::recovery {

namespace core = audiobook_resume::core;

std::vector<std::string> default_transient_patterns() {
    return {"chapter_list_*.txt", "*.temp.*", "*.concat_list.txt"};
}

StaleOutputCleaner::StaleOutputCleaner(std::vector<std::string> transient_patterns)
    : patterns_(std::move(transient_patterns)) {}

void StaleOutputCleaner::remove_one(const fs::path& p, const char* what,
                                    CleanupReport& report) const {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        std::cerr << "[CLEANUP] Warning: could not remove " << p.filename().string()
                  << ": " << ec.message() << std::endl;
        report.failures.push_back({p, ec.message()});
        return;
    }
    std::cerr << "[CLEANUP] Removed " << what << ": " << p.filename().string() << std::endl;
    report.removed.push_back(p);
}

CleanupReport StaleOutputCleaner::clean(const fs::path& working_dir,
                                        const std::vector<std::string>& chapter_files) const {
    CleanupReport report;

    for (const auto& ch : chapter_files) {
        if (!core::is_plain_file_name(ch)) {
            std::cerr << "[CLEANUP] Warning: refusing to remove '" << ch
                      << "' outside the working directory" << std::endl;
            report.failures.push_back({fs::path(ch), "not a plain file name"});
            continue;
        }
        fs::path p = working_dir / ch;
        std::error_code ec;
        if (fs::exists(p, ec)) {
            remove_one(p, "partial chapter file", report);
        }
    }

    for (const auto& pattern : patterns_) {
        std::vector<fs::path> matches;
        try {
            matches = core::glob(working_dir, pattern);
        } catch (const ValidationError& e) {
            std::cerr << "[CLEANUP] Warning: skipping pattern: " << e.what() << std::endl;
            report.failures.push_back({working_dir / pattern, e.what()});
            continue;
        }
        for (const auto& p : matches) {
            remove_one(p, "temp file", report);
        }
    }

    return report;
}

} // namespace audiobook_resume::recovery
