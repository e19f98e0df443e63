#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace audiobook_resume::recovery {

namespace fs = std::filesystem;

struct CleanupFailure {
    fs::path path;
    std::string error;
};

struct CleanupReport {
    std::vector<fs::path> removed;
    std::vector<CleanupFailure> failures;
};

/**
 * Removes partially written chapter files and transient artifacts from a
 * working directory. Best effort: failures are logged and reported, never
 * thrown. Running it again on the result is a no-op.
 */
class StaleOutputCleaner {
public:
    explicit StaleOutputCleaner(std::vector<std::string> transient_patterns);

    CleanupReport clean(const fs::path& working_dir,
                        const std::vector<std::string>& chapter_files) const;

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    void remove_one(const fs::path& p, const char* what, CleanupReport& report) const;

    std::vector<std::string> patterns_;
};

std::vector<std::string> default_transient_patterns();

} // namespace audiobook_resume::recovery
