#pragma once

#include "audiobook_resume/checkpoint/checkpoint_store.hpp"
#include "audiobook_resume/core/types.hpp"
#include "audiobook_resume/recovery/stale_output_cleaner.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace audiobook_resume::recovery {

namespace fs = std::filesystem;

enum class ResumeRefusal {
    NONE,
    NO_CHECKPOINT,
    CORRUPT_CHECKPOINT,
    INCOMPLETE_UNITS
};

inline std::string resume_refusal_to_string(ResumeRefusal r) {
    switch (r) {
        case ResumeRefusal::NONE: return "none";
        case ResumeRefusal::NO_CHECKPOINT: return "no_checkpoint";
        case ResumeRefusal::CORRUPT_CHECKPOINT: return "corrupt_checkpoint";
        case ResumeRefusal::INCOMPLETE_UNITS: return "incomplete_units";
        default: return "unknown";
    }
}

struct ResumeDecision {
    bool resumable = false;
    std::optional<Checkpoint> checkpoint; // set only when resumable
    ResumeRefusal refusal = ResumeRefusal::NO_CHECKPOINT;
    std::string reason;
    std::vector<int> missing_indices;
};

struct ResumeOptions {
    // Also drop converted chapter outputs (<stem>.<format>) from earlier attempts
    bool force_cleanup = false;
    std::string output_format = "m4a";
};

/**
 * Decides whether a run can continue from the assembly phase and rebuilds
 * the chapter state from the checkpoint.
 */
class ResumeController {
public:
    ResumeController(std::string checkpoint_file, std::string line_extension,
                     StaleOutputCleaner cleaner);

    // Idempotent query; never touches the filesystem beyond reads.
    ResumeDecision can_resume(const fs::path& working_dir, const fs::path& line_dir) const;

    // Projection of the checkpoint; cleans stale chapter output in working_dir first.
    PipelineState reconstruct(const Checkpoint& cp, const fs::path& working_dir,
                              const ResumeOptions& options = {}) const;

    const StaleOutputCleaner& cleaner() const { return cleaner_; }

private:
    std::string checkpoint_file_;
    std::string line_extension_;
    StaleOutputCleaner cleaner_;
};

} // namespace audiobook_resume::recovery
