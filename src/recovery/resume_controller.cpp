#include "audiobook_resume/recovery/resume_controller.hpp"

#include "audiobook_resume/core/utils.hpp"
#include "audiobook_resume/validation/segment_validator.hpp"

#include <iostream>

namespace audiobook_resume::recovery {

namespace core = audiobook_resume::core;

ResumeController::ResumeController(std::string checkpoint_file, std::string line_extension,
                                   StaleOutputCleaner cleaner)
    : checkpoint_file_(std::move(checkpoint_file)),
      line_extension_(std::move(line_extension)),
      cleaner_(std::move(cleaner)) {}

ResumeDecision ResumeController::can_resume(const fs::path& working_dir,
                                            const fs::path& line_dir) const {
    ResumeDecision decision;

    checkpoint::CheckpointStore store(working_dir, checkpoint_file_);
    auto cp = store.read();
    if (!cp) {
        if (store.exists()) {
            decision.refusal = ResumeRefusal::CORRUPT_CHECKPOINT;
            decision.reason = "recovery checkpoint " + store.path().string() +
                              " is unreadable or inconsistent";
        } else {
            decision.refusal = ResumeRefusal::NO_CHECKPOINT;
            decision.reason = "no recovery checkpoint found at " + store.path().string();
        }
        return decision;
    }

    auto validation = validation::validate_line_segments(cp->total_lines, line_dir,
                                                         line_extension_);
    if (!validation.all_present) {
        decision.refusal = ResumeRefusal::INCOMPLETE_UNITS;
        decision.missing_indices = std::move(validation.missing_indices);
        decision.reason = "missing " + std::to_string(decision.missing_indices.size()) +
                          " line segments out of " + std::to_string(cp->total_lines);
        std::cerr << "[RESUME] Cannot resume: " << decision.reason << std::endl;
        return decision;
    }

    std::cerr << "[RESUME] All " << cp->total_lines
              << " line segments found. Can resume from assembly phase." << std::endl;
    decision.resumable = true;
    decision.refusal = ResumeRefusal::NONE;
    decision.checkpoint = std::move(cp);
    return decision;
}

PipelineState ResumeController::reconstruct(const Checkpoint& cp, const fs::path& working_dir,
                                            const ResumeOptions& options) const {
    PipelineState state;
    state.chapter_files = cp.chapter_files;
    state.chapter_line_map = cp.chapter_line_map;

    std::vector<std::string> stale = state.chapter_files;
    if (options.force_cleanup) {
        for (const auto& ch : state.chapter_files) {
            std::string converted = core::with_extension(ch, options.output_format);
            if (converted != ch) {
                stale.push_back(converted);
            }
        }
    }

    CleanupReport report = cleaner_.clean(working_dir, stale);
    if (!report.failures.empty()) {
        std::cerr << "[RESUME] Warning: " << report.failures.size()
                  << " stale file(s) could not be removed" << std::endl;
    }

    std::cerr << "[RESUME] Resuming from assembly phase with "
              << state.chapter_files.size() << " chapters" << std::endl;
    return state;
}

} // namespace audiobook_resume::recovery
