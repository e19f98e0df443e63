#pragma once

#include "audiobook_resume/core/types.hpp"
#include "audiobook_resume/media/media_operations.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace audiobook_resume::pipeline {

namespace fs = std::filesystem;

struct PipelineOptions {
    int silence_ms = 1000;
    std::string output_format = "m4a";
    bool final_merge = false;
    fs::path book_path;
    std::string narrator_voice = "male";
};

struct PipelineResult {
    std::vector<std::string> converted_files; // chapter order
    std::optional<fs::path> final_artifact;
};

/**
 * Drives ASSEMBLING -> POST_PROCESSING -> CONVERTING -> [FINAL_MERGING] -> DONE.
 *
 * Chapters are processed sequentially, so progress events arrive in a fixed
 * order. FINAL_MERGING is skipped when there are no chapters. Any media
 * failure aborts the run with MediaOperationError; nothing is retried.
 */
class PhasePipeline {
public:
    PhasePipeline(media::MediaOperations& ops, PipelineOptions options);

    PipelineResult run(const PipelineState& state, const fs::path& line_dir,
                       const fs::path& working_dir, const ProgressSink& sink);

    // Phase currently executing, or the last one reached.
    Phase phase() const { return phase_; }

private:
    template <typename Fn>
    void run_step(const std::string& item, Fn&& fn);

    void notify(const ProgressSink& sink, ProgressKind kind, const std::string& item,
                int current, int total, const std::string& message) const;

    media::MediaOperations& ops_;
    PipelineOptions options_;
    Phase phase_ = Phase::ASSEMBLING;
};

} // namespace audiobook_resume::pipeline
