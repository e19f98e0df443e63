#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace audiobook_resume {

namespace fs = std::filesystem;

// Per-line entry of results_metadata
struct UnitMetadata {
    int index = 0;
    std::string line;
    bool is_chapter_heading = false;

    bool operator==(const UnitMetadata& o) const {
        return index == o.index && line == o.line &&
               is_chapter_heading == o.is_chapter_heading;
    }
    bool operator!=(const UnitMetadata& o) const { return !(*this == o); }
};

using ChapterLineMap = std::map<std::string, std::vector<int>>;

// Persisted snapshot written at the end of line generation.
struct Checkpoint {
    ChapterLineMap chapter_line_map;        // chapter file -> line indices (playback order)
    std::vector<std::string> chapter_files; // assembly order
    int total_lines = 0;
    std::vector<UnitMetadata> results_metadata;

    bool operator==(const Checkpoint& o) const {
        return chapter_line_map == o.chapter_line_map &&
               chapter_files == o.chapter_files &&
               total_lines == o.total_lines &&
               results_metadata == o.results_metadata;
    }
    bool operator!=(const Checkpoint& o) const { return !(*this == o); }
};

// Reconstructed in-memory state for one resume attempt
struct PipelineState {
    std::vector<std::string> chapter_files;
    ChapterLineMap chapter_line_map;
};

// Pipeline phase enumeration
enum class Phase {
    ASSEMBLING = 0,
    POST_PROCESSING = 1,
    CONVERTING = 2,
    FINAL_MERGING = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::ASSEMBLING: return "ASSEMBLING";
        case Phase::POST_PROCESSING: return "POST_PROCESSING";
        case Phase::CONVERTING: return "CONVERTING";
        case Phase::FINAL_MERGING: return "FINAL_MERGING";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

enum class ProgressKind {
    PHASE_START,
    STEP_DONE,
    PHASE_END,
    PIPELINE_DONE
};

inline std::string progress_kind_to_string(ProgressKind kind) {
    switch (kind) {
        case ProgressKind::PHASE_START: return "phase_start";
        case ProgressKind::STEP_DONE: return "step_done";
        case ProgressKind::PHASE_END: return "phase_end";
        case ProgressKind::PIPELINE_DONE: return "pipeline_done";
        default: return "unknown";
    }
}

struct ProgressEvent {
    ProgressKind kind = ProgressKind::STEP_DONE;
    Phase phase = Phase::ASSEMBLING;
    std::string item;   // chapter file or produced file name
    int current = 0;    // 1-based step within the phase
    int total = 0;
    std::string message;

    bool operator==(const ProgressEvent& o) const {
        return kind == o.kind && phase == o.phase && item == o.item &&
               current == o.current && total == o.total && message == o.message;
    }
    bool operator!=(const ProgressEvent& o) const { return !(*this == o); }
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

} // namespace audiobook_resume
