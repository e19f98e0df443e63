#pragma once

#include "audiobook_resume/checkpoint/checkpoint_store.hpp"
#include "audiobook_resume/config/configuration.hpp"
#include "audiobook_resume/core/types.hpp"
#include "audiobook_resume/media/media_operations.hpp"
#include "audiobook_resume/pipeline/phase_pipeline.hpp"
#include "audiobook_resume/recovery/resume_controller.hpp"

#include <filesystem>
#include <optional>

namespace audiobook_resume::recovery {

namespace fs = std::filesystem;

/**
 * Full line generation (text-to-speech). Implementations write every line
 * segment into line_dir and finish by writing the checkpoint through store.
 */
class GenerationPhase {
public:
    virtual ~GenerationPhase() = default;
    virtual void run(const fs::path& working_dir, const fs::path& line_dir,
                     const checkpoint::CheckpointStore& store, const ProgressSink& sink) = 0;
};

enum class RecoveryBranch {
    RESUMED,    // continued from an existing checkpoint
    GENERATED,  // ran full generation, then assembly
    REFUSED     // cannot resume and no generator available
};

struct RecoveryRequest {
    fs::path working_dir;
    ResumeOptions resume;
    pipeline::PipelineOptions pipeline;
};

struct RecoveryOutcome {
    RecoveryBranch branch = RecoveryBranch::REFUSED;
    ResumeDecision decision;
    std::optional<pipeline::PipelineResult> result;
};

ResumeController make_resume_controller(const config::Config& cfg);

/**
 * Asks the resume controller first, then either resumes from the checkpoint
 * or runs generator (when given) followed by the assembly phases.
 * Media failures propagate as MediaOperationError.
 */
RecoveryOutcome run_with_recovery(const config::Config& cfg, const RecoveryRequest& request,
                                  media::MediaOperations& ops, GenerationPhase* generator,
                                  const ProgressSink& sink);

} // namespace audiobook_resume::recovery
