#include "audiobook_resume/recovery/recovery_entry.hpp"

#include "audiobook_resume/core/errors.hpp"

#include <iostream>

namespace audiobook_resume::recovery {

ResumeController make_resume_controller(const config::Config& cfg) {
    return ResumeController(cfg.paths.checkpoint_file, cfg.paths.line_extension,
                            StaleOutputCleaner(cfg.cleanup.patterns));
}

static pipeline::PipelineResult assemble_from(const ResumeController& controller,
                                              const Checkpoint& cp,
                                              const RecoveryRequest& request,
                                              const fs::path& line_dir,
                                              media::MediaOperations& ops,
                                              const ProgressSink& sink) {
    PipelineState state = controller.reconstruct(cp, request.working_dir, request.resume);
    pipeline::PhasePipeline pipe(ops, request.pipeline);
    return pipe.run(state, line_dir, request.working_dir, sink);
}

RecoveryOutcome run_with_recovery(const config::Config& cfg, const RecoveryRequest& request,
                                  media::MediaOperations& ops, GenerationPhase* generator,
                                  const ProgressSink& sink) {
    ResumeController controller = make_resume_controller(cfg);
    const fs::path line_dir = request.working_dir / cfg.paths.line_segments_dir;

    RecoveryOutcome outcome;
    outcome.decision = controller.can_resume(request.working_dir, line_dir);

    if (outcome.decision.resumable) {
        std::cerr << "[RESUME] Recovery mode: found existing line segments, "
                  << "resuming from assembly phase" << std::endl;
        outcome.branch = RecoveryBranch::RESUMED;
        outcome.result = assemble_from(controller, *outcome.decision.checkpoint, request,
                                       line_dir, ops, sink);
        return outcome;
    }

    if (!generator) {
        outcome.branch = RecoveryBranch::REFUSED;
        return outcome;
    }

    std::cerr << "[RESUME] Cannot resume (" << outcome.decision.reason
              << "), running full generation" << std::endl;
    checkpoint::CheckpointStore store(request.working_dir, cfg.paths.checkpoint_file);
    generator->run(request.working_dir, line_dir, store, sink);

    ResumeDecision after = controller.can_resume(request.working_dir, line_dir);
    if (!after.resumable) {
        throw PipelineError("generation finished but its output cannot be assembled: " +
                            after.reason);
    }

    outcome.branch = RecoveryBranch::GENERATED;
    outcome.decision = std::move(after);
    outcome.result = assemble_from(controller, *outcome.decision.checkpoint, request,
                                   line_dir, ops, sink);
    return outcome;
}

} // namespace audiobook_resume::recovery
