#include "audiobook_resume/pipeline/phase_pipeline.hpp"

#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/core/utils.hpp"

namespace audiobook_resume::pipeline {

namespace core = audiobook_resume::core;

PhasePipeline::PhasePipeline(media::MediaOperations& ops, PipelineOptions options)
    : ops_(ops), options_(std::move(options)) {}

void PhasePipeline::notify(const ProgressSink& sink, ProgressKind kind,
                           const std::string& item, int current, int total,
                           const std::string& message) const {
    if (!sink) {
        return;
    }
    ProgressEvent ev;
    ev.kind = kind;
    ev.phase = phase_;
    ev.item = item;
    ev.current = current;
    ev.total = total;
    ev.message = message;
    sink(ev);
}

template <typename Fn>
void PhasePipeline::run_step(const std::string& item, Fn&& fn) {
    try {
        fn();
    } catch (const MediaOperationError&) {
        throw;
    } catch (const std::exception& e) {
        throw MediaOperationError(phase_to_string(phase_), item, e.what());
    }
}

PipelineResult PhasePipeline::run(const PipelineState& state, const fs::path& line_dir,
                                  const fs::path& working_dir, const ProgressSink& sink) {
    for (const auto& ch : state.chapter_files) {
        if (state.chapter_line_map.find(ch) == state.chapter_line_map.end()) {
            throw ValidationError("chapter '" + ch + "' has no line mapping");
        }
    }
    if (options_.final_merge && options_.book_path.empty()) {
        throw ValidationError("final merge requested without a source book path");
    }

    PipelineResult result;
    const int total = static_cast<int>(state.chapter_files.size());

    phase_ = Phase::ASSEMBLING;
    notify(sink, ProgressKind::PHASE_START, "", 0, total, "Assembling chapters");
    for (int i = 0; i < total; ++i) {
        const std::string& ch = state.chapter_files[static_cast<size_t>(i)];
        run_step(ch, [&] {
            ops_.assemble(ch, state.chapter_line_map.at(ch), line_dir, working_dir);
        });
        notify(sink, ProgressKind::STEP_DONE, ch, i + 1, total, "Assembled chapter: " + ch);
    }
    notify(sink, ProgressKind::PHASE_END, "", total, total, "Completed assembling all chapters");

    phase_ = Phase::POST_PROCESSING;
    notify(sink, ProgressKind::PHASE_START, "", 0, total, "Adding silence to chapters");
    for (int i = 0; i < total; ++i) {
        const std::string& ch = state.chapter_files[static_cast<size_t>(i)];
        run_step(ch, [&] { ops_.add_silence(working_dir / ch, options_.silence_ms); });
        notify(sink, ProgressKind::STEP_DONE, ch, i + 1, total, "Added silence to chapter: " + ch);
    }
    notify(sink, ProgressKind::PHASE_END, "", total, total, "Completed adding silence");

    phase_ = Phase::CONVERTING;
    notify(sink, ProgressKind::PHASE_START, "", 0, total,
           "Converting chapters to " + options_.output_format);
    for (int i = 0; i < total; ++i) {
        const std::string& ch = state.chapter_files[static_cast<size_t>(i)];
        const std::string converted = core::with_extension(ch, options_.output_format);
        run_step(ch, [&] { ops_.convert(working_dir / ch, working_dir / converted); });
        result.converted_files.push_back(converted);
        notify(sink, ProgressKind::STEP_DONE, converted, i + 1, total,
               "Converted to " + options_.output_format + ": " + converted);
    }
    notify(sink, ProgressKind::PHASE_END, "", total, total, "Completed post-processing all chapters");

    // Nothing to merge for a book without chapters
    if (options_.final_merge && !result.converted_files.empty()) {
        phase_ = Phase::FINAL_MERGING;
        notify(sink, ProgressKind::PHASE_START, "", 0, 1, "Generating final audiobook file");
        fs::path out;
        run_step("", [&] {
            out = ops_.merge_final(result.converted_files, working_dir, options_.book_path,
                                   options_.narrator_voice);
        });
        result.final_artifact = out;
        notify(sink, ProgressKind::STEP_DONE, out.filename().string(), 1, 1,
               "Final audiobook generated: " + out.string());
        notify(sink, ProgressKind::PHASE_END, "", 1, 1, "Completed final merge");
    }

    phase_ = Phase::DONE;
    notify(sink, ProgressKind::PIPELINE_DONE, "", total, total,
           "Audiobook assembly completed successfully");
    return result;
}

} // namespace audiobook_resume::pipeline
