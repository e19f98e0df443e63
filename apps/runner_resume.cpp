#include "runner_resume.hpp"

#include "audiobook_resume/checkpoint/checkpoint_store.hpp"
#include "audiobook_resume/config/configuration.hpp"
#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/core/events.hpp"
#include "audiobook_resume/core/utils.hpp"
#include "audiobook_resume/media/ffmpeg_media_operations.hpp"
#include "audiobook_resume/recovery/recovery_entry.hpp"

#include "runner_shared.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

int resume_command(const ResumeCommandArgs &args) {
  using namespace audiobook_resume;

  namespace core = audiobook_resume::core;
  namespace recovery = audiobook_resume::recovery;
  namespace media = audiobook_resume::media;

  fs::path work_dir(args.work_dir);
  if (!fs::exists(work_dir) || !fs::is_directory(work_dir)) {
    std::cerr << "Error: working directory not found: " << args.work_dir
              << std::endl;
    return 1;
  }

  if (args.narrator_gender != "male" && args.narrator_gender != "female") {
    std::cerr << "Error: --narrator-gender must be 'male' or 'female'"
              << std::endl;
    return 1;
  }
  if (args.generate_m4b && args.book_path.empty()) {
    std::cerr << "Error: --book-path is required when using --generate-m4b"
              << std::endl;
    return 1;
  }

  config::Config cfg;
  try {
    cfg = runner::load_run_config(work_dir, args.config_path);
    if (!args.output_format.empty())
      cfg.assembly.output_format = core::to_lower(args.output_format);
    cfg.validate();
  } catch (const AudiobookResumeError &e) {
    std::cerr << "Error: failed to load/validate config: " << e.what()
              << std::endl;
    return 1;
  }

  std::string run_id = core::get_run_id();
  fs::path logs_dir = work_dir / cfg.paths.logs_dir;
  std::error_code ec;
  fs::create_directories(logs_dir, ec);
  if (ec) {
    std::cerr << "Warning: cannot create " << logs_dir.string() << ": "
              << ec.message() << std::endl;
  }

  std::ofstream event_log_file(logs_dir / "resume_events.jsonl",
                               std::ios::out | std::ios::app);
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.is_open()
                                                ? event_log_file.rdbuf()
                                                : nullptr);
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  core::json start_info = {{"work_dir", work_dir.string()},
                           {"output_format", cfg.assembly.output_format},
                           {"narrator_gender", args.narrator_gender},
                           {"generate_m4b", args.generate_m4b},
                           {"add_emotion_tags", args.add_emotion_tags},
                           {"force_cleanup", args.force_cleanup}};

  checkpoint::CheckpointStore store(work_dir, cfg.paths.checkpoint_file);
  if (store.exists()) {
    try {
      start_info["checkpoint_sha256"] = core::sha256_file(store.path());
    } catch (const IOError &e) {
      emitter.warning(run_id, e.what(), log_file);
    }
  }
  emitter.run_start(run_id, start_info, log_file);

  std::cerr << "[RESUME] Checking for existing line segments and recovery data..."
            << std::endl;

  recovery::RecoveryRequest request;
  request.working_dir = work_dir;
  request.resume.force_cleanup = args.force_cleanup;
  request.resume.output_format = cfg.assembly.output_format;
  request.pipeline.silence_ms = cfg.assembly.silence_ms;
  request.pipeline.output_format = cfg.assembly.output_format;
  request.pipeline.final_merge = args.generate_m4b;
  request.pipeline.book_path = args.book_path;
  request.pipeline.narrator_voice = args.narrator_gender;

  media::ShellCommandRunner command_runner;
  media::FfmpegMediaOperations ops(cfg.media, cfg.paths.line_extension,
                                   cfg.paths.output_dir, command_runner);

  auto sink = [&](const ProgressEvent &ev) {
    emitter.progress(run_id, ev, log_file);
    if (ev.kind != ProgressKind::PHASE_START)
      std::cerr << "[" << phase_to_string(ev.phase) << "] " << ev.message
                << std::endl;
  };

  recovery::RecoveryOutcome outcome;
  try {
    outcome = recovery::run_with_recovery(cfg, request, ops, nullptr, sink);
  } catch (const MediaOperationError &e) {
    std::cerr << "Error: assembly failed: " << e.what() << std::endl;
    std::cerr << "Troubleshooting tips:" << std::endl;
    for (const auto &tip : runner::failure_guidance(e.what(), work_dir))
      std::cerr << "  - " << tip << std::endl;
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false,
                    runner::message_indicates_disk_full(e.what())
                        ? "insufficient_disk_space"
                        : "media_operation_failed",
                    {{"phase_name", e.phase_name()}, {"chapter", e.group_id()}},
                    log_file);
    return 1;
  } catch (const AudiobookResumeError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", core::json::object(), log_file);
    return 1;
  }

  if (outcome.branch == recovery::RecoveryBranch::REFUSED) {
    std::cerr << "Cannot resume: " << outcome.decision.reason << std::endl;
    std::cerr << "Run the full generation process first to create line segments"
              << std::endl;
    core::json extra = {{"reason", outcome.decision.reason}};
    if (!outcome.decision.missing_indices.empty())
      extra["missing_lines"] = outcome.decision.missing_indices.size();
    emitter.run_end(run_id, false,
                    recovery::resume_refusal_to_string(outcome.decision.refusal),
                    extra, log_file);
    return 1;
  }

  core::json end_info = {{"chapters", outcome.result->converted_files.size()},
                         {"converted_files", outcome.result->converted_files}};
  if (outcome.result->final_artifact) {
    std::error_code size_ec;
    auto size = fs::file_size(*outcome.result->final_artifact, size_ec);
    std::cerr << "Final audiobook: " << outcome.result->final_artifact->string();
    if (!size_ec)
      std::cerr << " (" << runner::format_bytes(size) << ")";
    std::cerr << std::endl;
    end_info["final_artifact"] = outcome.result->final_artifact->string();
  }
  emitter.run_end(run_id, true, "ok", end_info, log_file);
  return 0;
}
