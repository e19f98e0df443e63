#include "runner_resume.hpp"

#include "audiobook_resume/checkpoint/checkpoint_store.hpp"
#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/core/events.hpp"
#include "audiobook_resume/core/utils.hpp"
#include "audiobook_resume/recovery/recovery_entry.hpp"

#include "runner_shared.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int status_command(const std::string &work_dir_path,
                   const std::string &config_path) {
  using namespace audiobook_resume;

  namespace core = audiobook_resume::core;
  namespace recovery = audiobook_resume::recovery;

  fs::path work_dir(work_dir_path);

  config::Config cfg;
  try {
    cfg = runner::load_run_config(work_dir, config_path);
    cfg.validate();
  } catch (const AudiobookResumeError &e) {
    std::cerr << "Error: failed to load/validate config: " << e.what()
              << std::endl;
    return 1;
  }

  const std::string run_id = "status";
  core::EventEmitter emitter;
  core::json status = {{"work_dir", work_dir.string()}};

  std::cerr << "Recovery status check" << std::endl;
  std::cerr << std::string(50, '=') << std::endl;

  fs::path line_dir = work_dir / cfg.paths.line_segments_dir;
  if (!fs::is_directory(line_dir)) {
    std::cerr << "Line segments directory not found: " << line_dir.string()
              << std::endl;
    status["resumable"] = false;
    status["reason"] = "no_line_segments_dir";
    emitter.emit("status", run_id, status, std::cout);
    return 1;
  }

  auto line_files = core::glob(line_dir, "line_*" + cfg.paths.line_extension);
  uint64_t line_bytes = runner::estimate_total_file_bytes(line_files);
  std::cerr << "Line segments directory: " << line_dir.string() << std::endl;
  std::cerr << "Line segments found: " << line_files.size() << " ("
            << runner::format_bytes(line_bytes) << ")" << std::endl;
  status["line_segments"] = line_files.size();
  status["line_segments_bytes"] = line_bytes;

  checkpoint::CheckpointStore store(work_dir, cfg.paths.checkpoint_file);
  if (store.exists()) {
    std::cerr << "Recovery checkpoint found: " << store.path().string()
              << std::endl;
    try {
      Checkpoint cp = store.read_strict();
      std::cerr << "Total lines in checkpoint: " << cp.total_lines << std::endl;
      std::cerr << "Chapters in checkpoint: " << cp.chapter_files.size()
                << std::endl;
      status["checkpoint"] = {{"total_lines", cp.total_lines},
                              {"chapters", cp.chapter_files.size()}};
    } catch (const AudiobookResumeError &e) {
      std::cerr << "Could not read checkpoint details: " << e.what()
                << std::endl;
      status["checkpoint_error"] = e.what();
    }
  } else {
    std::cerr << "Recovery checkpoint not found: " << store.path().string()
              << std::endl;
  }

  std::vector<std::string> chapters;
  for (const auto &p : core::glob(work_dir, "*" + cfg.paths.line_extension)) {
    std::string name = p.filename().string();
    if (!core::starts_with(name, "line_"))
      chapters.push_back(name);
  }
  if (chapters.empty()) {
    std::cerr << "No existing chapter files found" << std::endl;
  } else {
    std::cerr << "Existing chapter files: " << chapters.size() << std::endl;
    for (size_t i = 0; i < chapters.size() && i < 5; ++i)
      std::cerr << "   " << chapters[i] << std::endl;
    if (chapters.size() > 5)
      std::cerr << "   ... and " << (chapters.size() - 5) << " more"
                << std::endl;
  }
  status["existing_chapter_files"] = chapters;

  auto controller = recovery::make_resume_controller(cfg);
  auto decision = controller.can_resume(work_dir, line_dir);
  status["resumable"] = decision.resumable;
  status["reason"] = decision.resumable
                         ? std::string("ok")
                         : recovery::resume_refusal_to_string(decision.refusal);
  if (!decision.missing_indices.empty())
    status["missing_lines"] = decision.missing_indices.size();

  if (decision.resumable) {
    std::cerr << "\nYou can retry assembly with:" << std::endl;
    std::cerr << "   audiobook_resume resume --work-dir " << work_dir.string()
              << std::endl;
    std::cerr << "   audiobook_resume resume --work-dir " << work_dir.string()
              << " --force-cleanup" << std::endl;
    std::cerr << "   audiobook_resume resume --work-dir " << work_dir.string()
              << " --generate-m4b --book-path <path/to/book.epub>" << std::endl;
  } else {
    std::cerr << "\nCannot resume: " << decision.reason << std::endl;
  }

  emitter.emit("status", run_id, status, std::cout);
  return decision.resumable ? 0 : 1;
}
