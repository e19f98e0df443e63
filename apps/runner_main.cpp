#include "runner_resume.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  CLI::App app{"Audiobook assembly resume tool"};
  app.require_subcommand(1);

  ResumeCommandArgs args;
  auto resume_cmd = app.add_subcommand(
      "resume", "Retry chapter assembly and post-processing from existing line segments");
  resume_cmd->add_option("--work-dir,--temp-dir", args.work_dir,
                         "Temporary audio directory")
      ->default_val("temp_audio");
  resume_cmd->add_option("--config", args.config_path,
                         "Path to resume.yaml (default: <work-dir>/resume.yaml)");
  resume_cmd->add_option("--output-format", args.output_format,
                         "Chapter output format (m4a, mp3, ...)");
  resume_cmd->add_option("--narrator-gender", args.narrator_gender,
                         "Narrator gender")
      ->check(CLI::IsMember({"male", "female"}))
      ->default_val("male");
  resume_cmd->add_option("--book-path", args.book_path,
                         "Path to source book file (required for --generate-m4b)");
  resume_cmd->add_flag("--generate-m4b", args.generate_m4b,
                       "Merge converted chapters into a final M4B audiobook");
  resume_cmd->add_flag("--add-emotion-tags", args.add_emotion_tags,
                       "Include emotion tags in processing");
  resume_cmd->add_flag("--force-cleanup", args.force_cleanup,
                       "Also remove converted chapter files from earlier attempts");

  std::string status_work_dir = "temp_audio";
  std::string status_config;
  auto status_cmd =
      app.add_subcommand("status", "Report recovery state of a working directory");
  status_cmd->add_option("--work-dir,--temp-dir", status_work_dir,
                         "Temporary audio directory")
      ->default_val("temp_audio");
  status_cmd->add_option("--config", status_config, "Path to resume.yaml");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    // CLI11 reports --help as a ParseError with exit code 0
    int rc = app.exit(e);
    return rc == 0 ? 0 : 1;
  }

  if (resume_cmd->parsed()) {
    return resume_command(args);
  }
  if (status_cmd->parsed()) {
    return status_command(status_work_dir, status_config);
  }
  return 1;
}
