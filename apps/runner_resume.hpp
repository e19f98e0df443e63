#pragma once

#include <string>

struct ResumeCommandArgs {
  std::string work_dir = "temp_audio";
  std::string config_path;
  std::string output_format; // empty = config value
  std::string narrator_gender = "male";
  std::string book_path;
  bool generate_m4b = false;
  bool add_emotion_tags = false;
  bool force_cleanup = false;
};

int resume_command(const ResumeCommandArgs &args);

int status_command(const std::string &work_dir, const std::string &config_path);
