#pragma once

#include "audiobook_resume/config/configuration.hpp"

#include <cstdint>
#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace audiobook_resume::runner {

std::string format_bytes(uint64_t bytes);

uint64_t estimate_total_file_bytes(const std::vector<std::filesystem::path> &paths);

bool message_indicates_disk_full(const std::string &message);

// Troubleshooting hints printed after an aborted assembly run.
std::vector<std::string> failure_guidance(const std::string &message,
                                          const std::filesystem::path &work_dir);

// --config path if given, else <work_dir>/resume.yaml if present, else defaults.
config::Config load_run_config(const std::filesystem::path &work_dir,
                               const std::string &config_path);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace audiobook_resume::runner
