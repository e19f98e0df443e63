#include "runner_shared.hpp"

#include "audiobook_resume/core/utils.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace audiobook_resume::runner {

namespace fs = std::filesystem;
namespace core = audiobook_resume::core;

std::string format_bytes(uint64_t bytes) {
  static const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  constexpr size_t kUnitCount = sizeof(kUnits) / sizeof(kUnits[0]);
  if (bytes < 1024)
    return std::to_string(bytes) + " B";

  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < kUnitCount) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value << " " << kUnits[unit];
  return oss.str();
}

uint64_t estimate_total_file_bytes(const std::vector<fs::path> &paths) {
  uint64_t total = 0;
  for (const auto &p : paths) {
    std::error_code ec;
    const auto sz = fs::file_size(p, ec);
    if (ec) {
      continue;
    }
    if (total <= std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(sz)) {
      total += static_cast<uint64_t>(sz);
    } else {
      total = std::numeric_limits<uint64_t>::max();
      break;
    }
  }
  return total;
}

bool message_indicates_disk_full(const std::string &message) {
  static const char *kMarkers[] = {"no space left on device", "disk full",
                                   "not enough space", "enospc",
                                   "disk quota exceeded"};
  const std::string m = core::to_lower(message);
  for (const char *marker : kMarkers) {
    if (m.find(marker) != std::string::npos)
      return true;
  }
  return false;
}

std::vector<std::string> failure_guidance(const std::string &message,
                                          const fs::path &work_dir) {
  std::vector<std::string> tips;
  const std::string disk_tip = "Ensure " + work_dir.string() +
                               " has sufficient free disk space";
  if (message_indicates_disk_full(message)) {
    tips.push_back(disk_tip + " (the failure reports a full disk)");
  }
  tips.push_back("Check that FFmpeg is properly installed and on PATH");
  if (!message_indicates_disk_full(message)) {
    tips.push_back(disk_tip);
  }
  tips.push_back("Try running again with --force-cleanup to remove partial files");
  tips.push_back("Check file permissions in " + work_dir.string());
  return tips;
}

config::Config load_run_config(const fs::path &work_dir,
                               const std::string &config_path) {
  if (!config_path.empty())
    return config::Config::load(config_path);
  if (fs::exists(work_dir / "resume.yaml"))
    return config::Config::load(work_dir / "resume.yaml");
  return config::Config{};
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace audiobook_resume::runner
