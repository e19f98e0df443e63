#include "audiobook_resume/media/command_runner.hpp"

#include "audiobook_resume/core/errors.hpp"

#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace audiobook_resume::media {

CommandResult ShellCommandRunner::run(const std::string& command) {
    std::string full = command + " 2>&1";
    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        throw CommandError(command, -1, "popen() failed");
    }

    CommandResult result;
    std::array<char, 4096> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

std::string output_tail(const std::string& output, size_t max_lines) {
    if (output.empty() || max_lines == 0) {
        return "";
    }
    size_t end = output.size();
    while (end > 0 && output[end - 1] == '\n') {
        --end;
    }
    size_t pos = end;
    size_t lines = 0;
    while (pos > 0) {
        if (output[pos - 1] == '\n' && ++lines == max_lines) {
            break;
        }
        --pos;
    }
    return output.substr(pos, end - pos);
}

} // namespace audiobook_resume::media
