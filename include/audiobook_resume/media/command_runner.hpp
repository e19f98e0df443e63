#pragma once

#include <string>

namespace audiobook_resume::media {

struct CommandResult {
    int exit_code = 0;
    std::string output; // combined stdout/stderr
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::string& command) = 0;
};

// Runs commands through /bin/sh via popen().
class ShellCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::string& command) override;
};

// Last max_lines lines of a tool's output, for error messages.
std::string output_tail(const std::string& output, size_t max_lines = 20);

} // namespace audiobook_resume::media
