#pragma once

#include <stdexcept>
#include <string>

namespace audiobook_resume {

class AudiobookResumeError : public std::runtime_error {
public:
    explicit AudiobookResumeError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public AudiobookResumeError {
public:
    explicit ConfigError(const std::string& message)
        : AudiobookResumeError("Config error: " + message) {}
};

class ValidationError : public AudiobookResumeError {
public:
    explicit ValidationError(const std::string& message)
        : AudiobookResumeError("Validation error: " + message) {}
};

class IOError : public AudiobookResumeError {
public:
    explicit IOError(const std::string& message)
        : AudiobookResumeError("I/O error: " + message) {}
};

// Checkpoint file present but unreadable or inconsistent.
class CheckpointError : public AudiobookResumeError {
public:
    explicit CheckpointError(const std::string& message)
        : AudiobookResumeError("Checkpoint error: " + message) {}
};

class CommandError : public AudiobookResumeError {
public:
    CommandError(const std::string& command, int exit_code, const std::string& output_tail)
        : AudiobookResumeError("Command failed (exit " + std::to_string(exit_code) + "): " +
                               command + (output_tail.empty() ? "" : "\n" + output_tail)),
          exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

class PipelineError : public AudiobookResumeError {
public:
    explicit PipelineError(const std::string& message)
        : AudiobookResumeError("Pipeline error: " + message) {}
};

class MediaOperationError : public AudiobookResumeError {
public:
    MediaOperationError(const std::string& phase_name, const std::string& group_id,
                        const std::string& cause)
        : AudiobookResumeError("Media operation failed in " + phase_name +
                               (group_id.empty() ? "" : " for '" + group_id + "'") +
                               ": " + cause),
          phase_name_(phase_name), group_id_(group_id), cause_(cause) {}

    const std::string& phase_name() const { return phase_name_; }
    const std::string& group_id() const { return group_id_; }
    const std::string& cause() const { return cause_; }

private:
    std::string phase_name_;
    std::string group_id_;
    std::string cause_;
};

} // namespace audiobook_resume
