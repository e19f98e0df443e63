#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace audiobook_resume::core {

using json = nlohmann::json;

class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, int total, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& item, const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    // Renders a pipeline ProgressEvent as the matching JSON event
    void progress(const std::string& run_id, const ProgressEvent& ev, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

    // Free-form event: type, run_id and ts followed by the fields of data
    void emit(const std::string& type, const std::string& run_id, const json& data,
              std::ostream& out);

private:
    void write(const json& event, std::ostream& out) const;
    json make_event(const std::string& type, const std::string& run_id,
                    const json& extra) const;
};

} // namespace audiobook_resume::core
