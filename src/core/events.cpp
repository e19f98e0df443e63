#include "audiobook_resume/core/events.hpp"
#include "audiobook_resume/core/utils.hpp"

namespace audiobook_resume::core {

json EventEmitter::make_event(const std::string& type, const std::string& run_id,
                              const json& extra) const {
    json event = {{"type", type}, {"run_id", run_id}, {"ts", get_iso_timestamp()}};
    if (extra.is_object()) {
        event.update(extra);
    }
    return event;
}

void EventEmitter::write(const json& event, std::ostream& out) const {
    out << event.dump() << "\n";
    out.flush();
}

static json phase_fields(Phase phase) {
    return {{"phase", phase_to_int(phase)}, {"phase_name", phase_to_string(phase)}};
}

void EventEmitter::emit(const std::string& type, const std::string& run_id,
                        const json& data, std::ostream& out) {
    write(make_event(type, run_id, data), out);
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    emit("run_start", run_id, extra, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra, std::ostream& out) {
    json event = make_event("run_end", run_id, extra);
    event["success"] = success;
    event["status"] = status;
    write(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, int total,
                               std::ostream& out) {
    json event = make_event("phase_start", run_id, phase_fields(phase));
    event["total"] = total;
    write(event, out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, int current,
                                  int total, const std::string& item,
                                  const std::string& message, std::ostream& out) {
    json event = make_event("phase_progress", run_id, phase_fields(phase));
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 1.0f;
    event["item"] = item;
    event["substep"] = message;
    write(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = make_event("phase_end", run_id, extra);
    event.update(phase_fields(phase));
    event["status"] = status;
    write(event, out);
}

void EventEmitter::progress(const std::string& run_id, const ProgressEvent& ev,
                            std::ostream& out) {
    switch (ev.kind) {
        case ProgressKind::PHASE_START:
            phase_start(run_id, ev.phase, ev.total, out);
            break;
        case ProgressKind::STEP_DONE:
            phase_progress(run_id, ev.phase, ev.current, ev.total, ev.item, ev.message, out);
            break;
        case ProgressKind::PHASE_END:
            phase_end(run_id, ev.phase, "ok", {{"total", ev.total}}, out);
            break;
        case ProgressKind::PIPELINE_DONE:
            emit("pipeline_done", run_id, {{"message", ev.message}}, out);
            break;
    }
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    emit("warning", run_id, {{"message", message}}, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    emit("error", run_id, {{"message", message}}, out);
}

} // namespace audiobook_resume::core
