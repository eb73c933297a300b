#include "tile_segment/core/events.hpp"
#include "tile_segment/core/utils.hpp"

namespace tile_segment::core {

namespace {

json make_event(const std::string& type, const std::string& run_id, const json& extra) {
    json event = {{"type", type}, {"run_id", run_id}, {"ts", get_iso_timestamp()}};
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    return event;
}

void write_line(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

json phase_fields(Phase phase) {
    return {{"phase", phase_to_int(phase)}, {"phase_name", phase_to_string(phase)}};
}

} // namespace

void EventEmitter::emit(const json& event, std::ostream& out) {
    write_line(event, out);
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    emit(make_event("run_start", run_id, extra), out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    emit(make_event("run_end", run_id, {{"success", success}, {"status", status}}), out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase,
                               const std::string& name, std::ostream& out) {
    json event = make_event("phase_start", run_id, phase_fields(phase));
    event["phase_name"] = name;
    emit(event, out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, int current,
                                  int total, const std::string& message, std::ostream& out) {
    json event = make_event("phase_progress", run_id, phase_fields(phase));
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 1.0f;
    event["substep"] = message;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = make_event("phase_end", run_id, phase_fields(phase));
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::tile_shortcut(const std::string& run_id, const Window& window,
                                 int default_class, std::ostream& out) {
    emit(make_event("tile_shortcut", run_id,
                    {{"window", window_to_json(window)}, {"default_class", default_class}}),
         out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    emit(make_event("warning", run_id, {{"message", message}}), out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    emit(make_event("error", run_id, {{"message", message}}), out);
}

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out) {
    write_line(make_event(type, run_id, data), out);
}

json window_to_json(const Window& window) {
    return {
        {"row_off", window.row_off},
        {"col_off", window.col_off},
        {"height", window.height},
        {"width", window.width}
    };
}

} // namespace tile_segment::core
