#include "rangeshift/core/events.hpp"
#include "rangeshift/core/utils.hpp"

namespace rangeshift::core {

void EventEmitter::emit(const std::string& type, const std::string& run_id, const json& fields,
                        std::ostream& out) {
    json event = {{"type", type}, {"run_id", run_id}, {"ts", get_iso_timestamp()}};
    if (fields.is_object()) {
        event.update(fields);
    }
    out << event.dump() << "\n";
    out.flush();
}

json EventEmitter::phase_fields(Phase phase) {
    return {{"phase", phase_to_int(phase)}, {"phase_name", phase_to_string(phase)}};
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    emit("run_start", run_id, extra, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success, const std::string& status,
                           std::ostream& out) {
    emit("run_end", run_id, {{"success", success}, {"status", status}}, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    emit("phase_start", run_id, phase_fields(phase), out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, size_t current, size_t total,
                                  const std::string& message, std::ostream& out) {
    json fields = phase_fields(phase);
    fields["current"] = current;
    fields["total"] = total;
    fields["progress"] = total == 0 ? 1.0 : static_cast<double>(current) / static_cast<double>(total);
    fields["substep"] = message;
    emit("phase_progress", run_id, fields, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase, const std::string& status,
                             const json& extra, std::ostream& out) {
    json fields = phase_fields(phase);
    fields["status"] = status;
    if (extra.is_object()) {
        fields.update(extra);
    }
    emit("phase_end", run_id, fields, out);
}

void EventEmitter::tile_failed(const std::string& run_id, int tile_index, int attempt, bool will_retry,
                               const std::string& message, std::ostream& out) {
    emit("tile_failed", run_id,
         {{"tile_index", tile_index}, {"attempt", attempt}, {"will_retry", will_retry}, {"message", message}},
         out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message, std::ostream& out) {
    emit("warning", run_id, {{"message", message}}, out);
}

} // namespace rangeshift::core
