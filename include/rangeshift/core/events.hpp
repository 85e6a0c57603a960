#pragma once

#include "types.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace rangeshift::core {

using json = nlohmann::json;

// Writes one JSON event per line to `out`. Every event carries type, run_id
// and a UTC timestamp. Not thread-safe; callers on worker threads serialize
// access.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, std::ostream& out);
    // `current` of `total` work units of the phase are finished.
    void phase_progress(const std::string& run_id, Phase phase, size_t current, size_t total,
                        const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void tile_failed(const std::string& run_id, int tile_index, int attempt,
                     bool will_retry, const std::string& message, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    // `fields` must be an object; its keys are written after the common ones.
    void emit(const std::string& type, const std::string& run_id, const json& fields, std::ostream& out);
    static json phase_fields(Phase phase);
};

} // namespace rangeshift::core
