#pragma once

#include <cstddef>

namespace gridradar {
namespace engine {

// Scan-level behavior
struct EngineConfig {
    bool dry_run = false;                // log alerts, keep state files untouched
    bool force_summary = false;          // send a summary even without alerts
    bool alert_continuing = false;       // continuing instruments are only logged by default
    std::size_t max_message_length = 4000;
    int request_delay_ms = 0;            // pause between analyzed instruments
};

} // namespace engine
} // namespace gridradar
