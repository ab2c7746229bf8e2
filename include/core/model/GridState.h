#pragma once

#include "common/Types.h"
#include <map>
#include <string>

namespace gridradar {
namespace core {

// Persisted per-instrument record of an open grid recommendation
struct GridStateEntry {
    Zone zone = Zone::LONG;
    double low = 0.0;
    double high = 0.0;
    Timestamp start_time{};
    bool warned = false;        // cycle-completion alert already sent
    double cycle_days = 0.0;    // cycle estimate when the entry started
};

using GridStateMap = std::map<std::string, GridStateEntry>;

} // namespace core
} // namespace gridradar
