#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace gridradar {
namespace strategy {

// Read-only indicator snapshot for one analysis pass
struct IndicatorSet {
    double rsi = 50.0;
    std::optional<double> bollinger_lower;
    std::optional<double> bollinger_upper;
    std::optional<double> macd_line;
    std::optional<double> macd_signal;
    double std_dev = 0.0;          // of close-to-close returns
    double volatility_pct = 0.0;   // range / price * 100
};

// Recommended grid bot parameters.
// Invariants: low < high, grid_count within [min,max] grid count,
// spacing within [spacing_min, spacing_max], 0 < cycle_days <= cycle_max.
struct GridPlan {
    double low = 0.0;
    double high = 0.0;
    double spacing_pct = 0.0;
    int grid_count = 0;
    double cycle_days = 0.0;
};

enum class Resolution { COARSE, FINE };

inline const char* resolutionToString(Resolution r) {
    return r == Resolution::COARSE ? "coarse" : "fine";
}

// One instrument's accepted opportunity for the current scan
struct GridSignal {
    std::string market;
    Zone zone = Zone::LONG;
    double price = 0.0;
    IndicatorSet indicators;
    GridPlan plan;
    double score = 0.0;
    Resolution resolution = Resolution::COARSE;
    bool cooldown_held = false;    // still qualifies, but its cooldown has not elapsed
};

} // namespace strategy
} // namespace gridradar
