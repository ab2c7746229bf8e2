#pragma once

#include <string>

namespace gridradar {
namespace strategy {

// How many of the three indicator votes a direction needs
enum class VotingPolicy {
    STRICT,     // 3 of 3
    RELAXED     // 2 of 3
};

inline int requiredVotes(VotingPolicy policy) {
    switch (policy) {
        case VotingPolicy::STRICT: return 3;
        case VotingPolicy::RELAXED: return 2;
    }
    return 2;
}

inline VotingPolicy votingPolicyFromString(const std::string& value) {
    return value == "strict" ? VotingPolicy::STRICT : VotingPolicy::RELAXED;
}

inline const char* votingPolicyToString(VotingPolicy policy) {
    return policy == VotingPolicy::STRICT ? "strict" : "relaxed";
}

struct IndicatorConfig {
    int rsi_period = 14;
    int bollinger_period = 20;
    double bollinger_k = 2.0;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;
    int std_dev_period = 30;
};

struct ZoneClassifierConfig {
    int min_samples = 60;
    double position_threshold = 0.4;   // accept only pos < 0.4 or pos > 0.6
    double rsi_oversold = 35.0;
    double rsi_overbought = 65.0;
    VotingPolicy voting_policy = VotingPolicy::RELAXED;
};

struct GridPlannerConfig {
    double spacing_target_pct = 0.75;
    double spacing_min_pct = 0.35;
    double spacing_max_pct = 1.5;
    double cycle_max_days = 2.0;
    double stop_buffer = 0.01;          // 1% beyond the range counts as a breach
    double widen_factor = 0.05;         // breached side moves out by 5%
    int min_grid_count = 4;
    int max_grid_count = 200;
    int high_vol_min_grid_count = 10;
    double low_vol_threshold_pct = 1.5;
};

struct CooldownConfig {
    int base_seconds = 300;
    int seconds_per_excess_unit = 60;
    double volatility_floor_pct = 1.0;
    double std_dev_floor = 0.01;
};

struct SignalAnalyzerConfig {
    std::string coarse_interval = "60M";
    int coarse_limit = 200;
    std::string fine_interval = "5M";
    int fine_limit = 400;
    double vol_threshold_pct = 3.0;     // coarse volatility that triggers a fine pass

    IndicatorConfig indicators;
    ZoneClassifierConfig zone;
    GridPlannerConfig grid;
    CooldownConfig cooldown;
};

} // namespace strategy
} // namespace gridradar
