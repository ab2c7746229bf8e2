#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace gridradar {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using PriceSeries = std::vector<double>;

// Directional bias of a grid bot: Long near the range bottom, Short near the top
enum class Zone { LONG, SHORT };

inline const char* zoneToString(Zone zone) {
    return zone == Zone::LONG ? "Long" : "Short";
}

inline std::optional<Zone> zoneFromString(const std::string& value) {
    if (value == "Long") return Zone::LONG;
    if (value == "Short") return Zone::SHORT;
    return std::nullopt;
}

inline long long toEpochSeconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline Timestamp fromEpochSeconds(long long seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;
    
    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}
    
    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// 24h ticker row used for universe discovery
struct Ticker {
    std::string symbol;
    double close = 0.0;
    double notional = 0.0;   // 24h traded value
};

} // namespace gridradar
