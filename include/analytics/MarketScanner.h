#pragma once

#include "common/Types.h"
#include "network/IMarketDataProvider.h"
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace gridradar {
namespace analytics {

struct UniverseConfig {
    double price_min = 0.005;           // skip sub-penny tokens
    double volume_min = 100000.0;       // 24h notional
    std::string quick_interval = "60M";
    int quick_limit = 50;               // cheap kline fetch for ranking
    int top_candidates = 30;
    int request_delay_ms = 0;           // spacing between kline calls

    std::set<std::string> wrapped{"WBTC", "WETH", "WSOL", "WBNB"};
    std::set<std::string> stable{"USDT", "USDC", "BUSD", "DAI"};
    std::set<std::string> excluded{"LUNA", "LUNC", "USTC"};
    std::vector<std::string> leveraged_suffixes{"UP", "DOWN", "3L", "3S", "5L", "5S"};
};

struct CandidateScore {
    std::string symbol;
    double score = 0.0;
    double width_pct = 0.0;
    double notional = 0.0;
};

// Instrument universe: liquid, non-excluded symbols ranked by how wide they
// have been trading relative to their volume
class MarketScanner {
public:
    MarketScanner(std::shared_ptr<network::IMarketDataProvider> provider,
                  const UniverseConfig& config = UniverseConfig());
    
    // Throws when the ticker list itself is unavailable; a failing quick
    // kline fetch only drops that symbol
    std::vector<CandidateScore> rankCandidates();

    std::vector<std::string> discoverCandidates();
    
    // Base asset (text before the first '_') must not be wrapped, stable,
    // excluded, or a leveraged token
    bool isEligibleSymbol(const std::string& symbol) const;
    
    // width_pct / max(1, log10(notional))
    static double quickScore(double width_pct, double notional);
    
private:
    void throttleKlineCall();

    std::shared_ptr<network::IMarketDataProvider> provider_;
    UniverseConfig config_;
    std::chrono::steady_clock::time_point last_kline_call_time_{};
};

} // namespace analytics
} // namespace gridradar
