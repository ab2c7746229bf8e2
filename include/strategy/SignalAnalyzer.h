#pragma once

#include "network/IMarketDataProvider.h"
#include "strategy/CooldownTracker.h"
#include "strategy/GridPlanner.h"
#include "strategy/GridSignal.h"
#include "strategy/StrategyConfig.h"
#include "strategy/ZoneClassifier.h"
#include <memory>
#include <optional>
#include <string>

namespace gridradar {
namespace strategy {

// Outcome of one single-resolution pass. `indicators` and `range` are filled
// whenever the series had a usable price and range, even without a signal.
struct SeriesAnalysis {
    std::optional<GridSignal> signal;
    IndicatorSet indicators;
    PriceRange range;
    double price = 0.0;
    std::size_t samples = 0;
};

class SignalAnalyzer {
public:
    SignalAnalyzer(std::shared_ptr<network::IMarketDataProvider> provider,
                   std::shared_ptr<CooldownTracker> cooldown,
                   const SignalAnalyzerConfig& config = SignalAnalyzerConfig());

    // Pure analysis of one close series; no fetching, no cooldown
    SeriesAnalysis analyzeSeries(const std::string& market,
                                 const PriceSeries& closes,
                                 Resolution resolution) const;

    IndicatorSet computeIndicators(const PriceSeries& closes,
                                   const PriceRange& range,
                                   double price) const;

    // Coarse pass first; volatile instruments are re-checked on fine bars.
    // A qualifying signal refused by the cooldown tracker comes back with
    // cooldown_held set, so an instrument already being tracked is not lost.
    std::optional<GridSignal> analyzeMarket(const std::string& market, Timestamp now);

    const SignalAnalyzerConfig& config() const { return config_; }

private:
    // Empty series when the provider fails
    PriceSeries fetchCloses(const std::string& market, const std::string& interval, int limit);

    std::optional<GridSignal> gate(SeriesAnalysis analysis, Timestamp now);

    std::shared_ptr<network::IMarketDataProvider> provider_;
    std::shared_ptr<CooldownTracker> cooldown_;
    SignalAnalyzerConfig config_;
    GridPlanner planner_;
    ZoneClassifier classifier_;
};

} // namespace strategy
} // namespace gridradar
