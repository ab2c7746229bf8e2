#pragma once

#include "strategy/GridPlanner.h"
#include "strategy/GridSignal.h"
#include "strategy/StrategyConfig.h"
#include <cstddef>
#include <optional>

namespace gridradar {
namespace strategy {

struct ZoneVotes {
    int long_votes = 0;
    int short_votes = 0;
};

// Acceptance gate: price must sit in an outer tail of its range and the
// RSI / Bollinger / MACD votes must agree on a direction.
class ZoneClassifier {
public:
    explicit ZoneClassifier(const ZoneClassifierConfig& config = ZoneClassifierConfig());

    // Long is evaluated first, so it wins when both directions qualify
    std::optional<Zone> classify(std::size_t sample_count,
                                 double price,
                                 const PriceRange& range,
                                 const IndicatorSet& indicators) const;

    ZoneVotes countVotes(double price, const IndicatorSet& indicators) const;

    // (price - low) / range, nullopt for an empty range
    static std::optional<double> rangePosition(double price, const PriceRange& range);

    bool isCentered(double position) const;

    const ZoneClassifierConfig& config() const { return config_; }

private:
    ZoneClassifierConfig config_;
};

} // namespace strategy
} // namespace gridradar
