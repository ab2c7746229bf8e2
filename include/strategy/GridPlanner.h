#pragma once

#include "strategy/GridSignal.h"
#include "strategy/StrategyConfig.h"
#include <optional>

namespace gridradar {
namespace strategy {

struct PriceRange {
    double low = 0.0;
    double high = 0.0;

    double width() const { return high - low; }
};

// Derives grid spacing, grid count and cycle estimate from a price range
class GridPlanner {
public:
    explicit GridPlanner(const GridPlannerConfig& config = GridPlannerConfig());

    // std::nullopt when the range is empty, the price is not positive,
    // or the cycle estimate falls outside (0, cycle_max_days]
    std::optional<GridPlan> createPlan(const PriceRange& range, double price, double std_dev) const;

    // Moves the breached side of the range out when price left it by more than the stop buffer
    PriceRange widenRange(const PriceRange& range, double price) const;

    // True when price sits beyond [low*(1-buffer), high*(1+buffer)]
    bool isOutsideRange(const PriceRange& range, double price) const;

    // Higher is better: rewards volatility, fewer grids, tighter spacing, shorter cycles
    double calculateScore(double volatility_pct, const GridPlan& plan) const;

    static double calculateVolatilityPct(const PriceRange& range, double price);

    double calculateVolFactor(double volatility_pct, double std_dev) const;
    double calculateSpacing(double vol_factor) const;
    int calculateGridCount(const PriceRange& range, double price,
                           double spacing_pct, double volatility_pct) const;
    double estimateCycleDays(int grid_count, double spacing_pct, double vol_factor) const;

    const GridPlannerConfig& config() const { return config_; }

private:
    GridPlannerConfig config_;
};

// Rounds half away from zero to `digits` decimals
double roundTo(double value, int digits);

} // namespace strategy
} // namespace gridradar
