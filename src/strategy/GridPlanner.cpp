#include "strategy/GridPlanner.h"
#include <algorithm>
#include <cmath>

namespace gridradar {
namespace strategy {

namespace {
constexpr double kCycleEpsilon = 1e-9;
}

double roundTo(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

GridPlanner::GridPlanner(const GridPlannerConfig& config)
    : config_(config) {}

std::optional<GridPlan> GridPlanner::createPlan(
    const PriceRange& range,
    double price,
    double std_dev) const
{
    if (range.width() <= 0.0 || price <= 0.0) {
        return std::nullopt;
    }

    const double volatility_pct = calculateVolatilityPct(range, price);
    const double vol_factor = calculateVolFactor(volatility_pct, std_dev);

    GridPlan plan;
    plan.low = range.low;
    plan.high = range.high;
    plan.spacing_pct = calculateSpacing(vol_factor);
    plan.grid_count = calculateGridCount(range, price, plan.spacing_pct, volatility_pct);
    plan.cycle_days = estimateCycleDays(plan.grid_count, plan.spacing_pct, vol_factor);

    if (plan.cycle_days <= 0.0 || plan.cycle_days > config_.cycle_max_days) {
        return std::nullopt;
    }
    return plan;
}

PriceRange GridPlanner::widenRange(const PriceRange& range, double price) const {
    PriceRange widened = range;
    if (price < range.low * (1.0 - config_.stop_buffer)) {
        widened.low = std::min(price, range.low * (1.0 - config_.widen_factor));
    }
    if (price > range.high * (1.0 + config_.stop_buffer)) {
        widened.high = std::max(price, range.high * (1.0 + config_.widen_factor));
    }
    return widened;
}

bool GridPlanner::isOutsideRange(const PriceRange& range, double price) const {
    return price < range.low * (1.0 - config_.stop_buffer) ||
           price > range.high * (1.0 + config_.stop_buffer);
}

double GridPlanner::calculateScore(double volatility_pct, const GridPlan& plan) const {
    const double grid_term = (200.0 - plan.grid_count) / 200.0 * 10.0;
    const double spacing_term = (1.5 - std::min(plan.spacing_pct, 1.5)) * 15.0;
    const double cycle_term = (1.5 / std::max(plan.cycle_days, 0.1)) * 10.0;
    return roundTo(volatility_pct * 2.0 + grid_term + spacing_term + cycle_term, 1);
}

double GridPlanner::calculateVolatilityPct(const PriceRange& range, double price) {
    if (price <= 0.0) return 0.0;
    return range.width() / price * 100.0;
}

double GridPlanner::calculateVolFactor(double volatility_pct, double std_dev) const {
    return std::max(0.1, volatility_pct + std_dev * 100.0);
}

double GridPlanner::calculateSpacing(double vol_factor) const {
    const double spacing = config_.spacing_target_pct * (30.0 / std::max(vol_factor, 1.0));
    return std::clamp(spacing, config_.spacing_min_pct, config_.spacing_max_pct);
}

int GridPlanner::calculateGridCount(
    const PriceRange& range,
    double price,
    double spacing_pct,
    double volatility_pct) const
{
    const double grid_base = range.width() / (price * spacing_pct / 100.0);

    // Quiet markets get half as many levels
    if (volatility_pct < config_.low_vol_threshold_pct) {
        const double count = std::floor(grid_base / 2.0);
        return static_cast<int>(std::clamp(count,
            static_cast<double>(config_.min_grid_count),
            static_cast<double>(config_.max_grid_count)));
    }

    const double count = std::floor(grid_base);
    return static_cast<int>(std::clamp(count,
        static_cast<double>(config_.high_vol_min_grid_count),
        static_cast<double>(config_.max_grid_count)));
}

double GridPlanner::estimateCycleDays(int grid_count, double spacing_pct, double vol_factor) const {
    return roundTo(grid_count * spacing_pct / (vol_factor + kCycleEpsilon) * 2.0, 1);
}

} // namespace strategy
} // namespace gridradar
